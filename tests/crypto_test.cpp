#include <gtest/gtest.h>

#include "crypto/hash.h"
#include "crypto/keypair.h"
#include "crypto/token.h"

#include <bitset>
#include <set>

using namespace crypto;

// ============================================================================
// Hash Tests
// ============================================================================

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
    }
};

TEST_F(HashTest, Sha256MatchesKnownVector) {
    EXPECT_EQ(to_hex(sha256(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, Sha256OfEmptyInput) {
    EXPECT_EQ(to_hex(sha256(std::string())),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, Blake2bDiffersFromSha256) {
    std::vector<uint8_t> data = {1, 2, 3};
    EXPECT_NE(blake2b(data), sha256(data));
    EXPECT_EQ(blake2b(data), blake2b(data));
}

TEST_F(HashTest, HexConversion) {
    std::vector<uint8_t> data = {0x00, 0xab, 0xff};
    EXPECT_EQ(to_hex(std::span<const uint8_t>(data)), "00abff");
    EXPECT_EQ(from_hex("00abff"), data);
}

TEST_F(HashTest, FromHexRejectsInvalidInput) {
    EXPECT_TRUE(from_hex("abc").empty());
    EXPECT_TRUE(from_hex("zz").empty());
}

TEST_F(HashTest, ConstantTimeEqual) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    std::vector<uint8_t> shorter = {1, 2, 3};

    EXPECT_TRUE(constant_time_equal(a, b));
    EXPECT_FALSE(constant_time_equal(a, c));
    EXPECT_FALSE(constant_time_equal(a, shorter));
}

TEST_F(HashTest, ToHashChecksSize) {
    Hash out{};
    std::vector<uint8_t> short_data(HASH_SIZE - 1, 0x11);
    EXPECT_FALSE(to_hash(short_data, out));
    EXPECT_EQ(out, ZERO_HASH);

    std::vector<uint8_t> data(HASH_SIZE, 0x22);
    EXPECT_TRUE(to_hash(data, out));
    EXPECT_EQ(out[0], 0x22);
}

// ============================================================================
// Token Tests
// ============================================================================

class TokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
    }
};

TEST_F(TokenTest, TokenCarries256Bits) {
    auto token = random_token();
    // 32 bytes in unpadded base64
    EXPECT_EQ(token.size(), 43u);
    EXPECT_EQ(from_base64(token).size(), TOKEN_ENTROPY_SIZE);
}

TEST_F(TokenTest, TokensAreUrlSafe) {
    for (int i = 0; i < 100; ++i) {
        auto token = random_token();
        EXPECT_EQ(token.find_first_of("+/="), std::string::npos) << token;
    }
}

TEST_F(TokenTest, TokensAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(random_token()).second);
    }
}

TEST_F(TokenTest, TokenBitsAreBalanced) {
    constexpr int samples = 500;
    uint64_t ones = 0;

    for (int i = 0; i < samples; ++i) {
        for (auto byte : from_base64(random_token())) {
            ones += std::bitset<8>(byte).count();
        }
    }

    double ratio = static_cast<double>(ones) / (samples * TOKEN_ENTROPY_SIZE * 8);
    EXPECT_GT(ratio, 0.45);
    EXPECT_LT(ratio, 0.55);
}

TEST_F(TokenTest, TokenHashIsSha256OfToken) {
    auto token = random_token();
    EXPECT_EQ(token_hash(token), sha256(token));
}

TEST_F(TokenTest, FromBase64RejectsGarbage) {
    EXPECT_TRUE(from_base64("not base64!").empty());
}

// ============================================================================
// Election Keypair Tests
// ============================================================================

class ElectionKeypairTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
    }
};

TEST_F(ElectionKeypairTest, GenerateCreatesValidKeypair) {
    auto keypair = ElectionKeypair::generate();

    bool all_zero = true;
    for (auto byte : keypair.public_key()) {
        if (byte != 0) {
            all_zero = false;
            break;
        }
    }
    EXPECT_FALSE(all_zero);
}

TEST_F(ElectionKeypairTest, FromBytesRestoresPublicKey) {
    auto keypair = ElectionKeypair::generate();
    auto restored = ElectionKeypair::from_bytes(keypair.secret_key());

    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->public_key(), keypair.public_key());
}

TEST_F(ElectionKeypairTest, FromBytesRejectsWrongSize) {
    std::vector<uint8_t> too_short(SECRET_KEY_SIZE - 1, 7);
    EXPECT_FALSE(ElectionKeypair::from_bytes(too_short).has_value());
}

TEST_F(ElectionKeypairTest, SealedChoiceOpensWithSecretKey) {
    auto keypair = ElectionKeypair::generate();
    std::vector<uint8_t> choice = {'A'};

    auto ciphertext = seal(choice, keypair.public_key());
    EXPECT_EQ(ciphertext.size(), choice.size() + SEAL_OVERHEAD);

    auto opened = keypair.open(ciphertext);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, choice);
}

TEST_F(ElectionKeypairTest, SealingIsRandomized) {
    auto keypair = ElectionKeypair::generate();
    std::vector<uint8_t> choice = {'A'};
    EXPECT_NE(seal(choice, keypair.public_key()), seal(choice, keypair.public_key()));
}

TEST_F(ElectionKeypairTest, OpenFailsWithOtherKey) {
    auto keypair = ElectionKeypair::generate();
    auto other = ElectionKeypair::generate();
    std::vector<uint8_t> choice = {'B'};

    auto ciphertext = seal(choice, keypair.public_key());
    EXPECT_FALSE(other.open(ciphertext).has_value());
}

TEST_F(ElectionKeypairTest, OpenFailsOnTamperedCiphertext) {
    auto keypair = ElectionKeypair::generate();
    std::vector<uint8_t> choice = {'C'};

    auto ciphertext = seal(choice, keypair.public_key());
    ciphertext.back() ^= 0x01;
    EXPECT_FALSE(keypair.open(ciphertext).has_value());

    std::vector<uint8_t> truncated(SEAL_OVERHEAD - 1, 0);
    EXPECT_FALSE(keypair.open(truncated).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
