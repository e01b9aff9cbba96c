#include "keypair.h"

#include <sodium.h>

#include <algorithm>
#include <stdexcept>

namespace crypto {

bool init() {
    static const bool initialized = sodium_init() >= 0;
    return initialized;
}

ElectionKeypair::ElectionKeypair(PublicKey public_key, SecretKey secret_key)
    : public_key_(public_key), secret_key_(secret_key) {}

ElectionKeypair ElectionKeypair::generate() {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    PublicKey pk;
    SecretKey sk;

    crypto_box_keypair(pk.data(), sk.data());

    return ElectionKeypair(pk, sk);
}

std::optional<ElectionKeypair> ElectionKeypair::from_bytes(std::span<const uint8_t> secret_key) {
    if (!init() || secret_key.size() != SECRET_KEY_SIZE) {
        return std::nullopt;
    }

    SecretKey sk;
    std::copy(secret_key.begin(), secret_key.end(), sk.begin());

    // X25519 public key is the scalar multiple of the base point
    PublicKey pk;
    if (crypto_scalarmult_base(pk.data(), sk.data()) != 0) {
        return std::nullopt;
    }

    return ElectionKeypair(pk, sk);
}

std::optional<std::vector<uint8_t>> ElectionKeypair::open(std::span<const uint8_t> ciphertext) const {
    if (!init() || ciphertext.size() < SEAL_OVERHEAD) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - SEAL_OVERHEAD);
    if (crypto_box_seal_open(plaintext.data(), ciphertext.data(), ciphertext.size(),
                             public_key_.data(), secret_key_.data()) != 0) {
        return std::nullopt;
    }
    return plaintext;
}

std::vector<uint8_t> seal(std::span<const uint8_t> plaintext, const PublicKey& public_key) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + SEAL_OVERHEAD);
    crypto_box_seal(ciphertext.data(), plaintext.data(), plaintext.size(), public_key.data());
    return ciphertext;
}

} // namespace crypto
