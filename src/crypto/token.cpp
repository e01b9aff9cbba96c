#include "token.h"
#include "keypair.h" // for init()

#include <sodium.h>

#include <stdexcept>

namespace crypto {

namespace {

constexpr int BASE64_VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

}

std::vector<uint8_t> random_bytes(size_t size) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::string random_token() {
    auto entropy = random_bytes(TOKEN_ENTROPY_SIZE);
    auto token = to_base64(entropy);
    sodium_memzero(entropy.data(), entropy.size());
    return token;
}

Hash token_hash(const std::string& token) {
    return sha256(token);
}

std::string to_base64(std::span<const uint8_t> data) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::string text(sodium_base64_ENCODED_LEN(data.size(), BASE64_VARIANT), '\0');
    sodium_bin2base64(text.data(), text.size(), data.data(), data.size(), BASE64_VARIANT);
    text.pop_back(); // remove null terminator
    return text;
}

std::vector<uint8_t> from_base64(const std::string& text) {
    if (!init()) {
        return {};
    }

    std::vector<uint8_t> bytes(text.size());
    size_t bin_len;

    if (sodium_base642bin(
            bytes.data(), bytes.size(),
            text.c_str(), text.size(),
            nullptr, &bin_len, nullptr, BASE64_VARIANT) != 0) {
        return {};
    }

    bytes.resize(bin_len);
    return bytes;
}

} // namespace crypto
