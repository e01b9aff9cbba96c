#pragma once

#include "hash.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace crypto {

// Raw entropy of every identity and ballot token (256 bits)
constexpr size_t TOKEN_ENTROPY_SIZE = 32;

/**
 * Fill a buffer from the libsodium CSPRNG
 */
std::vector<uint8_t> random_bytes(size_t size);

/**
 * Draw a fresh token: TOKEN_ENTROPY_SIZE random bytes rendered as
 * URL-safe base64 without padding. Nothing but the CSPRNG goes in.
 */
std::string random_token();

/**
 * The only form in which a token is ever persisted
 */
Hash token_hash(const std::string& token);

/**
 * URL-safe base64 (no padding) encode
 */
std::string to_base64(std::span<const uint8_t> data);

/**
 * URL-safe base64 (no padding) decode
 * Returns empty vector on invalid input
 */
std::vector<uint8_t> from_base64(const std::string& text);

} // namespace crypto
