#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace crypto {

// X25519 key sizes (libsodium crypto_box)
constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SECRET_KEY_SIZE = 32;

// Overhead added by a sealed box (ephemeral key + MAC)
constexpr size_t SEAL_OVERHEAD = 48;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;

/**
 * Election encryption key pair.
 *
 * The public half is stored with the election and used by voters to seal
 * their choice. The secret half is handed to the trustee once at election
 * creation and never stored by the core.
 */
class ElectionKeypair {
public:
    /**
     * Generate a new random key pair
     */
    static ElectionKeypair generate();

    /**
     * Load key pair from the trustee's secret key
     */
    static std::optional<ElectionKeypair> from_bytes(std::span<const uint8_t> secret_key);

    /**
     * Get public key
     */
    [[nodiscard]] const PublicKey& public_key() const { return public_key_; }

    /**
     * Get secret key
     */
    [[nodiscard]] const SecretKey& secret_key() const { return secret_key_; }

    /**
     * Open a sealed box addressed to this key pair.
     * Returns nullopt if the ciphertext was not sealed to us or was altered.
     */
    [[nodiscard]] std::optional<std::vector<uint8_t>> open(std::span<const uint8_t> ciphertext) const;

private:
    ElectionKeypair(PublicKey public_key, SecretKey secret_key);

    PublicKey public_key_;
    SecretKey secret_key_;
};

/**
 * Seal a plaintext to an election public key (anonymous sender)
 */
std::vector<uint8_t> seal(std::span<const uint8_t> plaintext, const PublicKey& public_key);

/**
 * Initialize libsodium (must be called once at program start)
 * Returns true on success
 */
bool init();

} // namespace crypto
