#pragma once

#include "core/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace manuscripts::crypto {

constexpr size_t PASSPHRASE_KEY_SIZE = 32;
constexpr size_t SALT_SIZE = 16;   // crypto_pwhash_SALTBYTES
constexpr size_t NONCE_SIZE = 32;
constexpr size_t PROOF_SIZE = 32;  // crypto_auth_hmacsha256_BYTES

using PassphraseKey = std::array<uint8_t, PASSPHRASE_KEY_SIZE>;
using Salt = std::array<uint8_t, SALT_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;

/**
 * KdfParams - Argon2id cost parameters.
 *
 * The receiver picks them when the passphrase is configured and sends them
 * with each challenge so the sender derives the same key.
 */
struct KdfParams {
    uint64_t ops_limit = 0;
    uint64_t mem_limit = 0;

    [[nodiscard]] static KdfParams interactive();

    /**
     * Cheapest parameters libsodium accepts (tests only).
     */
    [[nodiscard]] static KdfParams minimum();

    /**
     * Whether a peer-supplied parameter set is within the bounds a sender is
     * willing to spend (MIN .. MODERATE).
     */
    [[nodiscard]] bool acceptable() const;

    bool operator==(const KdfParams&) const = default;
};

/**
 * Initialize libsodium. Safe to call repeatedly.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Argon2id(passphrase, salt). The result is what the receiver stores in
 * place of the passphrase.
 */
[[nodiscard]] Result<PassphraseKey, Error> derive_passphrase_key(
    std::string_view passphrase,
    const Salt& salt,
    const KdfParams& params);

/**
 * HMAC-SHA-256(key, nonce).
 */
[[nodiscard]] std::vector<uint8_t> make_proof(const PassphraseKey& key,
                                              std::span<const uint8_t> nonce);

/**
 * Constant-time check of a proof produced by make_proof().
 */
[[nodiscard]] bool check_proof(const PassphraseKey& key,
                               std::span<const uint8_t> nonce,
                               std::span<const uint8_t> proof);

[[nodiscard]] Salt generate_salt();
[[nodiscard]] Nonce generate_nonce();

[[nodiscard]] std::string to_base64(std::span<const uint8_t> data);
[[nodiscard]] Result<std::vector<uint8_t>, Error> from_base64(std::string_view text);

/**
 * Wipe secrets (passphrase buffers, derived keys) before release.
 */
void secure_zero(void* ptr, size_t len);

} // namespace manuscripts::crypto
