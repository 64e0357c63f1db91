#include "crypto/passphrase.hpp"

#include <sodium.h>

namespace manuscripts::crypto {

static_assert(SALT_SIZE == crypto_pwhash_SALTBYTES);
static_assert(PROOF_SIZE == crypto_auth_hmacsha256_BYTES);

KdfParams KdfParams::interactive() {
    return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

KdfParams KdfParams::minimum() {
    return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

bool KdfParams::acceptable() const {
    return ops_limit >= crypto_pwhash_OPSLIMIT_MIN &&
           ops_limit <= crypto_pwhash_OPSLIMIT_MODERATE &&
           mem_limit >= crypto_pwhash_MEMLIMIT_MIN &&
           mem_limit <= crypto_pwhash_MEMLIMIT_MODERATE;
}

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::fail(ErrorCode::Internal, "Failed to initialize libsodium");
    }
    return Result<void, Error>::ok();
}

Result<PassphraseKey, Error> derive_passphrase_key(std::string_view passphrase,
                                                   const Salt& salt,
                                                   const KdfParams& params) {
    PassphraseKey key{};
    const int rc = crypto_pwhash(
        key.data(), key.size(),
        passphrase.data(), passphrase.size(),
        salt.data(),
        params.ops_limit,
        static_cast<size_t>(params.mem_limit),
        crypto_pwhash_ALG_ARGON2ID13);
    if (rc != 0) {
        // Only fails when the allocation for mem_limit does.
        return Result<PassphraseKey, Error>::fail(ErrorCode::Internal, "Passphrase hashing failed");
    }
    return Result<PassphraseKey, Error>::ok(key);
}

std::vector<uint8_t> make_proof(const PassphraseKey& key, std::span<const uint8_t> nonce) {
    std::vector<uint8_t> mac(PROOF_SIZE);
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, nonce.data(), nonce.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

bool check_proof(const PassphraseKey& key,
                 std::span<const uint8_t> nonce,
                 std::span<const uint8_t> proof) {
    if (proof.size() != PROOF_SIZE || nonce.empty()) {
        return false;
    }
    const auto expected = make_proof(key, nonce);
    return sodium_memcmp(expected.data(), proof.data(), PROOF_SIZE) == 0;
}

Salt generate_salt() {
    Salt salt;
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

Nonce generate_nonce() {
    Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::string to_base64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    out.resize(out.size() - 1);  // trailing NUL
    return out;
}

Result<std::vector<uint8_t>, Error> from_base64(std::string_view text) {
    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t len = 0;
    if (sodium_base642bin(out.data(), out.size(),
                          text.data(), text.size(),
                          nullptr, &len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, Error>::fail(ErrorCode::ProtocolMismatch, "Invalid Base64");
    }
    out.resize(len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

} // namespace manuscripts::crypto
