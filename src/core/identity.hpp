#pragma once

#include "core/result.hpp"
#include "core/submission.hpp"
#include "crypto/passphrase.hpp"

#include <QMutex>
#include <QString>
#include <atomic>
#include <optional>
#include <span>
#include <string>

namespace manuscripts {

/**
 * ReceiverIdentity - Who this receiver is, for the lifetime of the process.
 */
struct ReceiverIdentity {
    QString display_name;
    std::optional<crypto::PassphraseKey> passphrase_hash;
    crypto::Salt salt{};
    crypto::KdfParams kdf{};
    int protocol_version = PROTOCOL_VERSION;

    [[nodiscard]] bool requires_passphrase() const { return passphrase_hash.has_value(); }
};

/**
 * PassphraseProof - A sender's answer to one challenge.
 */
struct PassphraseProof {
    std::span<const uint8_t> nonce;
    std::span<const uint8_t> mac;
};

/**
 * CredentialStore - Write-once holder of the receiver identity.
 *
 * configure() runs once at startup. Afterwards the identity is immutable and
 * verify()/snapshot() may be called from any thread without locking.
 */
class CredentialStore {
public:
    CredentialStore() = default;
    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    /**
     * Set the display name and optional passphrase. The passphrase is hashed
     * with Argon2id, then wiped in place and reset, so the caller's object
     * holds no cleartext afterwards whatever the outcome. A second call fails
     * with AlreadyConfigured.
     */
    Result<void, Error> configure(const QString& display_name,
                                  std::optional<std::string>&& passphrase,
                                  const crypto::KdfParams& params = crypto::KdfParams::interactive());

    /**
     * True when no passphrase is configured, or when proof.mac is the HMAC of
     * proof.nonce under the stored key.
     */
    [[nodiscard]] bool verify(const PassphraseProof& proof) const;

    [[nodiscard]] ReceiverIdentity snapshot() const;

    [[nodiscard]] bool isConfigured() const { return configured_.load(std::memory_order_acquire); }
    [[nodiscard]] bool requiresPassphrase() const;

private:
    QMutex configure_mutex_;
    std::atomic<bool> configured_{false};
    ReceiverIdentity identity_;
};

} // namespace manuscripts
