#include "core/identity.hpp"

#include <QMutexLocker>

namespace manuscripts {

namespace {

void wipe(std::optional<std::string>& passphrase) {
    if (passphrase) {
        crypto::secure_zero(passphrase->data(), passphrase->size());
        passphrase.reset();
    }
}

} // namespace

Result<void, Error> CredentialStore::configure(const QString& display_name,
                                               std::optional<std::string>&& passphrase,
                                               const crypto::KdfParams& params) {
    QMutexLocker lock(&configure_mutex_);
    if (configured_.load(std::memory_order_acquire)) {
        wipe(passphrase);
        return Result<void, Error>::fail(ErrorCode::AlreadyConfigured,
                                         "Receiver identity is already configured");
    }

    ReceiverIdentity identity;
    identity.display_name = display_name.trimmed();

    if (passphrase && !passphrase->empty()) {
        identity.salt = crypto::generate_salt();
        identity.kdf = params;
        auto key = crypto::derive_passphrase_key(*passphrase, identity.salt, params);
        wipe(passphrase);
        if (key.is_err()) {
            return Result<void, Error>::err(key.unwrap_err());
        }
        identity.passphrase_hash = key.unwrap();
    }
    wipe(passphrase);

    identity_ = std::move(identity);
    configured_.store(true, std::memory_order_release);
    return Result<void, Error>::ok();
}

bool CredentialStore::verify(const PassphraseProof& proof) const {
    if (!isConfigured() || !identity_.passphrase_hash) {
        return true;
    }
    return crypto::check_proof(*identity_.passphrase_hash, proof.nonce, proof.mac);
}

ReceiverIdentity CredentialStore::snapshot() const {
    if (!isConfigured()) {
        return ReceiverIdentity{};
    }
    return identity_;
}

bool CredentialStore::requiresPassphrase() const {
    return isConfigured() && identity_.passphrase_hash.has_value();
}

} // namespace manuscripts
