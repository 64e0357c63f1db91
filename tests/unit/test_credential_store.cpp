#include <catch2/catch_test_macros.hpp>

#include "core/identity.hpp"

using namespace manuscripts;

TEST_CASE("CredentialStore without passphrase", "[identity]") {
    CredentialStore store;
    REQUIRE_FALSE(store.isConfigured());

    REQUIRE(store.configure(QStringLiteral("  Ms. Okafor  "), std::nullopt).is_ok());
    REQUIRE(store.isConfigured());
    REQUIRE_FALSE(store.requiresPassphrase());

    const auto identity = store.snapshot();
    REQUIRE(identity.display_name == QStringLiteral("Ms. Okafor"));
    REQUIRE_FALSE(identity.requires_passphrase());
    REQUIRE(identity.protocol_version == PROTOCOL_VERSION);

    SECTION("any proof passes") {
        const auto nonce = crypto::generate_nonce();
        const std::vector<uint8_t> garbage(crypto::PROOF_SIZE, 0xAB);
        REQUIRE(store.verify(PassphraseProof{nonce, garbage}));
    }

    SECTION("an empty passphrase means no passphrase") {
        CredentialStore other;
        REQUIRE(other.configure(QStringLiteral("Room 12"), std::string()).is_ok());
        REQUIRE_FALSE(other.requiresPassphrase());
    }
}

TEST_CASE("CredentialStore with passphrase", "[identity]") {
    const auto params = crypto::KdfParams::minimum();
    CredentialStore store;
    REQUIRE(store.configure(QStringLiteral("Teacher"), std::string("correct horse"), params).is_ok());
    REQUIRE(store.requiresPassphrase());

    const auto identity = store.snapshot();
    REQUIRE(identity.passphrase_hash.has_value());
    REQUIRE(identity.kdf == params);

    const auto nonce = crypto::generate_nonce();

    SECTION("proof from the right passphrase verifies") {
        auto key = crypto::derive_passphrase_key("correct horse", identity.salt, identity.kdf);
        REQUIRE(key.is_ok());
        const auto mac = crypto::make_proof(key.unwrap(), nonce);
        REQUIRE(store.verify(PassphraseProof{nonce, mac}));
    }

    SECTION("proof from another passphrase fails") {
        auto key = crypto::derive_passphrase_key("battery staple", identity.salt, identity.kdf);
        REQUIRE(key.is_ok());
        const auto mac = crypto::make_proof(key.unwrap(), nonce);
        REQUIRE_FALSE(store.verify(PassphraseProof{nonce, mac}));
    }

    SECTION("proof bound to another nonce fails") {
        auto key = crypto::derive_passphrase_key("correct horse", identity.salt, identity.kdf);
        const auto other_nonce = crypto::generate_nonce();
        const auto mac = crypto::make_proof(key.unwrap(), other_nonce);
        REQUIRE_FALSE(store.verify(PassphraseProof{nonce, mac}));
    }

    SECTION("truncated proof fails") {
        auto key = crypto::derive_passphrase_key("correct horse", identity.salt, identity.kdf);
        auto mac = crypto::make_proof(key.unwrap(), nonce);
        mac.resize(8);
        REQUIRE_FALSE(store.verify(PassphraseProof{nonce, mac}));
    }
}

TEST_CASE("CredentialStore is write-once", "[identity]") {
    CredentialStore store;
    REQUIRE(store.configure(QStringLiteral("First"), std::nullopt).is_ok());

    auto second = store.configure(QStringLiteral("Second"), std::string("late"),
                                  crypto::KdfParams::minimum());
    REQUIRE(second.is_err());
    REQUIRE(second.unwrap_err().code == ErrorCode::AlreadyConfigured);

    REQUIRE(store.snapshot().display_name == QStringLiteral("First"));
    REQUIRE_FALSE(store.requiresPassphrase());
}

TEST_CASE("CredentialStore leaves no cleartext with the caller", "[identity]") {
    CredentialStore store;
    std::optional<std::string> passphrase = std::string("pw");
    REQUIRE(store.configure(QStringLiteral("Teacher"), std::move(passphrase),
                            crypto::KdfParams::minimum()).is_ok());
    REQUIRE_FALSE(passphrase.has_value());

    SECTION("also when configuration is refused") {
        std::optional<std::string> late = std::string("late");
        REQUIRE(store.configure(QStringLiteral("Again"), std::move(late)).is_err());
        REQUIRE_FALSE(late.has_value());
    }
}

TEST_CASE("Passphrase KDF limits", "[identity][crypto]") {
    REQUIRE(crypto::KdfParams::minimum().acceptable());
    REQUIRE(crypto::KdfParams::interactive().acceptable());

    crypto::KdfParams absurd = crypto::KdfParams::interactive();
    absurd.mem_limit = uint64_t{1} << 40;
    REQUIRE_FALSE(absurd.acceptable());

    crypto::KdfParams zero;
    REQUIRE_FALSE(zero.acceptable());
}
