#pragma once

#include "core/types.hpp"

#include <QMutex>
#include <QString>
#include <chrono>
#include <string>
#include <unordered_map>

namespace manuscripts::network {

/**
 * AuthCooldown - Per-address backoff after failed passphrase proofs.
 *
 * The n-th failure inside the rolling window blocks the address for
 * base * 2^(n-1), capped at `cap`. A window with no failures for `window`
 * starts over at zero.
 */
class AuthCooldown {
public:
    struct Policy {
        std::chrono::milliseconds base{1000};
        std::chrono::milliseconds cap{60000};
        std::chrono::milliseconds window{10 * 60 * 1000};
    };

    AuthCooldown();
    explicit AuthCooldown(Policy policy);

    /**
     * Count a failure for `address`. Entries of other addresses whose window
     * has run out are dropped on the way.
     */
    void recordFailure(const QString& address, Timestamp now = Timestamp::now());

    /**
     * Time left before `address` may attempt again; zero when it may.
     */
    [[nodiscard]] std::chrono::milliseconds remaining(const QString& address,
                                                      Timestamp now = Timestamp::now()) const;

    [[nodiscard]] bool isCoolingDown(const QString& address,
                                     Timestamp now = Timestamp::now()) const {
        return remaining(address, now).count() > 0;
    }

    [[nodiscard]] int failures(const QString& address, Timestamp now = Timestamp::now()) const;

    /**
     * Drop entries whose window has expired.
     */
    void prune(Timestamp now = Timestamp::now());

    [[nodiscard]] size_t trackedAddresses() const;
    [[nodiscard]] const Policy& policy() const { return policy_; }

private:
    struct Entry {
        int failures = 0;
        Timestamp last_failure;
        Timestamp blocked_until;
    };

    [[nodiscard]] bool expired(const Entry& entry, Timestamp now) const;
    [[nodiscard]] std::chrono::milliseconds delayFor(int failures) const;
    void pruneLocked(Timestamp now);

    Policy policy_;
    mutable QMutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace manuscripts::network
