#include "network/auth_cooldown.hpp"

#include <QMutexLocker>
#include <algorithm>

namespace manuscripts::network {

AuthCooldown::AuthCooldown()
    : AuthCooldown(Policy{})
{
}

AuthCooldown::AuthCooldown(Policy policy)
    : policy_(policy)
{
}

bool AuthCooldown::expired(const Entry& entry, Timestamp now) const {
    return (now - entry.last_failure) > policy_.window;
}

std::chrono::milliseconds AuthCooldown::delayFor(int failures) const {
    if (failures <= 0) return std::chrono::milliseconds{0};

    auto delay = policy_.base;
    for (int i = 1; i < failures && delay < policy_.cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.cap);
}

void AuthCooldown::recordFailure(const QString& address, Timestamp now) {
    QMutexLocker lock(&mutex_);
    pruneLocked(now);

    auto& entry = entries_[address.toStdString()];
    if (entry.failures > 0 && expired(entry, now)) {
        entry = Entry{};
    }

    entry.failures += 1;
    entry.last_failure = now;
    const auto until = Timestamp(now.millis() + delayFor(entry.failures).count());
    entry.blocked_until = std::max(entry.blocked_until, until);
}

std::chrono::milliseconds AuthCooldown::remaining(const QString& address, Timestamp now) const {
    QMutexLocker lock(&mutex_);

    const auto it = entries_.find(address.toStdString());
    if (it == entries_.end()) return std::chrono::milliseconds{0};

    const auto left = it->second.blocked_until - now;
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

int AuthCooldown::failures(const QString& address, Timestamp now) const {
    QMutexLocker lock(&mutex_);

    const auto it = entries_.find(address.toStdString());
    if (it == entries_.end() || expired(it->second, now)) return 0;
    return it->second.failures;
}

void AuthCooldown::prune(Timestamp now) {
    QMutexLocker lock(&mutex_);
    pruneLocked(now);
}

size_t AuthCooldown::trackedAddresses() const {
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

void AuthCooldown::pruneLocked(Timestamp now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, now) && it->second.blocked_until <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace manuscripts::network
