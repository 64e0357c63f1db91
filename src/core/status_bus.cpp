#include "core/status_bus.hpp"

#include <QMutexLocker>

namespace manuscripts {

StatusEventBus::StatusEventBus(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<manuscripts::StatusEvent>();
}

StatusEventBus::~StatusEventBus() = default;

void StatusEventBus::publish(const StatusEvent& event) {
    std::vector<Subscriber> targets;
    {
        QMutexLocker lock(&mutex_);
        if (event.kind == StatusEventKind::SessionChanged) {
            if (is_terminal(event.state)) {
                active_.erase(event.session_id);
                if (event.state == SessionState::Succeeded) {
                    ++succeeded_;
                } else {
                    ++failed_;
                }
            } else {
                auto& entry = active_[event.session_id];
                if (entry.session_id.isEmpty()) {
                    entry.session_id = event.session_id;
                    entry.started_at = event.at;
                }
                entry.state = event.state;
                entry.sender_name = event.sender_name;
                entry.file_name = event.file_name;
                entry.size_bytes = event.size_bytes;
                entry.bytes_received = event.bytes_received;
            }
        }
        targets.reserve(subscribers_.size());
        for (const auto& [token, subscriber] : subscribers_) {
            targets.push_back(subscriber);
        }
    }

    for (const auto& subscriber : targets) {
        subscriber(event);
    }
    emit eventPublished(event);
}

int StatusEventBus::subscribe(Subscriber subscriber) {
    QMutexLocker lock(&mutex_);
    const int token = next_token_++;
    subscribers_.emplace(token, std::move(subscriber));
    return token;
}

void StatusEventBus::unsubscribe(int token) {
    QMutexLocker lock(&mutex_);
    subscribers_.erase(token);
}

std::vector<SessionSnapshot> StatusEventBus::snapshot() const {
    QMutexLocker lock(&mutex_);
    std::vector<SessionSnapshot> out;
    out.reserve(active_.size());
    for (const auto& [id, entry] : active_) {
        out.push_back(entry);
    }
    return out;
}

uint64_t StatusEventBus::succeededCount() const {
    QMutexLocker lock(&mutex_);
    return succeeded_;
}

uint64_t StatusEventBus::failedCount() const {
    QMutexLocker lock(&mutex_);
    return failed_;
}

} // namespace manuscripts
