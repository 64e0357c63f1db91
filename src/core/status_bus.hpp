#pragma once

#include "core/errors.hpp"
#include "core/submission.hpp"

#include <QMutex>
#include <QObject>
#include <QString>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace manuscripts {

enum class StatusEventKind {
    Listening,       // server accepting, advertisement published
    SessionChanged,  // one session moved to `state`
    ShuttingDown,
    ReceiverFault,   // environment problem affecting future sessions
};

/**
 * StatusEvent - One notification for the tray/GUI layer.
 */
struct StatusEvent {
    StatusEventKind kind = StatusEventKind::SessionChanged;
    QString session_id;
    SessionState state = SessionState::Handshaking;
    QString sender_name;
    QString file_name;
    uint64_t size_bytes = 0;
    uint64_t bytes_received = 0;
    std::optional<ErrorCode> failure;
    QString failure_reason;
    std::optional<StoredFile> stored;
    uint16_t port = 0;  // Listening only
    Timestamp at = Timestamp::now();
};

/**
 * SessionSnapshot - A non-terminal session as seen by a late subscriber.
 */
struct SessionSnapshot {
    QString session_id;
    SessionState state = SessionState::Handshaking;
    QString sender_name;
    QString file_name;
    uint64_t size_bytes = 0;
    uint64_t bytes_received = 0;
    Timestamp started_at;
};

/**
 * StatusEventBus - In-process channel from the submission server to
 * observers.
 *
 * Events for one session are delivered in publish order; events of different
 * sessions may interleave. Observers attach either to the Qt signal (queued
 * across threads) or through subscribe(); snapshot() lists sessions that are
 * still in flight so a late observer can catch up.
 */
class StatusEventBus : public QObject {
    Q_OBJECT

public:
    using Subscriber = std::function<void(const StatusEvent&)>;

    explicit StatusEventBus(QObject* parent = nullptr);
    ~StatusEventBus() override;

    void publish(const StatusEvent& event);

    /**
     * Register a callback invoked synchronously on the publishing thread.
     * Returns a token for unsubscribe().
     */
    int subscribe(Subscriber subscriber);
    void unsubscribe(int token);

    [[nodiscard]] std::vector<SessionSnapshot> snapshot() const;
    [[nodiscard]] uint64_t succeededCount() const;
    [[nodiscard]] uint64_t failedCount() const;

signals:
    void eventPublished(const manuscripts::StatusEvent& event);

private:
    mutable QMutex mutex_;
    std::map<QString, SessionSnapshot> active_;
    std::map<int, Subscriber> subscribers_;
    int next_token_ = 1;
    uint64_t succeeded_ = 0;
    uint64_t failed_ = 0;
};

} // namespace manuscripts

Q_DECLARE_METATYPE(manuscripts::StatusEvent)
