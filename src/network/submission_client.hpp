#pragma once

#include "core/result.hpp"
#include "network/codec.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QIODevice>
#include <QObject>
#include <QTcpSocket>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace manuscripts::network {

/**
 * SubmissionOutcome - How one submission ended, as seen by the sender.
 */
struct SubmissionOutcome {
    bool succeeded = false;
    Completion completion;  // valid when succeeded
    Error error;            // otherwise; the receiver's reason when it rejected
};

/**
 * SubmissionClient - Sender side of the submission protocol.
 *
 * Connects, sends the request, answers a passphrase challenge if the
 * receiver issues one, streams the body once accepted, closes it with a
 * BodyComplete frame and reports the receiver's verdict through finished().
 * One submission per instance.
 */
class SubmissionClient : public QObject {
    Q_OBJECT

public:
    static constexpr qint64 CHUNK_SIZE = 64 * 1024;

    explicit SubmissionClient(QObject* parent = nullptr);
    ~SubmissionClient() override;

    /**
     * Passphrase used to answer a challenge. Wiped after use.
     */
    void setPassphrase(std::optional<std::string> passphrase);

    /**
     * Give up when nothing happens for this long (default 30 s).
     */
    void setTimeout(std::chrono::milliseconds timeout);

    /**
     * Start submitting. `body` must be open for reading and supply exactly
     * request.size_bytes bytes.
     */
    void submit(const QHostAddress& host, uint16_t port,
                SubmissionRequest request, std::unique_ptr<QIODevice> body);

    /**
     * Convenience wrapper that opens `path` and fills in name and size.
     */
    Result<void, Error> submitFile(const QHostAddress& host, uint16_t port,
                                   const QString& sender_name, const QString& path);

    [[nodiscard]] bool isFinished() const { return done_; }
    [[nodiscard]] const SubmissionOutcome& outcome() const { return outcome_; }

signals:
    void challenged();
    void accepted(const QString& session_id);
    void progress(qint64 sent, qint64 total);
    void finished(const manuscripts::network::SubmissionOutcome& outcome);

private slots:
    void onConnected();
    void onReadyRead();
    void onBytesWritten(qint64 bytes);
    void onDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onTimeout();

private:
    enum class Phase { Idle, Requesting, Authenticating, Streaming, AwaitingVerdict, Done };

    void handleFrame(const Frame& frame);
    void answerChallenge(const QJsonObject& payload);
    void pump();
    void succeed(Completion completion);
    void failWith(Error error);

    std::unique_ptr<QTcpSocket> socket_;
    std::unique_ptr<QIODevice> body_;
    QTimer timer_;
    QByteArray buffer_;
    SubmissionRequest request_;
    std::optional<std::string> passphrase_;
    Phase phase_ = Phase::Idle;
    qint64 sent_ = 0;
    bool done_ = false;
    SubmissionOutcome outcome_;
};

} // namespace manuscripts::network

Q_DECLARE_METATYPE(manuscripts::network::SubmissionOutcome)
