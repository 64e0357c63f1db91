#pragma once

#include "core/identity.hpp"
#include "core/result.hpp"
#include "core/status_bus.hpp"
#include "core/types.hpp"
#include "network/auth_cooldown.hpp"
#include "network/codec.hpp"
#include "storage/submission_store.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QObject>
#include <QPointer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThreadPool>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(serverLog)

namespace manuscripts::network {

struct ServerOptions {
    std::chrono::milliseconds idle_timeout{30000};
    // Requests declaring more than this are rejected with SizeExceeded.
    std::optional<uint64_t> max_submission_bytes;
    AuthCooldown::Policy cooldown{};
};

/**
 * Collaborators shared by every session of one server.
 */
struct SessionContext {
    CredentialStore& credentials;
    storage::SubmissionStore& store;
    StatusEventBus& bus;
    AuthCooldown& cooldown;
    QThreadPool& commits;
    const ServerOptions& options;
};

/**
 * SubmissionSession - One connection, from the opening request to a
 * terminal state.
 *
 * The session owns its socket. It appears on the bus once the peer's first
 * frame parses, publishes every state change from then on and emits
 * finished() once it is terminal and the socket has closed. The body ends
 * with a BodyComplete frame; the temp file is committed on the server's
 * commit pool while the session sits in Finalizing.
 */
class SubmissionSession : public QObject {
    Q_OBJECT

public:
    SubmissionSession(QTcpSocket* socket, SessionContext context, QObject* parent = nullptr);
    ~SubmissionSession() override;

    [[nodiscard]] const QString& id() const { return id_; }
    [[nodiscard]] SessionState state() const { return state_; }
    [[nodiscard]] uint64_t bytesReceived() const { return bytes_received_; }
    [[nodiscard]] bool isTerminal() const { return is_terminal(state_); }

    /**
     * Force a non-terminal session to Failed(TransportInterrupted) and drop
     * the connection. A session whose commit is already running is left to
     * finish.
     */
    void interrupt(const QString& reason);

signals:
    void finished(manuscripts::network::SubmissionSession* session);

private slots:
    void onReadyRead();
    void onDisconnected();
    void onIdleTimeout();

private:
    void processBuffer();
    void handleFrame(const Frame& frame);
    void handleRequest(const QJsonObject& payload);
    void handleProof(const QJsonObject& payload);
    void beginTransfer();
    void consumeBody();
    bool consumeEndOfBody();
    void finalize();
    void onCommitted(Result<StoredFile, Error> committed);

    void transition(SessionState next);
    void fail(ErrorCode code, const QString& message);
    void closeConnection(bool graceful);
    void notifyFinished();
    void publish(SessionState state,
                 std::optional<ErrorCode> failure = std::nullopt,
                 const QString& reason = {},
                 std::optional<StoredFile> stored = std::nullopt);

    SessionContext ctx_;
    QPointer<QTcpSocket> socket_;
    QString id_;
    QString peer_address_;
    SessionState state_ = SessionState::Handshaking;
    Timestamp started_at_ = Timestamp::now();
    QTimer idle_timer_;
    QByteArray buffer_;

    SubmissionRequest request_;
    std::optional<crypto::Nonce> nonce_;
    bool proof_checked_ = false;
    std::unique_ptr<storage::PendingWrite> pending_;
    uint64_t bytes_received_ = 0;
    bool announced_ = false;
    bool finished_emitted_ = false;
};

/**
 * SubmissionServer - Accepts submissions over TCP.
 *
 * Sessions run independently on the owning thread's event loop. stop()
 * closes the listener, lets in-flight sessions finish for a grace period and
 * then interrupts the rest; drained() fires once none remain.
 */
class SubmissionServer : public QObject {
    Q_OBJECT

public:
    SubmissionServer(CredentialStore& credentials,
                     storage::SubmissionStore& store,
                     StatusEventBus& bus,
                     ServerOptions options = {},
                     QObject* parent = nullptr);
    ~SubmissionServer() override;

    /**
     * Start listening. Port 0 picks an ephemeral port.
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(uint16_t port = 0,
                                   const QHostAddress& address = QHostAddress::Any);

    /**
     * Stop accepting and interrupt whatever is still running after `grace`.
     */
    void stop(std::chrono::milliseconds grace);

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;
    [[nodiscard]] int activeSessionCount() const { return static_cast<int>(sessions_.size()); }
    [[nodiscard]] AuthCooldown& cooldown() { return cooldown_; }

signals:
    void sessionFinished(const QString& session_id, manuscripts::SessionState state);
    void drained();

private slots:
    void onNewConnection();
    void onSessionFinished(manuscripts::network::SubmissionSession* session);
    void onGraceExpired();

private:
    CredentialStore& credentials_;
    storage::SubmissionStore& store_;
    StatusEventBus& bus_;
    ServerOptions options_;
    AuthCooldown cooldown_;
    QThreadPool commit_pool_;

    std::unique_ptr<QTcpServer> server_;
    std::vector<SubmissionSession*> sessions_;
    QTimer grace_timer_;
    bool stopping_ = false;
};

} // namespace manuscripts::network
