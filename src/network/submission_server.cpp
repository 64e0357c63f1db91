#include "network/submission_server.hpp"

#include <QCoreApplication>
#include <QFileInfo>
#include <algorithm>

Q_LOGGING_CATEGORY(serverLog, "manuscripts.server")

namespace manuscripts::network {
namespace {

const QString kUnknownSender = QStringLiteral("Unknown Sender");

// Last path component, either separator style.
QString baseFileName(QString name) {
    name.replace(QLatin1Char('\\'), QLatin1Char('/'));
    name = name.section(QLatin1Char('/'), -1).trimmed();
    if (name == QLatin1String(".") || name == QLatin1String("..")) {
        return {};
    }
    return name;
}

QString normalizedAddress(const QHostAddress& address) {
    bool is_v4 = false;
    const auto v4 = address.toIPv4Address(&is_v4);
    return is_v4 ? QHostAddress(v4).toString() : address.toString();
}

} // namespace

// ============================================================================
// SubmissionSession
// ============================================================================

SubmissionSession::SubmissionSession(QTcpSocket* socket, SessionContext context, QObject* parent)
    : QObject(parent)
    , ctx_(context)
    , socket_(socket)
    , id_(QString::fromStdString(Uuid::generate().to_string()))
    , peer_address_(normalizedAddress(socket->peerAddress()))
{
    socket_->setParent(this);

    idle_timer_.setSingleShot(true);
    idle_timer_.setInterval(ctx_.options.idle_timeout);
    connect(&idle_timer_, &QTimer::timeout, this, &SubmissionSession::onIdleTimeout);

    connect(socket_, &QTcpSocket::readyRead, this, &SubmissionSession::onReadyRead);
    connect(socket_, &QTcpSocket::disconnected, this, &SubmissionSession::onDisconnected);

    qCDebug(serverLog) << "Connection" << id_ << "from" << peer_address_;
    idle_timer_.start();

    // Bytes may have arrived before readyRead was connected.
    QMetaObject::invokeMethod(this, &SubmissionSession::onReadyRead, Qt::QueuedConnection);
}

SubmissionSession::~SubmissionSession() {
    if (pending_) {
        ctx_.store.abort(*pending_);
    }
}

void SubmissionSession::interrupt(const QString& reason) {
    if (state_ == SessionState::Finalizing) {
        qCDebug(serverLog) << "Session" << id_ << "is committing; not interrupted";
        return;
    }
    if (!isTerminal()) {
        fail(ErrorCode::TransportInterrupted, reason);
        return;
    }
    // Terminal but still flushing its last reply.
    closeConnection(false);
}

void SubmissionSession::onReadyRead() {
    if (!socket_) return;
    if (isTerminal() || state_ == SessionState::Finalizing) {
        socket_->readAll();
        return;
    }
    if (socket_->bytesAvailable() <= 0) return;

    idle_timer_.start();
    buffer_.append(socket_->readAll());
    processBuffer();
}

void SubmissionSession::onDisconnected() {
    if (!isTerminal() && socket_ && socket_->bytesAvailable() > 0) {
        buffer_.append(socket_->readAll());
        processBuffer();
    }

    if (state_ == SessionState::Finalizing) {
        return;  // onCommitted() finishes up
    }
    if (!isTerminal()) {
        if (state_ == SessionState::Transferring && bytes_received_ == request_.size_bytes) {
            fail(ErrorCode::TransportInterrupted,
                 QStringLiteral("Stream ended without an end-of-body frame"));
        } else if (state_ == SessionState::Transferring) {
            fail(ErrorCode::TransportInterrupted,
                 QStringLiteral("Stream ended after %1 of %2 bytes")
                     .arg(bytes_received_).arg(request_.size_bytes));
        } else {
            fail(ErrorCode::TransportInterrupted,
                 QStringLiteral("Connection closed while %1")
                     .arg(QString::fromLatin1(session_state_name(state_)).toLower()));
        }
        return;
    }
    notifyFinished();
}

void SubmissionSession::onIdleTimeout() {
    fail(ErrorCode::Timeout,
         QStringLiteral("No data for %1 ms").arg(ctx_.options.idle_timeout.count()));
}

void SubmissionSession::processBuffer() {
    while (!isTerminal() && state_ != SessionState::Finalizing && !buffer_.isEmpty()) {
        if (state_ == SessionState::Transferring) {
            if (bytes_received_ < request_.size_bytes) {
                consumeBody();
                continue;
            }
            if (!consumeEndOfBody()) {
                return;  // need more data
            }
            continue;
        }

        auto taken = takeFrame(buffer_);
        if (taken.is_err()) {
            fail(ErrorCode::ProtocolMismatch, QString::fromStdString(taken.unwrap_err().message));
            return;
        }
        auto frame = std::move(taken).unwrap();
        if (!frame) {
            return;  // need more data
        }
        if (!announced_) {
            announced_ = true;
            qCInfo(serverLog) << "Session" << id_ << "opened from" << peer_address_;
            publish(SessionState::Handshaking);
        }
        handleFrame(*frame);
    }
}

void SubmissionSession::handleFrame(const Frame& frame) {
    switch (state_) {
        case SessionState::Handshaking:
            if (frame.type == MessageType::SubmissionRequest) {
                handleRequest(frame.payload);
                return;
            }
            break;
        case SessionState::Authenticating:
            if (frame.type == MessageType::PassphraseProof) {
                handleProof(frame.payload);
                return;
            }
            break;
        default:
            break;
    }
    fail(ErrorCode::ProtocolMismatch,
         QStringLiteral("Unexpected message 0x%1 while %2")
             .arg(static_cast<int>(frame.type), 2, 16, QLatin1Char('0'))
             .arg(QString::fromLatin1(session_state_name(state_))));
}

void SubmissionSession::handleRequest(const QJsonObject& payload) {
    auto decoded = decodeSubmissionRequest(payload);
    if (decoded.is_err()) {
        fail(ErrorCode::ProtocolMismatch, QString::fromStdString(decoded.unwrap_err().message));
        return;
    }
    request_ = std::move(decoded).unwrap();

    request_.file_name = baseFileName(request_.file_name);
    request_.sender_name = request_.sender_name.trimmed();
    if (request_.sender_name.isEmpty()) {
        request_.sender_name = kUnknownSender;
    }
    if (request_.file_name.isEmpty()) {
        fail(ErrorCode::ProtocolMismatch, QStringLiteral("Empty file name"));
        return;
    }

    qCInfo(serverLog) << "Session" << id_ << "request:" << request_.sender_name
                      << request_.file_name << request_.size_bytes << "bytes";

    const auto& limit = ctx_.options.max_submission_bytes;
    if (limit && request_.size_bytes > *limit) {
        fail(ErrorCode::SizeExceeded,
             QStringLiteral("Declared size %1 exceeds the limit of %2 bytes")
                 .arg(request_.size_bytes).arg(*limit));
        return;
    }

    if (!ctx_.credentials.requiresPassphrase()) {
        // Any proof in the request is irrelevant.
        beginTransfer();
        return;
    }

    const auto wait = ctx_.cooldown.remaining(peer_address_);
    if (wait.count() > 0) {
        fail(ErrorCode::AuthenticationFailed,
             QStringLiteral("Too many failed attempts; retry in %1 s")
                 .arg((wait.count() + 999) / 1000));
        return;
    }

    transition(SessionState::Authenticating);

    const auto identity = ctx_.credentials.snapshot();
    nonce_ = crypto::generate_nonce();

    AuthChallenge challenge;
    challenge.nonce.assign(nonce_->begin(), nonce_->end());
    challenge.salt = identity.salt;
    challenge.kdf = identity.kdf;
    socket_->write(encodeAuthChallenge(challenge));
}

void SubmissionSession::handleProof(const QJsonObject& payload) {
    if (proof_checked_ || !nonce_) {
        fail(ErrorCode::AuthenticationFailed, QStringLiteral("Challenge already answered"));
        return;
    }
    proof_checked_ = true;

    auto mac = decodePassphraseProof(payload);
    if (mac.is_err()) {
        fail(ErrorCode::ProtocolMismatch, QString::fromStdString(mac.unwrap_err().message));
        return;
    }

    // The nonce is single-use whatever the outcome.
    const crypto::Nonce nonce = *nonce_;
    nonce_.reset();

    if (!ctx_.credentials.verify(PassphraseProof{nonce, mac.unwrap()})) {
        ctx_.cooldown.recordFailure(peer_address_);
        fail(ErrorCode::AuthenticationFailed, QStringLiteral("Passphrase rejected"));
        return;
    }

    qCDebug(serverLog) << "Session" << id_ << "authenticated";
    beginTransfer();
}

void SubmissionSession::beginTransfer() {
    // Anonymous submissions keep their plain file name on disk.
    const auto sender = request_.sender_name == kUnknownSender ? QString() : request_.sender_name;
    auto pending = ctx_.store.beginWrite(request_.file_name, request_.size_bytes, sender);
    if (pending.is_err()) {
        fail(ErrorCode::PersistenceFailure, QString::fromStdString(pending.unwrap_err().message));
        return;
    }
    pending_ = std::move(pending).unwrap();

    transition(SessionState::Transferring);
    socket_->write(encodeAccepted(id_));
}

void SubmissionSession::consumeBody() {
    const uint64_t remaining = request_.size_bytes - bytes_received_;
    const auto chunk = static_cast<qsizetype>(
        std::min<uint64_t>(remaining, static_cast<uint64_t>(buffer_.size())));

    auto written = pending_->write(buffer_.constData(), chunk);
    buffer_.remove(0, chunk);
    if (written.is_err()) {
        fail(ErrorCode::PersistenceFailure, QString::fromStdString(written.unwrap_err().message));
        return;
    }
    bytes_received_ += static_cast<uint64_t>(chunk);
}

bool SubmissionSession::consumeEndOfBody() {
    // Past the declared size only a BodyComplete frame may follow.
    if (!couldStartBodyComplete(buffer_)) {
        buffer_.clear();
        fail(ErrorCode::SizeExceeded,
             QStringLiteral("Received more than the declared %1 bytes").arg(request_.size_bytes));
        return false;
    }

    auto taken = takeFrame(buffer_);
    if (taken.is_err()) {
        fail(ErrorCode::SizeExceeded,
             QStringLiteral("Received more than the declared %1 bytes").arg(request_.size_bytes));
        return false;
    }
    auto frame = std::move(taken).unwrap();
    if (!frame) {
        return false;
    }

    auto declared = decodeBodyComplete(frame->payload);
    if (declared.is_err() || declared.unwrap() != request_.size_bytes) {
        fail(ErrorCode::ProtocolMismatch, QStringLiteral("End of body does not match the request"));
        return false;
    }
    finalize();
    return true;
}

void SubmissionSession::finalize() {
    idle_timer_.stop();
    transition(SessionState::Finalizing);

    std::shared_ptr<storage::PendingWrite> handle(std::move(pending_));
    auto& store = ctx_.store;
    // The server waits for its commit pool before its sessions go away.
    ctx_.commits.start([this, handle, &store]() {
        auto committed = store.commit(*handle);
        QMetaObject::invokeMethod(this, [this, committed]() {
            onCommitted(committed);
        }, Qt::QueuedConnection);
    });
}

void SubmissionSession::onCommitted(Result<StoredFile, Error> committed) {
    if (committed.is_err()) {
        fail(ErrorCode::PersistenceFailure, QString::fromStdString(committed.unwrap_err().message));
        return;
    }

    const auto& stored = committed.unwrap();
    state_ = SessionState::Succeeded;
    qCInfo(serverLog) << "Session" << id_ << "stored" << stored.final_path;
    publish(SessionState::Succeeded, std::nullopt, {}, stored);

    if (socket_ && socket_->state() == QAbstractSocket::ConnectedState) {
        socket_->write(encodeCompleted(Completion{id_, QFileInfo(stored.final_path).fileName()}));
    }
    closeConnection(true);
}

void SubmissionSession::transition(SessionState next) {
    if (!is_forward_transition(state_, next)) {
        qCWarning(serverLog) << "Session" << id_ << "ignoring transition"
                             << session_state_name(state_) << "->" << session_state_name(next);
        return;
    }
    qCDebug(serverLog) << "Session" << id_ << session_state_name(state_)
                       << "->" << session_state_name(next);
    state_ = next;
    publish(next);
}

void SubmissionSession::fail(ErrorCode code, const QString& message) {
    if (isTerminal()) return;

    idle_timer_.stop();
    if (pending_) {
        ctx_.store.abort(*pending_);
        pending_.reset();
    }
    nonce_.reset();
    state_ = SessionState::Failed;

    if (!announced_) {
        // Never got past the first frame; not a submission.
        qCInfo(serverLog) << "Dropping connection from" << peer_address_ << "before a request:"
                          << error_code_name(code) << message;
    } else {
        qCWarning(serverLog) << "Session" << id_ << "failed:" << error_code_name(code) << message;
        publish(SessionState::Failed, code, message);
    }

    if (announced_ && is_receiver_level(code)) {
        StatusEvent fault;
        fault.kind = StatusEventKind::ReceiverFault;
        fault.session_id = id_;
        fault.state = SessionState::Failed;
        fault.failure = code;
        fault.failure_reason = message;
        ctx_.bus.publish(fault);
    }

    const bool can_reply = code != ErrorCode::TransportInterrupted && socket_ &&
                           socket_->state() == QAbstractSocket::ConnectedState;
    if (can_reply) {
        socket_->write(encodeRejected(Rejection{code, message}));
    }
    closeConnection(can_reply);
}

void SubmissionSession::closeConnection(bool graceful) {
    if (!socket_ || socket_->state() == QAbstractSocket::UnconnectedState) {
        notifyFinished();
        return;
    }

    if (graceful) {
        socket_->disconnectFromHost();
    } else {
        socket_->abort();
    }

    if (socket_ && socket_->state() == QAbstractSocket::UnconnectedState) {
        notifyFinished();
    }
}

void SubmissionSession::notifyFinished() {
    if (finished_emitted_ || !isTerminal()) return;
    finished_emitted_ = true;
    emit finished(this);
}

void SubmissionSession::publish(SessionState state,
                                std::optional<ErrorCode> failure,
                                const QString& reason,
                                std::optional<StoredFile> stored) {
    StatusEvent event;
    event.kind = StatusEventKind::SessionChanged;
    event.session_id = id_;
    event.state = state;
    event.sender_name = request_.sender_name;
    event.file_name = request_.file_name;
    event.size_bytes = request_.size_bytes;
    event.bytes_received = bytes_received_;
    event.failure = failure;
    event.failure_reason = reason;
    event.stored = std::move(stored);
    ctx_.bus.publish(event);
}

// ============================================================================
// SubmissionServer
// ============================================================================

SubmissionServer::SubmissionServer(CredentialStore& credentials,
                                   storage::SubmissionStore& store,
                                   StatusEventBus& bus,
                                   ServerOptions options,
                                   QObject* parent)
    : QObject(parent)
    , credentials_(credentials)
    , store_(store)
    , bus_(bus)
    , options_(std::move(options))
    , cooldown_(options_.cooldown)
{
    grace_timer_.setSingleShot(true);
    connect(&grace_timer_, &QTimer::timeout, this, &SubmissionServer::onGraceExpired);
}

SubmissionServer::~SubmissionServer() {
    stopping_ = true;
    grace_timer_.stop();

    // Commits already running still land and report their verdict.
    commit_pool_.waitForDone();

    const auto remaining = sessions_;
    sessions_.clear();
    for (auto* session : remaining) {
        QObject::disconnect(session, nullptr, this, nullptr);
        QCoreApplication::sendPostedEvents(session, QEvent::MetaCall);
        session->interrupt(QStringLiteral("Receiver stopped"));
    }
}

Result<uint16_t, Error> SubmissionServer::listen(uint16_t port, const QHostAddress& address) {
    if (!server_) {
        server_ = std::make_unique<QTcpServer>(this);
        connect(server_.get(), &QTcpServer::newConnection,
                this, &SubmissionServer::onNewConnection);
    }

    if (server_->isListening()) {
        return Result<uint16_t, Error>::ok(server_->serverPort());
    }

    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::fail(ErrorCode::ListenFailed,
            "Failed to listen on port " + std::to_string(port) + ": " +
            server_->errorString().toStdString());
    }

    stopping_ = false;
    qCInfo(serverLog) << "Listening on port" << server_->serverPort();
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void SubmissionServer::stop(std::chrono::milliseconds grace) {
    if (server_ && server_->isListening()) {
        server_->close();
    }
    stopping_ = true;

    if (sessions_.empty()) {
        QMetaObject::invokeMethod(this, &SubmissionServer::drained, Qt::QueuedConnection);
        return;
    }

    qCInfo(serverLog) << "Waiting up to" << grace.count() << "ms for"
                      << sessions_.size() << "session(s)";
    grace_timer_.start(grace);
}

uint16_t SubmissionServer::port() const {
    return server_ ? server_->serverPort() : 0;
}

bool SubmissionServer::isListening() const {
    return server_ && server_->isListening();
}

void SubmissionServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        if (stopping_) {
            socket->abort();
            socket->deleteLater();
            continue;
        }

        auto* session = new SubmissionSession(
            socket, SessionContext{credentials_, store_, bus_, cooldown_, commit_pool_, options_}, this);
        connect(session, &SubmissionSession::finished,
                this, &SubmissionServer::onSessionFinished);
        sessions_.push_back(session);
    }
}

void SubmissionServer::onSessionFinished(SubmissionSession* session) {
    auto it = std::find(sessions_.begin(), sessions_.end(), session);
    if (it == sessions_.end()) return;

    sessions_.erase(it);
    emit sessionFinished(session->id(), session->state());
    session->deleteLater();

    if (stopping_ && sessions_.empty()) {
        grace_timer_.stop();
        emit drained();
    }
}

void SubmissionServer::onGraceExpired() {
    qCInfo(serverLog) << "Grace period over; interrupting" << sessions_.size() << "session(s)";
    const auto remaining = sessions_;
    for (auto* session : remaining) {
        session->interrupt(QStringLiteral("Receiver shutting down"));
    }
}

} // namespace manuscripts::network
