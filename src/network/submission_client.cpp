#include "network/submission_client.hpp"
#include "crypto/passphrase.hpp"

#include <QFile>
#include <QFileInfo>
#include <algorithm>

namespace manuscripts::network {

SubmissionClient::SubmissionClient(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QTcpSocket>(this))
{
    qRegisterMetaType<manuscripts::network::SubmissionOutcome>();

    timer_.setSingleShot(true);
    timer_.setInterval(std::chrono::milliseconds{30000});
    connect(&timer_, &QTimer::timeout, this, &SubmissionClient::onTimeout);

    connect(socket_.get(), &QTcpSocket::connected,
            this, &SubmissionClient::onConnected);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &SubmissionClient::onReadyRead);
    connect(socket_.get(), &QTcpSocket::bytesWritten,
            this, &SubmissionClient::onBytesWritten);
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &SubmissionClient::onDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &SubmissionClient::onSocketError);
}

SubmissionClient::~SubmissionClient() {
    setPassphrase(std::nullopt);
    socket_->disconnect(this);
    socket_->abort();
}

void SubmissionClient::setPassphrase(std::optional<std::string> passphrase) {
    if (passphrase_) {
        crypto::secure_zero(passphrase_->data(), passphrase_->size());
    }
    passphrase_ = std::move(passphrase);
}

void SubmissionClient::setTimeout(std::chrono::milliseconds timeout) {
    timer_.setInterval(timeout);
}

void SubmissionClient::submit(const QHostAddress& host, uint16_t port,
                              SubmissionRequest request, std::unique_ptr<QIODevice> body) {
    if (phase_ != Phase::Idle) {
        failWith(Error{ErrorCode::Internal, "SubmissionClient is single-use"});
        return;
    }

    request_ = std::move(request);
    // Proofs are bound to a receiver nonce, so the request never carries one.
    request_.passphrase_proof.reset();
    body_ = std::move(body);
    phase_ = Phase::Requesting;

    timer_.start();
    socket_->connectToHost(host, port);
}

Result<void, Error> SubmissionClient::submitFile(const QHostAddress& host, uint16_t port,
                                                 const QString& sender_name,
                                                 const QString& path) {
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        return Result<void, Error>::fail(ErrorCode::Internal,
            "Cannot open " + path.toStdString() + ": " + file->errorString().toStdString());
    }

    SubmissionRequest request;
    request.sender_name = sender_name;
    request.file_name = QFileInfo(path).fileName();
    request.size_bytes = static_cast<uint64_t>(file->size());

    submit(host, port, std::move(request), std::move(file));
    return Result<void, Error>::ok();
}

void SubmissionClient::onConnected() {
    timer_.start();
    socket_->write(encodeSubmissionRequest(request_));
}

void SubmissionClient::onReadyRead() {
    timer_.start();
    buffer_.append(socket_->readAll());

    while (!done_) {
        auto taken = takeFrame(buffer_);
        if (taken.is_err()) {
            failWith(taken.unwrap_err());
            return;
        }
        auto frame = std::move(taken).unwrap();
        if (!frame) return;
        handleFrame(*frame);
    }
}

void SubmissionClient::handleFrame(const Frame& frame) {
    switch (frame.type) {
        case MessageType::AuthenticationRequired:
            if (phase_ != Phase::Requesting) break;
            answerChallenge(frame.payload);
            return;

        case MessageType::Accepted: {
            if (phase_ != Phase::Requesting && phase_ != Phase::Authenticating) break;
            auto session = decodeAccepted(frame.payload);
            if (session.is_err()) {
                failWith(session.unwrap_err());
                return;
            }
            phase_ = Phase::Streaming;
            emit accepted(session.unwrap());
            pump();
            return;
        }

        case MessageType::Rejected: {
            auto rejection = decodeRejected(frame.payload);
            if (rejection.is_err()) {
                failWith(rejection.unwrap_err());
                return;
            }
            const auto& r = rejection.unwrap();
            failWith(Error{r.reason, r.message.toStdString()});
            return;
        }

        case MessageType::Completed: {
            auto completion = decodeCompleted(frame.payload);
            if (completion.is_err()) {
                failWith(completion.unwrap_err());
                return;
            }
            succeed(std::move(completion).unwrap());
            return;
        }

        default:
            break;
    }
    failWith(Error{ErrorCode::ProtocolMismatch, "Unexpected message from receiver"});
}

void SubmissionClient::answerChallenge(const QJsonObject& payload) {
    phase_ = Phase::Authenticating;
    emit challenged();

    if (!passphrase_) {
        failWith(Error{ErrorCode::AuthenticationFailed, "Receiver requires a passphrase"});
        return;
    }

    auto challenge = decodeAuthChallenge(payload);
    if (challenge.is_err()) {
        failWith(challenge.unwrap_err());
        return;
    }
    const auto& c = challenge.unwrap();
    if (!c.kdf.acceptable()) {
        failWith(Error{ErrorCode::ProtocolMismatch, "Receiver asked for unreasonable KDF limits"});
        return;
    }

    auto key = crypto::derive_passphrase_key(*passphrase_, c.salt, c.kdf);
    setPassphrase(std::nullopt);
    if (key.is_err()) {
        failWith(key.unwrap_err());
        return;
    }

    auto proof = crypto::make_proof(key.unwrap(), c.nonce);
    crypto::secure_zero(key.unwrap().data(), key.unwrap().size());
    socket_->write(encodePassphraseProof(proof));
    timer_.start();
}

void SubmissionClient::pump() {
    const auto total = static_cast<qint64>(request_.size_bytes);

    // Keep at most two chunks queued in the socket.
    while (phase_ == Phase::Streaming && sent_ < total &&
           socket_->bytesToWrite() < 2 * CHUNK_SIZE) {
        const qint64 want = std::min(CHUNK_SIZE, total - sent_);
        const QByteArray chunk = body_ ? body_->read(want) : QByteArray();
        if (chunk.isEmpty()) {
            failWith(Error{ErrorCode::TransportInterrupted,
                           "Body ended before the declared size"});
            return;
        }
        if (socket_->write(chunk) != chunk.size()) {
            failWith(Error{ErrorCode::TransportInterrupted,
                           socket_->errorString().toStdString()});
            return;
        }
        sent_ += chunk.size();
        emit progress(sent_, total);
    }

    if (phase_ == Phase::Streaming && sent_ >= total) {
        socket_->write(encodeBodyComplete(request_.size_bytes));
        phase_ = Phase::AwaitingVerdict;
        body_.reset();
    }
}

void SubmissionClient::onBytesWritten(qint64 bytes) {
    Q_UNUSED(bytes)
    timer_.start();
    if (phase_ == Phase::Streaming) {
        pump();
    }
}

void SubmissionClient::onDisconnected() {
    if (done_) return;
    if (socket_->bytesAvailable() > 0) {
        onReadyRead();
        if (done_) return;
    }
    failWith(Error{ErrorCode::TransportInterrupted, "Receiver closed the connection"});
}

void SubmissionClient::onSocketError(QAbstractSocket::SocketError error) {
    // The verdict may still be buffered when the receiver closes first.
    if (done_ || error == QAbstractSocket::RemoteHostClosedError) return;
    failWith(Error{ErrorCode::TransportInterrupted, socket_->errorString().toStdString()});
}

void SubmissionClient::onTimeout() {
    failWith(Error{ErrorCode::Timeout, "Receiver did not respond"});
}

void SubmissionClient::succeed(Completion completion) {
    if (done_) return;
    done_ = true;
    phase_ = Phase::Done;
    timer_.stop();

    outcome_.succeeded = true;
    outcome_.completion = std::move(completion);
    socket_->disconnectFromHost();
    emit finished(outcome_);
}

void SubmissionClient::failWith(Error error) {
    if (done_) return;
    done_ = true;
    phase_ = Phase::Done;
    timer_.stop();
    setPassphrase(std::nullopt);
    body_.reset();

    outcome_.succeeded = false;
    outcome_.error = std::move(error);
    socket_->abort();
    emit finished(outcome_);
}

} // namespace manuscripts::network
