#include "network/codec.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <algorithm>
#include <cmath>

namespace manuscripts::network {
namespace {

bool known_type(uint8_t type) {
    return type >= static_cast<uint8_t>(MessageType::SubmissionRequest) &&
           type <= static_cast<uint8_t>(MessageType::BodyComplete);
}

QString b64(std::span<const uint8_t> bytes) {
    return QString::fromStdString(crypto::to_base64(bytes));
}

Result<std::vector<uint8_t>, Error> unb64(const QJsonValue& value, const char* field) {
    if (!value.isString()) {
        return Result<std::vector<uint8_t>, Error>::fail(
            ErrorCode::ProtocolMismatch, std::string("missing field ") + field);
    }
    return crypto::from_base64(value.toString().toStdString());
}

// JSON numbers are doubles; only accept exact non-negative integers.
std::optional<uint64_t> as_uint(const QJsonValue& value, uint64_t max) {
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (!(d >= 0.0) || d > static_cast<double>(max) || std::floor(d) != d) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(d);
}

Error mismatch(std::string message) {
    return Error{ErrorCode::ProtocolMismatch, std::move(message)};
}

} // namespace

QByteArray encodeFrame(MessageType type, const QJsonObject& payload) {
    const auto body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    const auto length = static_cast<uint32_t>(body.size());

    QByteArray frame;
    frame.reserve(static_cast<qsizetype>(FrameHeader::HEADER_SIZE) + body.size());
    frame.append(static_cast<char>(FrameHeader::MAGIC[0]));
    frame.append(static_cast<char>(FrameHeader::MAGIC[1]));
    frame.append(static_cast<char>(PROTOCOL_VERSION));
    frame.append(static_cast<char>(type));
    frame.append(static_cast<char>((length >> 24) & 0xFF));
    frame.append(static_cast<char>((length >> 16) & 0xFF));
    frame.append(static_cast<char>((length >> 8) & 0xFF));
    frame.append(static_cast<char>(length & 0xFF));
    frame.append(body);
    return frame;
}

QByteArray encodeSubmissionRequest(const SubmissionRequest& request) {
    QJsonObject obj;
    obj["sender"] = request.sender_name;
    obj["file"] = request.file_name;
    obj["size"] = static_cast<double>(request.size_bytes);
    if (request.passphrase_proof) {
        obj["proof"] = b64(*request.passphrase_proof);
    }
    return encodeFrame(MessageType::SubmissionRequest, obj);
}

QByteArray encodeAuthChallenge(const AuthChallenge& challenge) {
    QJsonObject obj;
    obj["nonce"] = b64(challenge.nonce);
    obj["salt"] = b64(challenge.salt);
    obj["ops"] = static_cast<double>(challenge.kdf.ops_limit);
    obj["mem"] = static_cast<double>(challenge.kdf.mem_limit);
    return encodeFrame(MessageType::AuthenticationRequired, obj);
}

QByteArray encodePassphraseProof(const std::vector<uint8_t>& proof) {
    QJsonObject obj;
    obj["proof"] = b64(proof);
    return encodeFrame(MessageType::PassphraseProof, obj);
}

QByteArray encodeAccepted(const QString& session_id) {
    QJsonObject obj;
    obj["session"] = session_id;
    return encodeFrame(MessageType::Accepted, obj);
}

QByteArray encodeRejected(const Rejection& rejection) {
    QJsonObject obj;
    obj["reason"] = QString::fromLatin1(error_code_name(rejection.reason));
    obj["message"] = rejection.message;
    return encodeFrame(MessageType::Rejected, obj);
}

QByteArray encodeCompleted(const Completion& completion) {
    QJsonObject obj;
    obj["session"] = completion.session_id;
    obj["stored"] = completion.stored_name;
    return encodeFrame(MessageType::Completed, obj);
}

QByteArray encodeBodyComplete(uint64_t size_bytes) {
    QJsonObject obj;
    obj["size"] = static_cast<double>(size_bytes);
    return encodeFrame(MessageType::BodyComplete, obj);
}

Result<FrameHeader, Error> decodeHeader(const QByteArray& data) {
    using R = Result<FrameHeader, Error>;
    if (data.size() < static_cast<qsizetype>(FrameHeader::HEADER_SIZE)) {
        return R::err(mismatch("Header too short"));
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.constData());
    if (bytes[0] != FrameHeader::MAGIC[0] || bytes[1] != FrameHeader::MAGIC[1]) {
        return R::err(mismatch("Invalid magic"));
    }
    if (bytes[2] != PROTOCOL_VERSION) {
        return R::err(mismatch("Unsupported protocol version " + std::to_string(bytes[2])));
    }
    if (!known_type(bytes[3])) {
        return R::err(mismatch("Unknown message type"));
    }

    FrameHeader header;
    header.version = bytes[2];
    header.type = static_cast<MessageType>(bytes[3]);
    header.length = (static_cast<uint32_t>(bytes[4]) << 24) |
                    (static_cast<uint32_t>(bytes[5]) << 16) |
                    (static_cast<uint32_t>(bytes[6]) << 8) |
                    static_cast<uint32_t>(bytes[7]);
    if (header.length > FrameHeader::MAX_PAYLOAD) {
        return R::err(mismatch("Frame too large"));
    }
    return R::ok(header);
}

Result<std::optional<Frame>, Error> takeFrame(QByteArray& buffer) {
    using R = Result<std::optional<Frame>, Error>;
    if (buffer.size() < static_cast<qsizetype>(FrameHeader::HEADER_SIZE)) {
        return R::ok(std::nullopt);
    }

    auto header = decodeHeader(buffer.left(FrameHeader::HEADER_SIZE));
    if (header.is_err()) {
        return R::err(header.unwrap_err());
    }

    const auto total = static_cast<qsizetype>(FrameHeader::HEADER_SIZE + header.unwrap().length);
    if (buffer.size() < total) {
        return R::ok(std::nullopt);
    }

    const auto body = buffer.mid(FrameHeader::HEADER_SIZE, header.unwrap().length);
    buffer.remove(0, total);

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return R::err(mismatch("Payload is not a JSON object"));
    }
    return R::ok(Frame{header.unwrap().type, doc.object()});
}

bool couldStartBodyComplete(const QByteArray& bytes) {
    const char expected[4] = {
        static_cast<char>(FrameHeader::MAGIC[0]),
        static_cast<char>(FrameHeader::MAGIC[1]),
        static_cast<char>(PROTOCOL_VERSION),
        static_cast<char>(MessageType::BodyComplete),
    };
    const auto n = std::min<qsizetype>(bytes.size(), 4);
    for (qsizetype i = 0; i < n; ++i) {
        if (bytes[i] != expected[i]) return false;
    }
    return true;
}

Result<SubmissionRequest, Error> decodeSubmissionRequest(const QJsonObject& payload) {
    using R = Result<SubmissionRequest, Error>;

    if (!payload["file"].isString() || !payload["size"].isDouble()) {
        return R::err(mismatch("Request is missing file or size"));
    }
    const auto size = as_uint(payload["size"], MAX_DECLARED_SIZE);
    if (!size) {
        return R::err(mismatch("Invalid declared size"));
    }

    SubmissionRequest request;
    request.sender_name = payload["sender"].toString();
    request.file_name = payload["file"].toString();
    request.size_bytes = *size;
    if (payload.contains("proof")) {
        auto proof = unb64(payload["proof"], "proof");
        if (proof.is_err()) {
            return R::err(proof.unwrap_err());
        }
        request.passphrase_proof = std::move(proof).unwrap();
    }
    return R::ok(std::move(request));
}

Result<AuthChallenge, Error> decodeAuthChallenge(const QJsonObject& payload) {
    using R = Result<AuthChallenge, Error>;

    auto nonce = unb64(payload["nonce"], "nonce");
    if (nonce.is_err()) return R::err(nonce.unwrap_err());
    auto salt = unb64(payload["salt"], "salt");
    if (salt.is_err()) return R::err(salt.unwrap_err());
    const auto ops = as_uint(payload["ops"], MAX_DECLARED_SIZE);
    const auto mem = as_uint(payload["mem"], MAX_DECLARED_SIZE);

    if (nonce.unwrap().size() != crypto::NONCE_SIZE ||
        salt.unwrap().size() != crypto::SALT_SIZE || !ops || !mem) {
        return R::err(mismatch("Malformed challenge"));
    }

    AuthChallenge challenge;
    challenge.nonce = std::move(nonce).unwrap();
    std::copy(salt.unwrap().begin(), salt.unwrap().end(), challenge.salt.begin());
    challenge.kdf = crypto::KdfParams{*ops, *mem};
    return R::ok(std::move(challenge));
}

Result<std::vector<uint8_t>, Error> decodePassphraseProof(const QJsonObject& payload) {
    return unb64(payload["proof"], "proof");
}

Result<QString, Error> decodeAccepted(const QJsonObject& payload) {
    if (!payload["session"].isString()) {
        return Result<QString, Error>::err(mismatch("Accepted without session id"));
    }
    return Result<QString, Error>::ok(payload["session"].toString());
}

Result<Rejection, Error> decodeRejected(const QJsonObject& payload) {
    Rejection rejection;
    const auto reason = payload["reason"].toString().toStdString();
    rejection.reason = parse_error_code(reason).value_or(ErrorCode::Internal);
    rejection.message = payload["message"].toString();
    return Result<Rejection, Error>::ok(std::move(rejection));
}

Result<Completion, Error> decodeCompleted(const QJsonObject& payload) {
    if (!payload["session"].isString() || !payload["stored"].isString()) {
        return Result<Completion, Error>::err(mismatch("Malformed completion"));
    }
    return Result<Completion, Error>::ok(
        Completion{payload["session"].toString(), payload["stored"].toString()});
}

Result<uint64_t, Error> decodeBodyComplete(const QJsonObject& payload) {
    const auto size = as_uint(payload["size"], MAX_DECLARED_SIZE);
    if (!size) {
        return Result<uint64_t, Error>::err(mismatch("Malformed end of body"));
    }
    return Result<uint64_t, Error>::ok(*size);
}

} // namespace manuscripts::network
