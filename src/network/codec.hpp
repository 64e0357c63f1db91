#pragma once

#include "core/result.hpp"
#include "core/submission.hpp"
#include "crypto/passphrase.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace manuscripts::network {

/**
 * Frame types of the submission protocol.
 */
enum class MessageType : uint8_t {
    SubmissionRequest = 0x01,       // sender -> receiver
    AuthenticationRequired = 0x02,  // receiver -> sender (challenge)
    PassphraseProof = 0x03,         // sender -> receiver
    Accepted = 0x04,                // receiver -> sender, raw body follows
    Rejected = 0x05,                // receiver -> sender, connection closes
    Completed = 0x06,               // receiver -> sender, file committed
    BodyComplete = 0x07,            // sender -> receiver, right after the last body byte
};

/**
 * Frame header.
 *
 * Format:
 * - Magic (2 bytes): 0x4D 0x53 ("MS")
 * - Protocol version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (JSON object, `length` bytes)
 */
struct FrameHeader {
    static constexpr uint8_t MAGIC[2] = {0x4D, 0x53};
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_PAYLOAD = 64 * 1024;

    uint8_t version = 0;
    MessageType type = MessageType::SubmissionRequest;
    uint32_t length = 0;
};

struct Frame {
    MessageType type;
    QJsonObject payload;
};

struct SubmissionRequest {
    QString sender_name;
    QString file_name;
    uint64_t size_bytes = 0;
    std::optional<std::vector<uint8_t>> passphrase_proof;
};

struct AuthChallenge {
    std::vector<uint8_t> nonce;
    crypto::Salt salt{};
    crypto::KdfParams kdf{};
};

struct Rejection {
    ErrorCode reason = ErrorCode::ProtocolMismatch;
    QString message;
};

struct Completion {
    QString session_id;
    QString stored_name;
};

/**
 * Largest size a request may declare (2^53 - 1, the JSON-safe integer range).
 */
constexpr uint64_t MAX_DECLARED_SIZE = (uint64_t{1} << 53) - 1;

[[nodiscard]] QByteArray encodeFrame(MessageType type, const QJsonObject& payload);

[[nodiscard]] QByteArray encodeSubmissionRequest(const SubmissionRequest& request);
[[nodiscard]] QByteArray encodeAuthChallenge(const AuthChallenge& challenge);
[[nodiscard]] QByteArray encodePassphraseProof(const std::vector<uint8_t>& proof);
[[nodiscard]] QByteArray encodeAccepted(const QString& session_id);
[[nodiscard]] QByteArray encodeRejected(const Rejection& rejection);
[[nodiscard]] QByteArray encodeCompleted(const Completion& completion);
[[nodiscard]] QByteArray encodeBodyComplete(uint64_t size_bytes);

/**
 * Parse a header. Bad magic, an unknown type or an oversized length are
 * ProtocolMismatch; a different version is ProtocolMismatch too.
 */
[[nodiscard]] Result<FrameHeader, Error> decodeHeader(const QByteArray& data);

/**
 * Remove one complete frame from the front of `buffer`.
 * ok(nullopt) means more bytes are needed; the buffer is left untouched.
 */
[[nodiscard]] Result<std::optional<Frame>, Error> takeFrame(QByteArray& buffer);

/**
 * True while `bytes` could still grow into a BodyComplete frame header.
 * Used to tell the end marker from excess body bytes before a full header
 * has arrived.
 */
[[nodiscard]] bool couldStartBodyComplete(const QByteArray& bytes);

[[nodiscard]] Result<SubmissionRequest, Error> decodeSubmissionRequest(const QJsonObject& payload);
[[nodiscard]] Result<AuthChallenge, Error> decodeAuthChallenge(const QJsonObject& payload);
[[nodiscard]] Result<std::vector<uint8_t>, Error> decodePassphraseProof(const QJsonObject& payload);
[[nodiscard]] Result<QString, Error> decodeAccepted(const QJsonObject& payload);
[[nodiscard]] Result<Rejection, Error> decodeRejected(const QJsonObject& payload);
[[nodiscard]] Result<Completion, Error> decodeCompleted(const QJsonObject& payload);
[[nodiscard]] Result<uint64_t, Error> decodeBodyComplete(const QJsonObject& payload);

} // namespace manuscripts::network
