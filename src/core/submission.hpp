#pragma once

#include "core/types.hpp"

#include <QMetaType>
#include <QString>
#include <cstdint>

namespace manuscripts {

/**
 * Wire and discovery protocol version. Bumped on breaking changes.
 */
constexpr int PROTOCOL_VERSION = 1;

/**
 * SessionState - Lifecycle of one submission.
 *
 * Handshaking -> Authenticating -> Transferring -> Finalizing -> Succeeded,
 * with Failed reachable from every non-terminal state. Values are ordered
 * along the forward path so "never backward" is a plain comparison.
 */
enum class SessionState : uint8_t {
    Handshaking = 1,
    Authenticating = 2,
    Transferring = 3,
    Finalizing = 4,
    Succeeded = 5,
    Failed = 6,
};

[[nodiscard]] constexpr bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Succeeded || state == SessionState::Failed;
}

/**
 * Whether `from -> to` is a legal edge of the session state machine.
 */
[[nodiscard]] constexpr bool is_forward_transition(SessionState from, SessionState to) noexcept {
    if (is_terminal(from)) return false;
    if (to == SessionState::Failed) return true;
    if (to == SessionState::Succeeded) return from == SessionState::Finalizing;
    return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

[[nodiscard]] const char* session_state_name(SessionState state) noexcept;

/**
 * StoredFile - A committed submission on disk.
 */
struct StoredFile {
    QString final_path;
    QString original_file_name;
    QString sender_name;
    uint64_t size_bytes = 0;
    Timestamp received_at;
};

} // namespace manuscripts

Q_DECLARE_METATYPE(manuscripts::StoredFile)
