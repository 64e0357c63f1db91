#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace manuscripts {

/**
 * ErrorCode - Failure classes shared by every component.
 *
 * Session-scoped codes (ProtocolMismatch .. PersistenceFailure) end a single
 * submission; the rest are configuration or startup failures.
 */
enum class ErrorCode : int {
    ProtocolMismatch = 1,
    AuthenticationFailed = 2,
    SizeExceeded = 3,
    TransportInterrupted = 4,
    Timeout = 5,
    PersistenceFailure = 6,
    AlreadyConfigured = 7,
    DiscoveryUnavailable = 8,
    ListenFailed = 9,
    Internal = 10,
};

/**
 * Error - A failure with its class and a human-readable message.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const = default;
};

/**
 * Stable name used on the wire and in logs (e.g. "SizeExceeded").
 */
[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;

/**
 * Inverse of error_code_name(); nullopt for unknown names.
 */
[[nodiscard]] std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept;

/**
 * True for failures that point at the receiver's environment rather than at
 * one sender (these are surfaced to the operator).
 */
[[nodiscard]] constexpr bool is_receiver_level(ErrorCode code) noexcept {
    return code == ErrorCode::PersistenceFailure || code == ErrorCode::Internal;
}

} // namespace manuscripts
