#include "core/errors.hpp"

#include <array>
#include <utility>

namespace manuscripts {
namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 10> kNames{{
    {ErrorCode::ProtocolMismatch, "ProtocolMismatch"},
    {ErrorCode::AuthenticationFailed, "AuthenticationFailed"},
    {ErrorCode::SizeExceeded, "SizeExceeded"},
    {ErrorCode::TransportInterrupted, "TransportInterrupted"},
    {ErrorCode::Timeout, "Timeout"},
    {ErrorCode::PersistenceFailure, "PersistenceFailure"},
    {ErrorCode::AlreadyConfigured, "AlreadyConfigured"},
    {ErrorCode::DiscoveryUnavailable, "DiscoveryUnavailable"},
    {ErrorCode::ListenFailed, "ListenFailed"},
    {ErrorCode::Internal, "Internal"},
}};

} // namespace

const char* error_code_name(ErrorCode code) noexcept {
    for (const auto& [c, name] : kNames) {
        if (c == code) return name;
    }
    return "Internal";
}

std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept {
    for (const auto& [c, n] : kNames) {
        if (name == n) return c;
    }
    return std::nullopt;
}

} // namespace manuscripts
