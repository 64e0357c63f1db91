#include "core/submission.hpp"

namespace manuscripts {

const char* session_state_name(SessionState state) noexcept {
    switch (state) {
        case SessionState::Handshaking: return "Handshaking";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Transferring: return "Transferring";
        case SessionState::Finalizing: return "Finalizing";
        case SessionState::Succeeded: return "Succeeded";
        case SessionState::Failed: return "Failed";
    }
    return "?";
}

} // namespace manuscripts
