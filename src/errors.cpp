#include "errors.hpp"

namespace meshlobby {

const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation error";
        case ErrorKind::Network: return "network error";
        case ErrorKind::Process: return "process error";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::AlreadyRunning: return "already running";
        case ErrorKind::AlreadyInLobby: return "already in lobby";
        case ErrorKind::NotInLobby: return "not in lobby";
        case ErrorKind::PlayerNotFound: return "player not found";
        case ErrorKind::PeerNotFound: return "peer not found";
        case ErrorKind::Config: return "config error";
        default: return "error";
    }
}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail.empty() ? std::string(error_kind_str(kind))
                                        : std::string(error_kind_str(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

bool Error::is_network() const {
    return kind_ == ErrorKind::Network ||
           kind_ == ErrorKind::Timeout ||
           kind_ == ErrorKind::AlreadyRunning;
}

} // namespace meshlobby
