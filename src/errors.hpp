#pragma once

#include <stdexcept>
#include <string>

namespace meshlobby {

enum class ErrorKind {
    Validation,
    Network,
    Process,
    Timeout,
    AlreadyRunning,
    AlreadyInLobby,
    NotInLobby,
    PlayerNotFound,
    PeerNotFound,
    Config
};

const char* error_kind_str(ErrorKind kind);

// Single exception type for every failure surfaced to callers.
// what() is "<kind>: <detail>".
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    // Tunnel bring-up failures (timeouts and double starts included) are
    // reported to callers as one family.
    bool is_network() const;

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace meshlobby
