#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace meshlobby {
namespace proto {

// One UDP datagram carries one UTF-8 JSON object whose "type" field selects
// the message kind. Field names are camelCase.

struct Discover {
    std::string peer_id;
    std::string name;
    uint16_t reply_port = 0;
};

struct DiscoverResponse {
    std::string peer_id;
    std::string name;
    uint16_t reply_port = 0;
};

struct Heartbeat {
    std::string peer_id;
    uint64_t timestamp = 0; // unix seconds
};

struct Leave {
    std::string peer_id;
};

// Relay payloads; `to` empty means addressed to everyone.
struct Offer {
    std::string from;
    std::string to;
    std::string sdp;
};

struct Answer {
    std::string from;
    std::string to;
    std::string sdp;
};

struct IceCandidate {
    std::string from;
    std::string to;
    std::string candidate;
};

struct StatusUpdate {
    std::string peer_id;
    bool mic_enabled = false;
    std::optional<bool> muted;
};

using Message = std::variant<Discover, DiscoverResponse, Heartbeat, Leave,
                             Offer, Answer, IceCandidate, StatusUpdate>;

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string encode(const Message& m);

// Throws DecodeError on anything that is not a well-formed message.
Message decode(const std::string& datagram);

// Wire "type" value of the message.
const char* type_name(const Message& m);

// Id of the sending peer (peer_id or from).
const std::string& sender_id(const Message& m);

} // namespace proto
} // namespace meshlobby
