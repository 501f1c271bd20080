#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <limits>

namespace meshlobby {
namespace proto {
namespace {

using nlohmann::json;

constexpr const char* kDiscover = "player-discovery";
constexpr const char* kDiscoverResponse = "player-discovery-response";
constexpr const char* kHeartbeat = "heartbeat";
constexpr const char* kLeave = "player-left";
constexpr const char* kOffer = "offer";
constexpr const char* kAnswer = "answer";
constexpr const char* kIce = "ice-candidate";
constexpr const char* kStatus = "status-update";

const json& field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) throw DecodeError(std::string("missing field: ") + name);
    return *it;
}

std::string str_field(const json& j, const char* name) {
    const json& v = field(j, name);
    if (!v.is_string()) throw DecodeError(std::string("field is not a string: ") + name);
    return v.get<std::string>();
}

// Optional string; absent and null both read as empty.
std::string opt_str_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) throw DecodeError(std::string("field is not a string: ") + name);
    return it->get<std::string>();
}

bool bool_field(const json& j, const char* name) {
    const json& v = field(j, name);
    if (!v.is_boolean()) throw DecodeError(std::string("field is not a bool: ") + name);
    return v.get<bool>();
}

uint64_t uint_field(const json& j, const char* name, uint64_t max) {
    const json& v = field(j, name);
    if (!v.is_number_unsigned()) {
        throw DecodeError(std::string("field is not an unsigned integer: ") + name);
    }
    uint64_t n = v.get<uint64_t>();
    if (n > max) throw DecodeError(std::string("field out of range: ") + name);
    return n;
}

struct Encoder {
    json operator()(const Discover& m) const {
        return {{"type", kDiscover}, {"playerId", m.peer_id},
                {"playerName", m.name}, {"port", m.reply_port}};
    }
    json operator()(const DiscoverResponse& m) const {
        return {{"type", kDiscoverResponse}, {"playerId", m.peer_id},
                {"playerName", m.name}, {"port", m.reply_port}};
    }
    json operator()(const Heartbeat& m) const {
        return {{"type", kHeartbeat}, {"playerId", m.peer_id}, {"timestamp", m.timestamp}};
    }
    json operator()(const Leave& m) const {
        return {{"type", kLeave}, {"playerId", m.peer_id}};
    }
    json operator()(const Offer& m) const { return relay(kOffer, m.from, m.to, "sdp", m.sdp); }
    json operator()(const Answer& m) const { return relay(kAnswer, m.from, m.to, "sdp", m.sdp); }
    json operator()(const IceCandidate& m) const {
        return relay(kIce, m.from, m.to, "candidate", m.candidate);
    }
    json operator()(const StatusUpdate& m) const {
        json j = {{"type", kStatus}, {"playerId", m.peer_id}, {"micEnabled", m.mic_enabled}};
        if (m.muted) j["isMuted"] = *m.muted;
        return j;
    }

    static json relay(const char* type, const std::string& from, const std::string& to,
                      const char* key, const std::string& payload) {
        json j = {{"type", type}, {"from", from}};
        if (!to.empty()) j["to"] = to;
        j[key] = payload;
        return j;
    }
};

struct TypeName {
    const char* operator()(const Discover&) const { return kDiscover; }
    const char* operator()(const DiscoverResponse&) const { return kDiscoverResponse; }
    const char* operator()(const Heartbeat&) const { return kHeartbeat; }
    const char* operator()(const Leave&) const { return kLeave; }
    const char* operator()(const Offer&) const { return kOffer; }
    const char* operator()(const Answer&) const { return kAnswer; }
    const char* operator()(const IceCandidate&) const { return kIce; }
    const char* operator()(const StatusUpdate&) const { return kStatus; }
};

struct Sender {
    const std::string& operator()(const Discover& m) const { return m.peer_id; }
    const std::string& operator()(const DiscoverResponse& m) const { return m.peer_id; }
    const std::string& operator()(const Heartbeat& m) const { return m.peer_id; }
    const std::string& operator()(const Leave& m) const { return m.peer_id; }
    const std::string& operator()(const Offer& m) const { return m.from; }
    const std::string& operator()(const Answer& m) const { return m.from; }
    const std::string& operator()(const IceCandidate& m) const { return m.from; }
    const std::string& operator()(const StatusUpdate& m) const { return m.peer_id; }
};

} // namespace

std::string encode(const Message& m) {
    // Invalid UTF-8 in user-supplied payloads is replaced rather than thrown.
    return std::visit(Encoder{}, m).dump(-1, ' ', false, json::error_handler_t::replace);
}

Message decode(const std::string& datagram) {
    json j;
    try {
        j = json::parse(datagram);
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed json: ") + e.what());
    }
    if (!j.is_object()) throw DecodeError("message is not an object");

    const std::string type = str_field(j, "type");
    const uint64_t kMaxPort = std::numeric_limits<uint16_t>::max();

    if (type == kDiscover) {
        Discover m;
        m.peer_id = str_field(j, "playerId");
        m.name = str_field(j, "playerName");
        m.reply_port = static_cast<uint16_t>(uint_field(j, "port", kMaxPort));
        return m;
    }
    if (type == kDiscoverResponse) {
        DiscoverResponse m;
        m.peer_id = str_field(j, "playerId");
        m.name = str_field(j, "playerName");
        m.reply_port = static_cast<uint16_t>(uint_field(j, "port", kMaxPort));
        return m;
    }
    if (type == kHeartbeat) {
        Heartbeat m;
        m.peer_id = str_field(j, "playerId");
        m.timestamp = uint_field(j, "timestamp", std::numeric_limits<uint64_t>::max());
        return m;
    }
    if (type == kLeave) {
        Leave m;
        m.peer_id = str_field(j, "playerId");
        return m;
    }
    if (type == kOffer || type == kAnswer) {
        std::string from = str_field(j, "from");
        std::string to = opt_str_field(j, "to");
        std::string sdp = str_field(j, "sdp");
        if (type == kOffer) return Offer{from, to, sdp};
        return Answer{from, to, sdp};
    }
    if (type == kIce) {
        IceCandidate m;
        m.from = str_field(j, "from");
        m.to = opt_str_field(j, "to");
        m.candidate = str_field(j, "candidate");
        return m;
    }
    if (type == kStatus) {
        StatusUpdate m;
        m.peer_id = str_field(j, "playerId");
        m.mic_enabled = bool_field(j, "micEnabled");
        auto it = j.find("isMuted");
        if (it != j.end() && !it->is_null()) {
            if (!it->is_boolean()) throw DecodeError("field is not a bool: isMuted");
            m.muted = it->get<bool>();
        }
        return m;
    }
    throw DecodeError("unknown message type: " + type);
}

const char* type_name(const Message& m) {
    return std::visit(TypeName{}, m);
}

const std::string& sender_id(const Message& m) {
    return std::visit(Sender{}, m);
}

} // namespace proto
} // namespace meshlobby
