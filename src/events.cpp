#include "events.hpp"

namespace meshlobby {
namespace events {

Event player_joined(const std::string& peer_id, const std::string& name) {
    return Event{kPlayerJoined, {{"playerId", peer_id}, {"playerName", name}}};
}

Event player_left(const std::string& peer_id) {
    return Event{kPlayerLeft, {{"playerId", peer_id}}};
}

Event signaling(const std::string& type,
                const std::string& from,
                const std::string& field,
                const std::string& payload) {
    nlohmann::json j = {{"type", type}, {"from", from}};
    j[field] = payload;
    return Event{kSignaling, std::move(j)};
}

Event status_update(const std::string& peer_id, bool mic_enabled, std::optional<bool> muted) {
    nlohmann::json j = {{"playerId", peer_id}, {"micEnabled", mic_enabled}};
    if (muted) j["isMuted"] = *muted;
    return Event{kStatusUpdate, std::move(j)};
}

Event network_status(const std::string& status,
                     const std::string& virtual_ip,
                     const std::string& reason) {
    nlohmann::json j = {{"status", status}};
    if (!virtual_ip.empty()) j["virtualIp"] = virtual_ip;
    if (!reason.empty()) j["reason"] = reason;
    return Event{kNetworkStatus, std::move(j)};
}

Event error(const std::string& message) {
    return Event{kError, {{"message", message}}};
}

std::string describe(const Event& ev) {
    return "[" + ev.name + "] " + ev.payload.dump();
}

} // namespace events
} // namespace meshlobby
