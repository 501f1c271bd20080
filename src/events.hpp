#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace meshlobby {

// Named notification handed to the outer layer (console, UI bridge).
struct Event {
    std::string name;
    nlohmann::json payload;
};

using EventSink = std::function<void(const Event&)>;

namespace events {

constexpr const char* kPlayerJoined = "player-joined";
constexpr const char* kPlayerLeft = "player-left";
constexpr const char* kSignaling = "webrtc-signaling";
constexpr const char* kStatusUpdate = "player-status-update";
constexpr const char* kNetworkStatus = "network-status-change";
constexpr const char* kLobbyUpdate = "lobby-update";
constexpr const char* kError = "error";

Event player_joined(const std::string& peer_id, const std::string& name);
Event player_left(const std::string& peer_id);
Event signaling(const std::string& type,
                const std::string& from,
                const std::string& field,
                const std::string& payload);
Event status_update(const std::string& peer_id, bool mic_enabled, std::optional<bool> muted);
Event network_status(const std::string& status,
                     const std::string& virtual_ip = {},
                     const std::string& reason = {});
Event error(const std::string& message);

// One-line human rendering used by the console.
std::string describe(const Event& ev);

} // namespace events
} // namespace meshlobby
