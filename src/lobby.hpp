#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "discovery.hpp"
#include "events.hpp"
#include "logger.hpp"
#include "tunnel.hpp"

namespace meshlobby {

struct Session {
    std::string id;
    std::string name;
    std::chrono::system_clock::time_point created_at;
    std::string virtual_ip;
    std::string creator_virtual_ip;

    nlohmann::json to_json() const;
};

struct Member {
    std::string id;
    std::string name;
    bool mic_enabled = false;
    bool is_muted = false;
    std::chrono::system_clock::time_point joined_at;

    nlohmann::json to_json() const;
};

// Sequences tunnel bring-up and discovery into the create/join/leave
// lifecycle and owns the roster. At most one session per instance.
class LobbyManager {
public:
    LobbyManager(TunnelSupervisor& tunnel, PeerDiscovery& discovery,
                 const Config& cfg, Logger& logger);

    // All throw Error(Validation) with a descriptive message.
    static void validate(const std::string& name, const std::string& password,
                         const std::string& player_name, const std::string& rendezvous);
    static void validate_lobby_name(const std::string& name);
    static void validate_password(const std::string& password);
    static void validate_input(const std::string& input, const std::string& field);

    Session create(const std::string& name, const std::string& password,
                   const std::string& player_name, const std::string& rendezvous);
    Session join(const std::string& name, const std::string& password,
                 const std::string& player_name, const std::string& rendezvous);
    void leave();

    // false when the id is already on the roster
    bool add_member(const Member& m);
    void remove_member(const std::string& id);
    void update_mic(const std::string& id, bool enabled);
    void update_muted(const std::string& id, bool muted);
    void clear_members();

    // Updates the local member and announces it when discovery runs.
    void set_local_mic(bool enabled);

    std::vector<Member> members() const; // by join time
    std::optional<Member> member(const std::string& id) const;
    size_t member_count() const;
    std::string local_member_id() const;
    std::optional<Session> current_session() const;
    bool in_lobby() const;

    // Correlates discovery notifications with the roster, then forwards them.
    void on_discovery_event(const Event& ev);
    void set_event_sink(EventSink sink);

private:
    Session bring_up(const std::string& name, const std::string& password,
                     const std::string& player_name, const std::string& rendezvous,
                     bool start_discovery, const char* verb);
    void emit(const Event& ev);
    Event lobby_update() const;

    TunnelSupervisor& tunnel_;
    PeerDiscovery& discovery_;
    Config cfg_;
    Logger& logger_;

    mutable std::mutex session_mu_;
    std::optional<Session> session_;
    std::string local_id_;
    bool busy_ = false;
    std::mutex leave_mu_; // one teardown at a time

    mutable std::mutex roster_mu_;
    std::unordered_map<std::string, Member> roster_;

    std::mutex sink_mu_;
    EventSink sink_;
};

} // namespace meshlobby
