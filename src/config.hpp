#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meshlobby {

struct Config {
    // Identity / session
    std::string player_name;
    std::string rendezvous = "tcp://public.easytier.top:11010";
    std::string namespace_prefix = "MeshLobby-";

    // Logging
    std::string log_file = "meshlobby.log";
    std::string log_level = "info";
    bool cli_enabled = true;

    // Tunnel daemon
    std::string daemon_path = "easytier-core";
    std::string cli_path = "easytier-cli";
    std::string work_dir;                 // empty: directory of daemon_path
    std::string instance_prefix = "meshlobby";
    std::vector<std::string> native_deps; // files that must sit beside the daemon

    // Tunnel timers
    uint32_t address_timeout_ms = 30000;
    uint32_t address_poll_ms = 100;
    uint32_t cli_poll_every_ms = 3000;
    uint32_t cli_poll_attempts = 10;
    uint32_t cli_timeout_ms = 5000;
    uint32_t exit_check_ms = 1000;
    uint32_t stop_grace_ms = 3000;
    uint32_t dir_remove_attempts = 3;
    uint32_t dir_remove_backoff_ms = 300;

    // Adapter cleanup on stop
    bool adapter_cleanup = true;
    std::string adapter_prefix = "tun";
    std::string sysfs_net_dir = "/sys/class/net";
    std::string ip_tool = "ip";

    // Discovery
    std::string bind_ip = "0.0.0.0"; // IPv4
    uint16_t discovery_port = 47777;
    uint16_t discovery_port_span = 100;
    std::string broadcast_address = "auto";
    uint32_t discover_fast_ms = 1000;
    uint32_t discover_fast_count = 10;
    uint32_t discover_slow_ms = 5000;
    uint32_t heartbeat_ms = 30000;
    uint32_t peer_timeout_ms = 90000;
    uint32_t join_settle_ms = 200;

    // Rendezvous signaling endpoint inside the overlay
    std::string signaling_address = "10.126.126.1";
    uint16_t signaling_port = 8445;
    bool discovery_on_create = false;
};

bool load_config(const std::string& path, Config& out, std::string& err);
bool save_config(const std::string& path, const Config& cfg, std::string& err);

} // namespace meshlobby
