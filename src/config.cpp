#include "config.hpp"

#include "util.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace meshlobby {
namespace {

bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

uint16_t parse_u16(const std::string& s) {
    unsigned long v = std::stoul(s);
    if (v > std::numeric_limits<uint16_t>::max()) throw std::out_of_range("value exceeds 65535");
    return static_cast<uint16_t>(v);
}

uint32_t parse_u32(const std::string& s) {
    unsigned long long v = std::stoull(s);
    if (v > std::numeric_limits<uint32_t>::max()) throw std::out_of_range("value exceeds u32");
    return static_cast<uint32_t>(v);
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& it : items) {
        if (!out.empty()) out += ",";
        out += it;
    }
    return out;
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        auto set_bool = [&](bool& dst) {
            bool b = false;
            if (!parse_bool(val, b)) {
                err = "bad config value at line " + std::to_string(lineno) + ": invalid bool";
                return false;
            }
            dst = b;
            return true;
        };

        try {
            if (key == "player_name") out.player_name = val;
            else if (key == "rendezvous") out.rendezvous = val;
            else if (key == "namespace_prefix") out.namespace_prefix = val;

            else if (key == "log_file") out.log_file = val;
            else if (key == "log_level") out.log_level = val;
            else if (key == "cli_enabled") { if (!set_bool(out.cli_enabled)) return false; }

            else if (key == "daemon_path") out.daemon_path = val;
            else if (key == "cli_path") out.cli_path = val;
            else if (key == "work_dir") out.work_dir = val;
            else if (key == "instance_prefix") out.instance_prefix = val;
            else if (key == "native_deps") out.native_deps = split_list(val);

            else if (key == "address_timeout_ms") out.address_timeout_ms = parse_u32(val);
            else if (key == "address_poll_ms") out.address_poll_ms = parse_u32(val);
            else if (key == "cli_poll_every_ms") out.cli_poll_every_ms = parse_u32(val);
            else if (key == "cli_poll_attempts") out.cli_poll_attempts = parse_u32(val);
            else if (key == "cli_timeout_ms") out.cli_timeout_ms = parse_u32(val);
            else if (key == "exit_check_ms") out.exit_check_ms = parse_u32(val);
            else if (key == "stop_grace_ms") out.stop_grace_ms = parse_u32(val);
            else if (key == "dir_remove_attempts") out.dir_remove_attempts = parse_u32(val);
            else if (key == "dir_remove_backoff_ms") out.dir_remove_backoff_ms = parse_u32(val);

            else if (key == "adapter_cleanup") { if (!set_bool(out.adapter_cleanup)) return false; }
            else if (key == "adapter_prefix") out.adapter_prefix = val;
            else if (key == "sysfs_net_dir") out.sysfs_net_dir = val;
            else if (key == "ip_tool") out.ip_tool = val;

            else if (key == "bind_ip") out.bind_ip = val;
            else if (key == "discovery_port") out.discovery_port = parse_u16(val);
            else if (key == "discovery_port_span") out.discovery_port_span = parse_u16(val);
            else if (key == "broadcast_address") out.broadcast_address = val;
            else if (key == "discover_fast_ms") out.discover_fast_ms = parse_u32(val);
            else if (key == "discover_fast_count") out.discover_fast_count = parse_u32(val);
            else if (key == "discover_slow_ms") out.discover_slow_ms = parse_u32(val);
            else if (key == "heartbeat_ms") out.heartbeat_ms = parse_u32(val);
            else if (key == "peer_timeout_ms") out.peer_timeout_ms = parse_u32(val);
            else if (key == "join_settle_ms") out.join_settle_ms = parse_u32(val);

            else if (key == "signaling_address") out.signaling_address = val;
            else if (key == "signaling_port") out.signaling_port = parse_u16(val);
            else if (key == "discovery_on_create") { if (!set_bool(out.discovery_on_create)) return false; }
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + e.what();
            return false;
        }
    }

    return true;
}

bool save_config(const std::string& path, const Config& cfg, std::string& err) {
    std::ostringstream o;
    o << "# meshlobby configuration\n";
    o << "player_name = " << cfg.player_name << "\n";
    o << "rendezvous = " << cfg.rendezvous << "\n";
    o << "namespace_prefix = " << cfg.namespace_prefix << "\n";
    o << "\n# logging\n";
    o << "log_file = " << cfg.log_file << "\n";
    o << "log_level = " << cfg.log_level << "\n";
    o << "cli_enabled = " << (cfg.cli_enabled ? "true" : "false") << "\n";
    o << "\n# tunnel daemon\n";
    o << "daemon_path = " << cfg.daemon_path << "\n";
    o << "cli_path = " << cfg.cli_path << "\n";
    o << "work_dir = " << cfg.work_dir << "\n";
    o << "instance_prefix = " << cfg.instance_prefix << "\n";
    o << "native_deps = " << join_list(cfg.native_deps) << "\n";
    o << "address_timeout_ms = " << cfg.address_timeout_ms << "\n";
    o << "address_poll_ms = " << cfg.address_poll_ms << "\n";
    o << "cli_poll_every_ms = " << cfg.cli_poll_every_ms << "\n";
    o << "cli_poll_attempts = " << cfg.cli_poll_attempts << "\n";
    o << "cli_timeout_ms = " << cfg.cli_timeout_ms << "\n";
    o << "exit_check_ms = " << cfg.exit_check_ms << "\n";
    o << "stop_grace_ms = " << cfg.stop_grace_ms << "\n";
    o << "dir_remove_attempts = " << cfg.dir_remove_attempts << "\n";
    o << "dir_remove_backoff_ms = " << cfg.dir_remove_backoff_ms << "\n";
    o << "adapter_cleanup = " << (cfg.adapter_cleanup ? "true" : "false") << "\n";
    o << "adapter_prefix = " << cfg.adapter_prefix << "\n";
    o << "sysfs_net_dir = " << cfg.sysfs_net_dir << "\n";
    o << "ip_tool = " << cfg.ip_tool << "\n";
    o << "\n# discovery\n";
    o << "bind_ip = " << cfg.bind_ip << "\n";
    o << "discovery_port = " << cfg.discovery_port << "\n";
    o << "discovery_port_span = " << cfg.discovery_port_span << "\n";
    o << "broadcast_address = " << cfg.broadcast_address << "\n";
    o << "discover_fast_ms = " << cfg.discover_fast_ms << "\n";
    o << "discover_fast_count = " << cfg.discover_fast_count << "\n";
    o << "discover_slow_ms = " << cfg.discover_slow_ms << "\n";
    o << "heartbeat_ms = " << cfg.heartbeat_ms << "\n";
    o << "peer_timeout_ms = " << cfg.peer_timeout_ms << "\n";
    o << "join_settle_ms = " << cfg.join_settle_ms << "\n";
    o << "\n# session\n";
    o << "signaling_address = " << cfg.signaling_address << "\n";
    o << "signaling_port = " << cfg.signaling_port << "\n";
    o << "discovery_on_create = " << (cfg.discovery_on_create ? "true" : "false") << "\n";

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        err = "failed to write config: " + path;
        return false;
    }
    out << o.str();
    if (!out.good()) {
        err = "failed to write config: " + path;
        return false;
    }
    return true;
}

} // namespace meshlobby
