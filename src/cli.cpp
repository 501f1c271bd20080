#include "cli.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <cctype>
#include <cerrno>
#include <poll.h>
#include <sstream>
#include <termios.h>
#include <unistd.h>

namespace meshlobby {
namespace {

constexpr const char* kPrompt = "lobby> ";
constexpr int kInputPollMs = 200;

void print_help(Console& c) {
    c.println("commands:");
    c.println("  help                                   show this help");
    c.println("  name <player>                          set and save the player name");
    c.println("  create <lobby> <password> [peer]       create a lobby (quote names with spaces)");
    c.println("  join <lobby> <password> [peer]         join a lobby and start discovery");
    c.println("  leave                                  leave the current lobby");
    c.println("  status                                 tunnel and lobby status");
    c.println("  members                                lobby roster");
    c.println("  peers                                  peers found by discovery");
    c.println("  overlay-peers                          peer addresses known to the daemon");
    c.println("  mic on|off                             set local microphone flag");
    c.println("  mute <member_id> on|off                mute or unmute a member");
    c.println("  signal <offer|answer|ice> <peer|*> <payload>  relay a signaling payload");
    c.println("  quit                                   leave and exit");
}

bool parse_on_off(const std::string& s, bool& out) {
    std::string v = to_lower(s);
    if (v == "on" || v == "true" || v == "1") { out = true; return true; }
    if (v == "off" || v == "false" || v == "0") { out = false; return true; }
    return false;
}

// Waits for one byte of input; 0 on timeout, -1 on EOF/error.
int read_char(char& ch) {
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, kInputPollMs);
    if (rc == 0) return 0;
    if (rc < 0) return errno == EINTR ? 0 : -1;
    ssize_t n = ::read(STDIN_FILENO, &ch, 1);
    return n == 1 ? 1 : -1;
}

bool read_line(Console& c, std::string& out, const std::atomic<bool>& stop) {
    out.clear();
    const bool tty = ::isatty(STDIN_FILENO) != 0;

    termios orig{};
    bool raw_mode = false;
    if (tty && ::tcgetattr(STDIN_FILENO, &orig) == 0) {
        termios raw = orig;
        raw.c_lflag &= static_cast<unsigned int>(~(ICANON | ECHO));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        raw_mode = ::tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
    }
    auto restore = [&]() {
        if (raw_mode) ::tcsetattr(STDIN_FILENO, TCSANOW, &orig);
    };

    char ch = 0;
    while (true) {
        if (stop.load()) {
            restore();
            return false;
        }
        int r = read_char(ch);
        if (r == 0) continue;
        if (r < 0) {
            restore();
            return !out.empty();
        }
        if (ch == '\r' || ch == '\n') {
            if (raw_mode) c.print("\n");
            break;
        }
        if (!raw_mode) {
            out.push_back(ch);
            continue;
        }
        if (ch == 0x7f || ch == '\b') {
            if (!out.empty()) {
                out.pop_back();
                c.print("\b \b");
            }
            continue;
        }
        if (ch == 0x03) {
            c.print("^C\n");
            restore();
            return false;
        }
        // UTF-8 continuation bytes pass through so CJK names can be typed.
        if (std::isprint(static_cast<unsigned char>(ch)) || (static_cast<unsigned char>(ch) & 0x80)) {
            out.push_back(ch);
            c.print(std::string(1, ch));
        }
    }
    restore();
    return true;
}

std::string yes_no(bool b) {
    return b ? "on" : "off";
}

} // namespace

std::vector<std::string> tokenize_command(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have = true;
            continue;
        }
        if (!in_quotes && std::isspace(static_cast<unsigned char>(c))) {
            if (have) {
                out.push_back(cur);
                cur.clear();
                have = false;
            }
            continue;
        }
        cur.push_back(c);
        have = true;
    }
    if (have) out.push_back(cur);
    return out;
}

Cli::Cli(boost::asio::io_context& io, LobbyManager& lobby, TunnelSupervisor& tunnel,
         PeerDiscovery& discovery, Config& cfg, const std::string& cfg_path, Console& console)
    : io_(io),
      lobby_(lobby),
      tunnel_(tunnel),
      discovery_(discovery),
      cfg_(cfg),
      cfg_path_(cfg_path),
      console_(console) {}

void Cli::start() {
    console_.set_prompt(kPrompt);
    th_ = std::thread([this]{ run(); });
}

void Cli::stop() {
    stop_.store(true);
}

void Cli::join() {
    if (th_.joinable()) th_.join();
}

void Cli::run() {
    print_help(console_);

    std::string line;
    while (!stop_.load()) {
        console_.print(kPrompt);
        if (!read_line(console_, line, stop_)) {
            if (!stop_.load()) shutdown();
            break;
        }
        if (!execute(line)) break;
    }
}

void Cli::shutdown() {
    stop_.store(true);
    if (lobby_.in_lobby()) {
        try {
            cmd_leave();
        } catch (const Error& e) {
            console_.println(std::string("error: ") + e.what());
        }
    }
    boost::asio::post(io_, [this]{ io_.stop(); });
}

bool Cli::execute(const std::string& line) {
    auto args = tokenize_command(trim(line));
    if (args.empty()) return true;
    const std::string cmd = to_lower(args[0]);

    try {
        if (cmd == "help" || cmd == "h" || cmd == "?") {
            print_help(console_);
        } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            shutdown();
            return false;
        } else if (cmd == "name") {
            cmd_name(args);
        } else if (cmd == "create") {
            cmd_create_or_join(args, false);
        } else if (cmd == "join") {
            cmd_create_or_join(args, true);
        } else if (cmd == "leave") {
            cmd_leave();
        } else if (cmd == "status") {
            cmd_status();
        } else if (cmd == "members") {
            cmd_members();
        } else if (cmd == "peers") {
            cmd_peers();
        } else if (cmd == "overlay-peers") {
            cmd_overlay_peers();
        } else if (cmd == "mic") {
            cmd_mic(args);
        } else if (cmd == "mute") {
            cmd_mute(args);
        } else if (cmd == "signal") {
            cmd_signal(args);
        } else {
            console_.println("unknown command: " + args[0]);
        }
    } catch (const Error& e) {
        console_.println(std::string("error: ") + e.what());
        if (e.is_network()) {
            console_.println("  check the rendezvous peer and that the overlay daemon can create its adapter");
        }
    }
    return true;
}

void Cli::cmd_name(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        console_.println("player name: " + (cfg_.player_name.empty() ? "(unset)" : cfg_.player_name));
        return;
    }
    std::string name;
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) name += " ";
        name += args[i];
    }
    LobbyManager::validate_input(name, "player name");
    cfg_.player_name = trim(name);

    std::string err;
    if (!cfg_path_.empty() && !save_config(cfg_path_, cfg_, err)) {
        console_.println("name set, but not saved: " + err);
        return;
    }
    console_.println("player name set to " + cfg_.player_name);
}

void Cli::cmd_create_or_join(const std::vector<std::string>& args, bool join) {
    if (args.size() < 3 || args.size() > 4) {
        console_.println(std::string("usage: ") + (join ? "join" : "create") +
                         " <lobby> <password> [rendezvous]");
        return;
    }
    if (cfg_.player_name.empty()) {
        console_.println("set a player name first: name <player>");
        return;
    }
    const std::string peer = args.size() == 4 ? args[3] : cfg_.rendezvous;
    console_.println(std::string(join ? "joining" : "creating") + " lobby '" + args[1] +
                     "' via " + peer + " ...");

    Session s = join ? lobby_.join(args[1], args[2], cfg_.player_name, peer)
                     : lobby_.create(args[1], args[2], cfg_.player_name, peer);

    console_.println("in lobby '" + s.name + "' as " + cfg_.player_name +
                     " virtual_ip=" + s.virtual_ip +
                     " signaling=" + s.creator_virtual_ip + ":" + std::to_string(cfg_.signaling_port));
    if (args.size() == 4 && args[3] != cfg_.rendezvous) {
        cfg_.rendezvous = args[3];
        std::string err;
        if (!cfg_path_.empty() && !save_config(cfg_path_, cfg_, err)) {
            console_.println("rendezvous not saved: " + err);
        }
    }
}

void Cli::cmd_leave() {
    lobby_.leave();
    console_.println("left lobby");
}

void Cli::cmd_status() {
    TunnelState st = tunnel_.check_connection();
    std::ostringstream oss;
    oss << "tunnel=" << phase_str(st.phase);
    if (!st.detail.empty()) oss << " (" << st.detail << ")";
    auto inst = tunnel_.instance_name();
    if (!inst.empty()) oss << " instance=" << inst;
    console_.println(oss.str());

    auto s = lobby_.current_session();
    if (!s) {
        console_.println("lobby=(none)");
    } else {
        console_.println("lobby=" + s->name + " id=" + s->id + " ip=" + s->virtual_ip +
                         " created=" + format_utc(s->created_at) +
                         " members=" + std::to_string(lobby_.member_count()));
    }
    if (discovery_.is_running()) {
        console_.println("discovery port=" + std::to_string(discovery_.bound_port()) +
                         " (nominal " + std::to_string(discovery_.nominal_port()) + ")" +
                         " broadcast=" + discovery_.broadcast_address() +
                         " peers=" + std::to_string(discovery_.peer_count()));
    } else {
        console_.println("discovery=off");
    }
}

void Cli::cmd_members() {
    auto members = lobby_.members();
    console_.println("Members (" + std::to_string(members.size()) + "):");
    if (members.empty()) {
        console_.println("  (none)");
        return;
    }
    const std::string me = lobby_.local_member_id();
    for (const auto& m : members) {
        console_.println("  - " + m.name + " [" + m.id + "]" + (m.id == me ? " (you)" : "") +
                         " mic=" + yes_no(m.mic_enabled) + " muted=" + yes_no(m.is_muted));
    }
}

void Cli::cmd_peers() {
    auto peers = discovery_.peers();
    console_.println("Discovered peers (" + std::to_string(peers.size()) + "):");
    if (peers.empty()) {
        console_.println("  (none)");
        return;
    }
    uint64_t now = now_ms();
    for (const auto& p : peers) {
        uint64_t age = now > p.last_seen_ms ? (now - p.last_seen_ms) / 1000 : 0;
        console_.println("  - " + p.name + " [" + p.id + "] @ " + p.endpoint.address().to_string() +
                         ":" + std::to_string(p.endpoint.port()) +
                         " seen " + std::to_string(age) + "s ago");
    }
}

void Cli::cmd_overlay_peers() {
    auto addrs = tunnel_.list_overlay_peers();
    console_.println("Overlay peers (" + std::to_string(addrs.size()) + "):");
    if (addrs.empty()) console_.println("  (none)");
    for (const auto& a : addrs) console_.println("  - " + a);
}

void Cli::cmd_mic(const std::vector<std::string>& args) {
    bool on = false;
    if (args.size() != 2 || !parse_on_off(args[1], on)) {
        console_.println("usage: mic on|off");
        return;
    }
    lobby_.set_local_mic(on);
    console_.println("mic " + yes_no(on));
}

void Cli::cmd_mute(const std::vector<std::string>& args) {
    bool on = false;
    if (args.size() != 3 || !parse_on_off(args[2], on)) {
        console_.println("usage: mute <member_id> on|off");
        return;
    }
    lobby_.update_muted(args[1], on);
    console_.println("member " + args[1] + " muted=" + yes_no(on));
}

void Cli::cmd_signal(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        console_.println("usage: signal <offer|answer|ice> <peer_id|*> <payload>");
        return;
    }
    std::string kind = to_lower(args[1]);
    if (kind == "ice") kind = "ice-candidate";
    const std::string to = args[2] == "*" ? std::string() : args[2];
    std::string payload;
    for (size_t i = 3; i < args.size(); ++i) {
        if (i > 3) payload += " ";
        payload += args[i];
    }
    discovery_.send_signal(kind, to, payload);
    console_.println("sent " + kind + (to.empty() ? " to all" : " to " + to));
}

} // namespace meshlobby
