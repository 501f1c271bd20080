/**
 * @file lobby_tests.cpp
 * @brief Lobby validation, lifecycle and roster tests
 *
 * The tunnel runs a scripted daemon that reports a fixed address; discovery
 * binds to loopback.
 */

#include "test_harness.hpp"

#include "discovery.hpp"
#include "lobby.hpp"
#include "logger.hpp"
#include "tunnel.hpp"
#include "util.hpp"

#include <unistd.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace meshlobby;

namespace {

uint16_t test_base_port() {
    static uint16_t next = static_cast<uint16_t>(25000 + (::getpid() % 4000) * 2);
    uint16_t p = next;
    next = static_cast<uint16_t>(next + 10);
    return p;
}

// Tunnel + discovery + lobby wired the way main() wires them.
struct Stack {
    IoThread io;
    TempDir dir;
    Config cfg;
    Logger logger;
    std::unique_ptr<TunnelSupervisor> tunnel;
    std::unique_ptr<PeerDiscovery> discovery;
    std::unique_ptr<LobbyManager> lobby;

    std::mutex mu;
    std::vector<Event> events;

    explicit Stack(uint16_t port_span = 5) {
        cfg.daemon_path = dir.write_script("fake-daemon",
            "echo 'INFO dhcp: virtual ip 10.126.126.5/24'\nexec sleep 30\n");
        cfg.cli_path = dir.write_script("fake-cli", "exit 0\n");
        cfg.work_dir = dir.path();
        cfg.address_timeout_ms = 3000;
        cfg.address_poll_ms = 20;
        cfg.cli_poll_every_ms = 1000;
        cfg.exit_check_ms = 50;
        cfg.stop_grace_ms = 500;
        cfg.adapter_cleanup = false;
        cfg.bind_ip = "127.0.0.1";
        cfg.broadcast_address = "127.0.0.1";
        cfg.discovery_port = test_base_port();
        cfg.discovery_port_span = port_span;
        cfg.discover_fast_ms = 60000;
        cfg.heartbeat_ms = 600000;
        cfg.join_settle_ms = 20;
        logger.set_level(LogLevel::ERROR);

        tunnel = std::make_unique<TunnelSupervisor>(io.io(), cfg, logger);
        discovery = std::make_unique<PeerDiscovery>(io.io(), cfg, logger);
        lobby = std::make_unique<LobbyManager>(*tunnel, *discovery, cfg, logger);
        discovery->set_event_sink([this](const Event& ev) { lobby->on_discovery_event(ev); });
        lobby->set_event_sink([this](const Event& ev) {
            std::lock_guard<std::mutex> lk(mu);
            events.push_back(ev);
        });
    }

    ~Stack() {
        if (lobby->in_lobby()) {
            try {
                lobby->leave();
            } catch (const Error& e) {
                printf("  leave during teardown: %s\n", e.what());
            }
        }
    }

    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lk(mu);
        size_t n = 0;
        for (const auto& e : events) {
            if (e.name == name) n++;
        }
        return n;
    }

    Event last(const std::string& name) {
        std::lock_guard<std::mutex> lk(mu);
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->name == name) return *it;
        }
        return Event{};
    }
};

bool name_ok(const std::string& s) {
    try {
        LobbyManager::validate_lobby_name(s);
        return true;
    } catch (const Error&) {
        return false;
    }
}

bool password_ok(const std::string& s) {
    try {
        LobbyManager::validate_password(s);
        return true;
    } catch (const Error&) {
        return false;
    }
}

} // namespace

TEST(lobby_name_rules) {
    ASSERT_TRUE(name_ok("Test Lobby"));
    ASSERT_TRUE(name_ok("  abcd  "));
    ASSERT_TRUE(name_ok("team_one-2"));
    ASSERT_TRUE(name_ok("\xE6\xB8\xB8\xE6\x88\x8F\xE5\xA4\xA7\xE5\x8E\x85")); // 4 CJK ideographs
    ASSERT_TRUE(name_ok("Caf\xC3\xA9 Room"));
    ASSERT_TRUE(name_ok(std::string(32, 'a')));

    ASSERT_FALSE(name_ok("abc"));
    ASSERT_FALSE(name_ok("      "));
    ASSERT_FALSE(name_ok(std::string(33, 'a')));
    ASSERT_FALSE(name_ok("____"));
    ASSERT_FALSE(name_ok("room!"));
    ASSERT_FALSE(name_ok("a\xC3\x97" "bcd"));  // multiplication sign
    ASSERT_FALSE(name_ok("abc\xFF"));
}

TEST(password_rules) {
    ASSERT_TRUE(password_ok("pass1234"));
    ASSERT_TRUE(password_ok("  pass1234  "));
    ASSERT_TRUE(password_ok(std::string(31, 'x') + "1"));

    ASSERT_FALSE(password_ok("pa1"));
    ASSERT_FALSE(password_ok("password"));
    ASSERT_FALSE(password_ok("12345678"));
    ASSERT_FALSE(password_ok(std::string(32, 'x') + "1"));
}

TEST(input_rules) {
    ASSERT_THROWS_KIND(LobbyManager::validate_input(" \t ", "player name"), ErrorKind::Validation);
    LobbyManager::validate_input("Alice", "player name");
    ASSERT_THROWS_KIND(LobbyManager::validate("Test Lobby", "pass1234", "Alice", "   "),
                       ErrorKind::Validation);
}

TEST(invalid_create_starts_nothing) {
    Stack s;
    ASSERT_THROWS_KIND(s.lobby->create("ab", "pass1234", "Alice", "tcp://node:11010"),
                       ErrorKind::Validation);
    ASSERT_FALSE(s.lobby->in_lobby());
    ASSERT_FALSE(s.tunnel->is_running());
    ASSERT_EQ(s.tunnel->check_connection().phase, TunnelState::Phase::Idle);
}

TEST(create_then_leave) {
    Stack s;
    Session sess = s.lobby->create("Test Lobby", "pass1234", "Alice", "tcp://node:11010");
    ASSERT_STREQ(sess.virtual_ip, "10.126.126.5");
    ASSERT_STREQ(sess.name, "Test Lobby");
    ASSERT_STREQ(sess.creator_virtual_ip, s.cfg.signaling_address);
    ASSERT_TRUE(s.lobby->in_lobby());
    ASSERT_TRUE(s.tunnel->is_running());
    ASSERT_FALSE(s.discovery->is_running());

    auto members = s.lobby->members();
    ASSERT_EQ(members.size(), static_cast<size_t>(1));
    ASSERT_STREQ(members[0].name, "Alice");
    ASSERT_STREQ(members[0].id, s.lobby->local_member_id());

    auto j = sess.to_json();
    ASSERT_TRUE(j.contains("createdAt"));
    ASSERT_STREQ(j["virtualIp"].get<std::string>(), "10.126.126.5");

    ASSERT_THROWS_KIND(s.lobby->create("Other Lobby", "pass1234", "Alice", "tcp://node:11010"),
                       ErrorKind::AlreadyInLobby);
    ASSERT_THROWS_KIND(s.lobby->join("x", "y", "", ""), ErrorKind::AlreadyInLobby);
    ASSERT_STREQ(s.lobby->current_session()->id, sess.id);

    s.lobby->leave();
    ASSERT_FALSE(s.lobby->in_lobby());
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(0));
    ASSERT_FALSE(s.tunnel->is_running());
    ASSERT_THROWS_KIND(s.lobby->leave(), ErrorKind::NotInLobby);

    ASSERT_EQ(s.count(events::kLobbyUpdate), static_cast<size_t>(2));
    ASSERT_FALSE(s.last(events::kLobbyUpdate).payload["inLobby"].get<bool>());
}

TEST(join_starts_discovery_and_tracks_peers) {
    Stack s;
    s.lobby->join("Test Lobby", "pass1234", "Alice", "tcp://node:11010");
    ASSERT_TRUE(s.discovery->is_running());
    ASSERT_STREQ(s.discovery->local_id(), s.lobby->local_member_id());

    const udp::endpoint from(boost::asio::ip::make_address_v4("127.0.0.1"), 50001);
    s.discovery->handle_message(proto::Discover{"peer-b", "Bob", 50001}, from, now_ms());
    ASSERT_TRUE(wait_until([&] {
        return s.lobby->member_count() == 2 && s.count(events::kPlayerJoined) == 1;
    }, 2000));

    auto members = s.lobby->members();
    ASSERT_STREQ(members[0].name, "Alice");
    ASSERT_STREQ(members[1].name, "Bob");

    s.discovery->handle_message(proto::StatusUpdate{"peer-b", true, true}, from, now_ms());
    auto bob = s.lobby->member("peer-b");
    ASSERT_TRUE(bob.has_value());
    ASSERT_TRUE(bob->mic_enabled);
    ASSERT_TRUE(bob->is_muted);

    s.discovery->handle_message(proto::Leave{"peer-b"}, from, now_ms());
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(1));
    ASSERT_EQ(s.count(events::kPlayerLeft), static_cast<size_t>(1));

    s.lobby->set_local_mic(true);
    ASSERT_TRUE(s.lobby->member(s.lobby->local_member_id())->mic_enabled);

    s.lobby->leave();
    ASSERT_FALSE(s.discovery->is_running());
}

TEST(join_rolls_back_when_discovery_cannot_bind) {
    Stack s(0);
    boost::asio::io_context raw_io;
    udp::socket blocker(raw_io, udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"),
                                              s.cfg.discovery_port));

    ASSERT_THROWS_KIND(s.lobby->join("Test Lobby", "pass1234", "Alice", "tcp://node:11010"),
                       ErrorKind::Network);
    ASSERT_FALSE(s.lobby->in_lobby());
    ASSERT_FALSE(s.tunnel->is_running());
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(0));
    ASSERT_EQ(s.count(events::kLobbyUpdate), static_cast<size_t>(0));
}

TEST(concurrent_leave_tears_down_once) {
    Stack s;
    s.lobby->join("Test Lobby", "pass1234", "Alice", "tcp://node:11010");

    std::atomic<int> left{0};
    std::atomic<int> not_in_lobby{0};
    auto leave = [&] {
        try {
            s.lobby->leave();
            left++;
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::NotInLobby) not_in_lobby++;
        }
    };
    std::thread a(leave);
    std::thread b(leave);
    a.join();
    b.join();

    ASSERT_EQ(left.load(), 1);
    ASSERT_EQ(not_in_lobby.load(), 1);
    ASSERT_FALSE(s.tunnel->is_running());
    ASSERT_FALSE(s.discovery->is_running());
    ASSERT_EQ(s.count(events::kLobbyUpdate), static_cast<size_t>(2));
}

TEST(bring_up_failures_are_network_family) {
    Stack s(0);
    boost::asio::io_context raw_io;
    udp::socket blocker(raw_io, udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"),
                                              s.cfg.discovery_port));
    try {
        s.lobby->join("Test Lobby", "pass1234", "Alice", "tcp://node:11010");
        ASSERT_TRUE(false);
    } catch (const Error& e) {
        ASSERT_TRUE(e.is_network());
    }

    ASSERT_TRUE(Error(ErrorKind::Timeout, "no address").is_network());
    ASSERT_TRUE(Error(ErrorKind::AlreadyRunning, "").is_network());
    ASSERT_FALSE(Error(ErrorKind::Validation, "bad name").is_network());
    ASSERT_FALSE(Error(ErrorKind::NotInLobby, "").is_network());
    ASSERT_STREQ(Error(ErrorKind::Timeout, "no address").what(), "timeout: no address");
}

TEST(roster_mutations) {
    Stack s;
    ASSERT_THROWS_KIND(s.lobby->set_local_mic(true), ErrorKind::NotInLobby);

    Member m;
    m.id = "m1";
    m.name = "Carol";
    m.joined_at = std::chrono::system_clock::now();
    ASSERT_TRUE(s.lobby->add_member(m));
    ASSERT_FALSE(s.lobby->add_member(m));
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(1));

    s.lobby->update_mic("m1", true);
    s.lobby->update_muted("m1", true);
    ASSERT_TRUE(s.lobby->member("m1")->mic_enabled);
    ASSERT_TRUE(s.lobby->member("m1")->is_muted);

    ASSERT_THROWS_KIND(s.lobby->update_mic("ghost", true), ErrorKind::PlayerNotFound);
    ASSERT_THROWS_KIND(s.lobby->update_muted("ghost", true), ErrorKind::PlayerNotFound);
    ASSERT_THROWS_KIND(s.lobby->remove_member("ghost"), ErrorKind::PlayerNotFound);

    s.lobby->remove_member("m1");
    ASSERT_FALSE(s.lobby->member("m1").has_value());

    ASSERT_TRUE(s.lobby->add_member(m));
    s.lobby->clear_members();
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(0));
}

TEST(discovery_events_ignored_outside_lobby) {
    Stack s;
    s.lobby->on_discovery_event(events::player_joined("peer-z", "Zed"));
    ASSERT_EQ(s.lobby->member_count(), static_cast<size_t>(0));
    ASSERT_EQ(s.count(events::kPlayerJoined), static_cast<size_t>(1));
}

int main() {
    return run_all_tests("Lobby Manager Tests");
}
