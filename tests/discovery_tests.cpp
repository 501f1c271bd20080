/**
 * @file discovery_tests.cpp
 * @brief Unit tests for the peer directory and discovery protocol
 *
 * Instances bind to loopback and "broadcast" to 127.0.0.1 on their own port.
 */

#include "test_harness.hpp"

#include "discovery.hpp"
#include "logger.hpp"
#include "util.hpp"

#include <unistd.h>

#include <array>
#include <mutex>
#include <variant>
#include <vector>

using namespace meshlobby;

namespace {

class EventLog {
public:
    EventSink sink() {
        return [this](const Event& ev) {
            std::lock_guard<std::mutex> lk(mu_);
            events_.push_back(ev);
        };
    }
    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.name == name) n++;
        }
        return n;
    }
    std::vector<Event> all() {
        std::lock_guard<std::mutex> lk(mu_);
        return events_;
    }

private:
    std::mutex mu_;
    std::vector<Event> events_;
};

uint16_t test_base_port() {
    static uint16_t next = static_cast<uint16_t>(41000 + (::getpid() % 8000) * 2);
    uint16_t p = next;
    next = static_cast<uint16_t>(next + 20);
    return p;
}

Config test_config() {
    Config c;
    c.bind_ip = "127.0.0.1";
    c.broadcast_address = "127.0.0.1";
    c.discovery_port = test_base_port();
    c.discovery_port_span = 10;
    c.discover_fast_ms = 60000;
    c.discover_slow_ms = 60000;
    c.heartbeat_ms = 600000;
    c.join_settle_ms = 30;
    return c;
}

Logger& quiet_logger() {
    static Logger logger;
    logger.set_level(LogLevel::ERROR);
    return logger;
}

const udp::endpoint kFrom(boost::asio::ip::make_address_v4("127.0.0.1"), 50001);

} // namespace

TEST(start_binds_and_falls_back_to_next_port) {
    IoThread io;
    Config cfg = test_config();
    PeerDiscovery a(io.io(), cfg, quiet_logger());
    PeerDiscovery b(io.io(), cfg, quiet_logger());

    a.start("a", "Alice", "10.126.126.2");
    b.start("b", "Bob", "10.126.126.3");
    ASSERT_TRUE(a.is_running());
    ASSERT_EQ(a.bound_port(), cfg.discovery_port);
    ASSERT_EQ(b.nominal_port(), cfg.discovery_port);
    ASSERT_EQ(b.bound_port(), static_cast<uint16_t>(cfg.discovery_port + 1));
    ASSERT_THROWS_KIND(a.start("a", "Alice", "10.126.126.2"), ErrorKind::AlreadyRunning);

    a.stop();
    b.stop();
    ASSERT_FALSE(a.is_running());
}

TEST(duplicate_discover_joins_once) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"peer1", "Bob", 50001}, kFrom, 1000);
    d.handle_message(proto::Discover{"peer1", "Bob", 50001}, kFrom, 1100);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) >= 1; }, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(log.count(events::kPlayerJoined), static_cast<size_t>(1));
    ASSERT_EQ(d.peer_count(), static_cast<size_t>(1));

    auto rec = d.peer("peer1");
    ASSERT_TRUE(rec.has_value());
    ASSERT_EQ(rec->last_seen_ms, static_cast<uint64_t>(1100));
    ASSERT_EQ(rec->endpoint.port(), 50001);
    d.stop();
}

TEST(discover_response_does_not_reply_but_joins) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::DiscoverResponse{"peer2", "Carol", 50002}, kFrom, 10);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));
    auto ev = log.all().front();
    ASSERT_STREQ(ev.payload["playerId"].get<std::string>(), "peer2");
    ASSERT_STREQ(ev.payload["playerName"].get<std::string>(), "Carol");
    d.stop();
}

TEST(heartbeats_keep_peer_alive) {
    IoThread io;
    Config cfg = test_config();
    PeerDiscovery d(io.io(), cfg, quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    uint64_t t = 1000;
    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, t);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));
    for (int i = 0; i < 5; ++i) {
        t += 15000;
        d.handle_message(proto::Heartbeat{"p", 0}, kFrom, t);
        ASSERT_TRUE(d.sweep_expired(t).empty());
    }
    ASSERT_TRUE(d.sweep_expired(t + cfg.peer_timeout_ms).empty());
    ASSERT_EQ(log.count(events::kPlayerLeft), static_cast<size_t>(0));
    d.stop();
}

TEST(silent_peer_removed_exactly_once) {
    IoThread io;
    Config cfg = test_config();
    PeerDiscovery d(io.io(), cfg, quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 1000);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));

    auto removed = d.sweep_expired(1000 + cfg.peer_timeout_ms + 1);
    ASSERT_EQ(removed.size(), static_cast<size_t>(1));
    ASSERT_STREQ(removed[0], "p");
    ASSERT_TRUE(d.sweep_expired(1000 + cfg.peer_timeout_ms + 50000).empty());
    ASSERT_EQ(log.count(events::kPlayerLeft), static_cast<size_t>(1));
    ASSERT_FALSE(d.peer("p").has_value());
    d.stop();
}

TEST(last_seen_never_decreases) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 5000);
    d.handle_message(proto::Heartbeat{"p", 0}, kFrom, 4000);
    ASSERT_EQ(d.peer("p")->last_seen_ms, static_cast<uint64_t>(5000));
    d.stop();
}

TEST(leave_removes_and_notifies) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 1);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));
    d.handle_message(proto::Leave{"p"}, kFrom, 2);
    d.handle_message(proto::Leave{"p"}, kFrom, 3);
    d.handle_message(proto::Leave{"stranger"}, kFrom, 4);
    ASSERT_EQ(log.count(events::kPlayerLeft), static_cast<size_t>(1));
    ASSERT_EQ(d.peer_count(), static_cast<size_t>(0));
    d.stop();
}

TEST(leave_before_settle_is_silent) {
    IoThread io;
    Config cfg = test_config();
    cfg.join_settle_ms = 300;
    PeerDiscovery d(io.io(), cfg, quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 1);
    d.handle_message(proto::Leave{"p"}, kFrom, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    ASSERT_EQ(log.count(events::kPlayerJoined), static_cast<size_t>(0));
    ASSERT_EQ(log.count(events::kPlayerLeft), static_cast<size_t>(0));
    d.stop();
}

TEST(own_messages_ignored) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"self", "Me", 50001}, kFrom, 1);
    d.handle_message(proto::Offer{"self", "", "v=0"}, kFrom, 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(d.peer_count(), static_cast<size_t>(0));
    ASSERT_TRUE(log.all().empty());
    d.stop();
}

TEST(same_id_broadcasters_never_see_themselves) {
    IoThread io;
    Config cfg = test_config();
    cfg.discover_fast_ms = 20;
    cfg.discover_fast_count = 100;
    PeerDiscovery a(io.io(), cfg, quiet_logger());
    PeerDiscovery b(io.io(), cfg, quiet_logger());
    a.start("twin", "A", "10.126.126.2");
    b.start("twin", "B", "10.126.126.3");

    // Each one loops its own broadcasts back; feed a's view of b directly too.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    a.handle_datagram(proto::encode(proto::Discover{"twin", "B", b.bound_port()}), kFrom);
    ASSERT_EQ(a.peer_count(), static_cast<size_t>(0));
    ASSERT_EQ(b.peer_count(), static_cast<size_t>(0));
    a.stop();
    b.stop();
}

TEST(discover_is_answered_on_announced_port) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    d.start("self", "Me", "10.126.126.2");

    boost::asio::io_context raw_io;
    udp::socket raw(raw_io, udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
    raw.non_blocking(true);
    const uint16_t raw_port = raw.local_endpoint().port();

    std::string wire = proto::encode(proto::Discover{"remote", "Remote", raw_port});
    raw.send_to(boost::asio::buffer(wire),
                udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), d.bound_port()));

    std::string got;
    ASSERT_TRUE(wait_until([&] {
        std::array<char, 2048> buf{};
        udp::endpoint from;
        boost::system::error_code ec;
        size_t n = raw.receive_from(boost::asio::buffer(buf), from, 0, ec);
        if (ec) return false;
        got.assign(buf.data(), n);
        return true;
    }, 3000));

    auto msg = proto::decode(got);
    ASSERT_TRUE(std::holds_alternative<proto::DiscoverResponse>(msg));
    ASSERT_STREQ(std::get<proto::DiscoverResponse>(msg).peer_id, "self");
    ASSERT_EQ(std::get<proto::DiscoverResponse>(msg).reply_port, d.bound_port());
    ASSERT_TRUE(wait_until([&] { return d.peer("remote").has_value(); }, 1000));
    d.stop();
}

TEST(malformed_datagram_dropped) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    d.start("self", "Me", "10.126.126.2");
    d.handle_datagram("{not json", kFrom);
    d.handle_datagram(R"({"type":"player-discovery","playerId":"x"})", kFrom);
    ASSERT_EQ(d.peer_count(), static_cast<size_t>(0));
    ASSERT_TRUE(d.is_running());
    d.stop();
}

TEST(relay_filtering_and_refresh) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");

    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 100);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));

    d.handle_message(proto::Offer{"p", "someone-else", "v=0"}, kFrom, 200);
    ASSERT_EQ(log.count(events::kSignaling), static_cast<size_t>(0));
    ASSERT_EQ(d.peer("p")->last_seen_ms, static_cast<uint64_t>(100));

    d.handle_message(proto::IceCandidate{"p", "self", "cand"}, kFrom, 300);
    d.handle_message(proto::Answer{"p", "", "v=1"}, kFrom, 400);
    ASSERT_EQ(log.count(events::kSignaling), static_cast<size_t>(2));
    ASSERT_EQ(d.peer("p")->last_seen_ms, static_cast<uint64_t>(400));

    d.handle_message(proto::StatusUpdate{"p", true, std::nullopt}, kFrom, 500);
    ASSERT_EQ(log.count(events::kStatusUpdate), static_cast<size_t>(1));

    for (const auto& ev : log.all()) {
        if (ev.name != events::kSignaling) continue;
        ASSERT_STREQ(ev.payload["from"].get<std::string>(), "p");
        if (ev.payload["type"] == "ice-candidate") {
            ASSERT_STREQ(ev.payload["candidate"].get<std::string>(), "cand");
        }
    }
    d.stop();
}

TEST(send_requires_known_peer) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    ASSERT_THROWS_KIND(d.broadcast_status(true), ErrorKind::Network);
    d.start("self", "Me", "10.126.126.2");
    ASSERT_THROWS_KIND(d.send_to_peer("ghost", proto::Leave{"self"}), ErrorKind::PeerNotFound);
    ASSERT_THROWS_KIND(d.send_signal("offer", "ghost", "v=0"), ErrorKind::PeerNotFound);
    ASSERT_THROWS_KIND(d.send_signal("bogus", "", "x"), ErrorKind::Validation);
    d.send_signal("offer", "", "v=0");
    d.broadcast_status(false, true);
    d.stop();
}

TEST(stop_clears_without_events) {
    IoThread io;
    PeerDiscovery d(io.io(), test_config(), quiet_logger());
    EventLog log;
    d.set_event_sink(log.sink());
    d.start("self", "Me", "10.126.126.2");
    d.handle_message(proto::Discover{"p", "P", 50001}, kFrom, 1);
    ASSERT_TRUE(wait_until([&] { return log.count(events::kPlayerJoined) == 1; }, 2000));

    d.stop();
    d.stop();
    ASSERT_FALSE(d.is_running());
    ASSERT_EQ(d.peer_count(), static_cast<size_t>(0));
    ASSERT_EQ(log.count(events::kPlayerLeft), static_cast<size_t>(0));

    d.start("self", "Me", "10.126.126.2");
    ASSERT_TRUE(d.is_running());
    d.stop();
}

TEST(late_teardown_does_not_close_next_run) {
    // Loop not running yet: stop() times out and tears down inline, leaving
    // its posted teardown queued behind the first start.
    boost::asio::io_context io;
    PeerDiscovery d(io, test_config(), quiet_logger());
    d.start("self", "Me", "10.126.126.2");
    d.stop();
    ASSERT_FALSE(d.is_running());
    ASSERT_EQ(d.bound_port(), static_cast<uint16_t>(0));

    d.start("self", "Me", "10.126.126.2");
    const uint16_t port = d.bound_port();
    auto work = boost::asio::make_work_guard(io);
    std::thread th([&io] { io.run(); });

    boost::asio::io_context raw_io;
    udp::socket raw(raw_io, udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
    std::string wire = proto::encode(proto::Discover{"remote", "Remote", raw.local_endpoint().port()});
    bool seen = wait_until([&] {
        raw.send_to(boost::asio::buffer(wire),
                    udp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), port));
        return d.peer("remote").has_value();
    }, 3000);

    const bool running = d.is_running();
    const uint16_t still_bound = d.bound_port();
    d.stop();
    work.reset();
    io.stop();
    th.join();

    ASSERT_TRUE(seen);
    ASSERT_TRUE(running);
    ASSERT_EQ(still_bound, port);
}

TEST(stop_with_stopped_loop_is_immediate) {
    boost::asio::io_context io;
    PeerDiscovery d(io, test_config(), quiet_logger());
    d.start("self", "Me", "10.126.126.2");
    io.stop();
    const uint64_t t0 = now_ms();
    d.stop();
    ASSERT_TRUE(now_ms() - t0 < 1000);
    ASSERT_FALSE(d.is_running());
}

TEST(auto_broadcast_uses_virtual_subnet) {
    IoThread io;
    Config cfg = test_config();
    cfg.broadcast_address = "auto";
    PeerDiscovery d(io.io(), cfg, quiet_logger());
    d.start("self", "Me", "10.126.126.5");
    ASSERT_STREQ(d.broadcast_address(), "10.126.126.255");
    d.stop();

    d.start("self", "Me", "not-an-ip");
    ASSERT_STREQ(d.broadcast_address(), "255.255.255.255");
    d.stop();
}

int main() {
    return run_all_tests("Discovery Unit Tests");
}
