#pragma once

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "logger.hpp"
#include "protocol.hpp"

namespace meshlobby {

using boost::asio::ip::udp;

struct PeerRecord {
    std::string id;
    std::string name;
    udp::endpoint endpoint; // sender address, announced reply port
    uint64_t last_seen_ms = 0;
    uint64_t epoch = 0;     // presence interval this record belongs to
    bool announced = false; // "joined" has been emitted for this epoch
};

// Broadcast peer discovery and signaling relay on the overlay network.
//
// Threading:
// - The receive loop and the timers run on the io_context.
// - Senders may be called from any thread; the actual socket writes are
//   posted to the io_context.
// - The directory is guarded by a reader-writer lock.
class PeerDiscovery {
public:
    PeerDiscovery(boost::asio::io_context& io, const Config& cfg, Logger& logger);
    ~PeerDiscovery();

    PeerDiscovery(const PeerDiscovery&) = delete;
    PeerDiscovery& operator=(const PeerDiscovery&) = delete;

    // Throws Error(Network) when no port in the range can be bound and
    // Error(AlreadyRunning) on a second start.
    void start(const std::string& local_id,
               const std::string& local_name,
               const std::string& virtual_ip);

    // Broadcasts Leave, closes the socket and clears the directory.
    // No "left" events are emitted.
    void stop();

    void set_event_sink(EventSink sink);

    // Throws Error(PeerNotFound) for an unknown id.
    void send_to_peer(const std::string& peer_id, const proto::Message& msg);
    void broadcast_to_all(const proto::Message& msg);

    // kind: "offer" | "answer" | "ice-candidate"; to empty broadcasts.
    void send_signal(const std::string& kind, const std::string& to, const std::string& payload);
    void broadcast_status(bool mic_enabled, std::optional<bool> muted = std::nullopt);

    void handle_datagram(const std::string& bytes, const udp::endpoint& from);
    void handle_message(const proto::Message& msg, const udp::endpoint& from, uint64_t now);

    // Removes peers silent for longer than peer_timeout_ms; returns their ids.
    std::vector<std::string> sweep_expired(uint64_t now);

    std::vector<PeerRecord> peers() const;
    std::optional<PeerRecord> peer(const std::string& id) const;
    size_t peer_count() const;

    bool is_running() const { return running_.load(); }
    uint16_t bound_port() const { return bound_port_.load(); }
    uint16_t nominal_port() const { return cfg_.discovery_port; }
    std::string local_id() const;
    std::string broadcast_address() const;

private:
    struct Visitor;

    void do_receive();
    void tick_discover();
    void tick_heartbeat();

    void send_now(const std::string& bytes, const udp::endpoint& to);
    void post_send(std::string bytes, const udp::endpoint& to);
    udp::endpoint broadcast_endpoint() const;

    void on_presence(const std::string& id, const std::string& name, uint16_t reply_port,
                     const udp::endpoint& from, uint64_t now);
    void schedule_joined(const std::string& id, uint64_t epoch);
    void refresh(const std::string& id, uint64_t now);
    void remove_peer(const std::string& id, const char* why);
    void emit(const Event& ev);
    void stop_on_io(uint64_t gen);

    boost::asio::io_context& io_;
    Config cfg_;
    Logger& logger_;

    udp::socket sock_;
    udp::endpoint recv_from_;
    std::array<char, 65536> recv_buf_{};

    boost::asio::steady_timer t_discover_;
    boost::asio::steady_timer t_heartbeat_;
    uint32_t discover_count_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    // Each start() opens a run; io-side tasks posted for an older run are no-ops.
    std::atomic<uint64_t> run_gen_{0};
    std::mutex teardown_mu_;
    uint64_t torn_down_gen_ = 0;

    mutable std::mutex self_mu_;
    std::string local_id_;
    std::string local_name_;
    std::string virtual_ip_;
    std::string broadcast_ip_;

    mutable std::shared_mutex dir_mu_;
    std::unordered_map<std::string, PeerRecord> directory_;
    uint64_t next_epoch_ = 0;

    std::mutex sink_mu_;
    EventSink sink_;
};

} // namespace meshlobby
