#include "discovery.hpp"

#include "address_scan.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <utility>

namespace meshlobby {

using boost::asio::ip::make_address_v4;

namespace {

constexpr const char* kLimitedBroadcast = "255.255.255.255";
constexpr auto kStopWait = std::chrono::seconds(2);

} // namespace

struct PeerDiscovery::Visitor {
    PeerDiscovery& self;
    const udp::endpoint& from;
    uint64_t now;

    void operator()(const proto::Discover& m) const {
        self.on_presence(m.peer_id, m.name, m.reply_port, from, now);

        // Reply to the announced port, not the datagram's source port.
        proto::DiscoverResponse resp;
        resp.peer_id = self.local_id();
        {
            std::lock_guard<std::mutex> lk(self.self_mu_);
            resp.name = self.local_name_;
        }
        resp.reply_port = self.bound_port();
        udp::endpoint to(from.address(), m.reply_port != 0 ? m.reply_port : from.port());
        self.post_send(proto::encode(resp), to);
    }
    void operator()(const proto::DiscoverResponse& m) const {
        self.on_presence(m.peer_id, m.name, m.reply_port, from, now);
    }
    void operator()(const proto::Heartbeat& m) const {
        self.refresh(m.peer_id, now);
    }
    void operator()(const proto::Leave& m) const {
        self.remove_peer(m.peer_id, "leave");
    }
    void operator()(const proto::Offer& m) const {
        if (!addressed_to_us(m.to)) return;
        self.refresh(m.from, now);
        self.emit(events::signaling("offer", m.from, "sdp", m.sdp));
    }
    void operator()(const proto::Answer& m) const {
        if (!addressed_to_us(m.to)) return;
        self.refresh(m.from, now);
        self.emit(events::signaling("answer", m.from, "sdp", m.sdp));
    }
    void operator()(const proto::IceCandidate& m) const {
        if (!addressed_to_us(m.to)) return;
        self.refresh(m.from, now);
        self.emit(events::signaling("ice-candidate", m.from, "candidate", m.candidate));
    }
    void operator()(const proto::StatusUpdate& m) const {
        self.refresh(m.peer_id, now);
        self.emit(events::status_update(m.peer_id, m.mic_enabled, m.muted));
    }

    bool addressed_to_us(const std::string& to) const {
        return to.empty() || to == self.local_id();
    }
};

PeerDiscovery::PeerDiscovery(boost::asio::io_context& io, const Config& cfg, Logger& logger)
    : io_(io),
      cfg_(cfg),
      logger_(logger),
      sock_(io),
      t_discover_(io),
      t_heartbeat_(io) {}

PeerDiscovery::~PeerDiscovery() {
    boost::system::error_code ec;
    sock_.close(ec);
}

void PeerDiscovery::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    sink_ = std::move(sink);
}

void PeerDiscovery::emit(const Event& ev) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mu_);
        sink = sink_;
    }
    if (sink) sink(ev);
}

std::string PeerDiscovery::local_id() const {
    std::lock_guard<std::mutex> lk(self_mu_);
    return local_id_;
}

std::string PeerDiscovery::broadcast_address() const {
    std::lock_guard<std::mutex> lk(self_mu_);
    return broadcast_ip_;
}

void PeerDiscovery::start(const std::string& local_id,
                          const std::string& local_name,
                          const std::string& virtual_ip) {
    if (running_.load()) throw Error(ErrorKind::AlreadyRunning, "discovery is already running");

    boost::system::error_code ec;
    auto bind_addr = make_address_v4(cfg_.bind_ip, ec);
    if (ec) throw Error(ErrorKind::Network, "invalid bind_ip: " + cfg_.bind_ip);

    std::string bcast = cfg_.broadcast_address;
    if (bcast == "auto") bcast = broadcast_for(virtual_ip);
    make_address_v4(bcast, ec);
    if (bcast.empty() || ec) {
        logger_.warn("no usable broadcast address for " + virtual_ip + ", using " + kLimitedBroadcast);
        bcast = kLimitedBroadcast;
    }

    const uint32_t first = cfg_.discovery_port;
    const uint32_t last = std::min<uint32_t>(first + cfg_.discovery_port_span, 65535);
    uint16_t bound = 0;
    std::string last_error;
    for (uint32_t port = first; port <= last; ++port) {
        ec.clear();
        sock_.open(udp::v4(), ec);
        if (ec) throw Error(ErrorKind::Network, "failed to open discovery socket: " + ec.message());
        sock_.bind(udp::endpoint(bind_addr, static_cast<uint16_t>(port)), ec);
        if (!ec) {
            bound = static_cast<uint16_t>(port);
            break;
        }
        last_error = ec.message();
        logger_.debug("discovery port " + std::to_string(port) + " unavailable: " + last_error);
        boost::system::error_code ignored;
        sock_.close(ignored);
    }
    if (bound == 0) {
        throw Error(ErrorKind::Network,
                    "cannot bind discovery socket on ports " + std::to_string(first) + "-" +
                    std::to_string(last) + ": " + last_error);
    }
    sock_.set_option(boost::asio::socket_base::broadcast(true), ec);
    if (ec) {
        boost::system::error_code ignored;
        sock_.close(ignored);
        throw Error(ErrorKind::Network, "failed to enable broadcast: " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lk(self_mu_);
        local_id_ = local_id;
        local_name_ = local_name;
        virtual_ip_ = virtual_ip;
        broadcast_ip_ = bcast;
    }
    bound_port_.store(bound);
    const uint64_t gen = ++run_gen_;
    running_.store(true);

    if (bound != first) {
        logger_.warn("discovery port " + std::to_string(first) + " busy, bound " + std::to_string(bound));
    }
    logger_.info("discovery started id=" + local_id + " name=" + local_name +
                 " bind=" + cfg_.bind_ip + ":" + std::to_string(bound) + " broadcast=" + bcast);

    boost::asio::post(io_, [this, gen]() {
        if (gen != run_gen_.load()) return;
        discover_count_ = 0;
        do_receive();
        tick_discover();
        tick_heartbeat();
    });
}

void PeerDiscovery::stop() {
    if (!running_.exchange(false)) {
        std::unique_lock<std::shared_mutex> lk(dir_mu_);
        directory_.clear();
        return;
    }
    const uint64_t gen = run_gen_.load();

    if (io_.stopped() || io_.get_executor().running_in_this_thread()) {
        stop_on_io(gen);
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    boost::asio::post(io_, [this, gen, done]() {
        stop_on_io(gen);
        done->set_value();
    });
    if (fut.wait_for(kStopWait) != std::future_status::ready) {
        // The posted teardown becomes a no-op once this one has run.
        logger_.warn("discovery stop: event loop not responding, closing inline");
        stop_on_io(gen);
    }
}

void PeerDiscovery::stop_on_io(uint64_t gen) {
    std::lock_guard<std::mutex> teardown(teardown_mu_);
    if (gen <= torn_down_gen_) return;
    torn_down_gen_ = gen;

    if (sock_.is_open()) {
        proto::Leave leave{local_id()};
        send_now(proto::encode(leave), broadcast_endpoint());
    }

    t_discover_.cancel();
    t_heartbeat_.cancel();
    boost::system::error_code ec;
    sock_.close(ec);
    bound_port_.store(0);

    size_t dropped = 0;
    {
        std::unique_lock<std::shared_mutex> lk(dir_mu_);
        dropped = directory_.size();
        directory_.clear();
    }
    logger_.info("discovery stopped, dropped " + std::to_string(dropped) + " peers");
}

void PeerDiscovery::do_receive() {
    if (!sock_.is_open()) return;
    sock_.async_receive_from(boost::asio::buffer(recv_buf_), recv_from_,
                             [this](boost::system::error_code ec, std::size_t n) {
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !sock_.is_open()) return;
            logger_.debug("discovery receive error: " + ec.message());
            do_receive();
            return;
        }
        handle_datagram(std::string(recv_buf_.data(), n), recv_from_);
        do_receive();
    });
}

void PeerDiscovery::handle_datagram(const std::string& bytes, const udp::endpoint& from) {
    proto::Message msg;
    try {
        msg = proto::decode(bytes);
    } catch (const proto::DecodeError& e) {
        logger_.warn("drop datagram from " + from.address().to_string() + ":" +
                     std::to_string(from.port()) + ": " + e.what());
        return;
    }
    handle_message(msg, from, now_ms());
}

void PeerDiscovery::handle_message(const proto::Message& msg, const udp::endpoint& from, uint64_t now) {
    const std::string& sender = proto::sender_id(msg);
    if (sender.empty()) {
        logger_.debug(std::string("drop ") + proto::type_name(msg) + " with empty sender id");
        return;
    }
    if (sender == local_id()) return;

    logger_.debug(std::string("recv ") + proto::type_name(msg) + " from " + sender);
    std::visit(Visitor{*this, from, now}, msg);
}

void PeerDiscovery::on_presence(const std::string& id, const std::string& name, uint16_t reply_port,
                                const udp::endpoint& from, uint64_t now) {
    udp::endpoint ep(from.address(), reply_port != 0 ? reply_port : from.port());
    uint64_t epoch = 0;
    {
        std::unique_lock<std::shared_mutex> lk(dir_mu_);
        auto it = directory_.find(id);
        if (it != directory_.end()) {
            PeerRecord& rec = it->second;
            if (now > rec.last_seen_ms) rec.last_seen_ms = now;
            rec.name = name;
            rec.endpoint = ep;
            return;
        }
        PeerRecord rec;
        rec.id = id;
        rec.name = name;
        rec.endpoint = ep;
        rec.last_seen_ms = now;
        rec.epoch = ++next_epoch_;
        epoch = rec.epoch;
        directory_.emplace(id, std::move(rec));
    }
    logger_.info("peer discovered: " + id + " (" + name + ") @ " +
                 ep.address().to_string() + ":" + std::to_string(ep.port()));
    schedule_joined(id, epoch);
}

void PeerDiscovery::schedule_joined(const std::string& id, uint64_t epoch) {
    auto t = std::make_shared<boost::asio::steady_timer>(io_);
    t->expires_after(std::chrono::milliseconds(cfg_.join_settle_ms));
    t->async_wait([this, t, id, epoch](boost::system::error_code ec) {
        if (ec) return;
        std::string name;
        {
            std::unique_lock<std::shared_mutex> lk(dir_mu_);
            auto it = directory_.find(id);
            if (it == directory_.end() || it->second.epoch != epoch || it->second.announced) return;
            it->second.announced = true;
            name = it->second.name;
        }
        emit(events::player_joined(id, name));
    });
}

void PeerDiscovery::refresh(const std::string& id, uint64_t now) {
    std::unique_lock<std::shared_mutex> lk(dir_mu_);
    auto it = directory_.find(id);
    if (it == directory_.end()) return;
    if (now > it->second.last_seen_ms) it->second.last_seen_ms = now;
}

void PeerDiscovery::remove_peer(const std::string& id, const char* why) {
    bool announced = false;
    {
        std::unique_lock<std::shared_mutex> lk(dir_mu_);
        auto it = directory_.find(id);
        if (it == directory_.end()) return;
        announced = it->second.announced;
        directory_.erase(it);
    }
    logger_.info("peer removed: " + id + " (" + why + ")");
    if (announced) emit(events::player_left(id));
}

std::vector<std::string> PeerDiscovery::sweep_expired(uint64_t now) {
    std::vector<std::string> removed;
    std::vector<std::string> to_notify;
    {
        std::unique_lock<std::shared_mutex> lk(dir_mu_);
        for (auto it = directory_.begin(); it != directory_.end();) {
            const PeerRecord& rec = it->second;
            if (now > rec.last_seen_ms && now - rec.last_seen_ms > cfg_.peer_timeout_ms) {
                removed.push_back(rec.id);
                if (rec.announced) to_notify.push_back(rec.id);
                it = directory_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& id : removed) logger_.warn("peer timed out: " + id);
    for (const auto& id : to_notify) emit(events::player_left(id));
    return removed;
}

void PeerDiscovery::tick_discover() {
    uint32_t interval = discover_count_ < cfg_.discover_fast_count ? cfg_.discover_fast_ms
                                                                   : cfg_.discover_slow_ms;
    t_discover_.expires_after(std::chrono::milliseconds(interval));
    t_discover_.async_wait([this](boost::system::error_code ec) {
        if (ec || !running_.load()) return;
        ++discover_count_;

        proto::Discover d;
        {
            std::lock_guard<std::mutex> lk(self_mu_);
            d.peer_id = local_id_;
            d.name = local_name_;
        }
        d.reply_port = bound_port();
        send_now(proto::encode(d), broadcast_endpoint());
        tick_discover();
    });
}

void PeerDiscovery::tick_heartbeat() {
    t_heartbeat_.expires_after(std::chrono::milliseconds(cfg_.heartbeat_ms));
    t_heartbeat_.async_wait([this](boost::system::error_code ec) {
        if (ec || !running_.load()) return;

        proto::Heartbeat hb;
        hb.peer_id = local_id();
        hb.timestamp = static_cast<uint64_t>(unix_seconds());
        send_now(proto::encode(hb), broadcast_endpoint());

        sweep_expired(now_ms());
        tick_heartbeat();
    });
}

udp::endpoint PeerDiscovery::broadcast_endpoint() const {
    std::lock_guard<std::mutex> lk(self_mu_);
    boost::system::error_code ec;
    auto addr = make_address_v4(broadcast_ip_.empty() ? kLimitedBroadcast : broadcast_ip_, ec);
    if (ec) addr = boost::asio::ip::address_v4::broadcast();
    return udp::endpoint(addr, bound_port_.load());
}

void PeerDiscovery::send_now(const std::string& bytes, const udp::endpoint& to) {
    if (!sock_.is_open()) return;
    boost::system::error_code ec;
    sock_.send_to(boost::asio::buffer(bytes), to, 0, ec);
    if (ec) {
        logger_.warn("discovery send to " + to.address().to_string() + ":" +
                     std::to_string(to.port()) + " failed: " + ec.message());
    }
}

void PeerDiscovery::post_send(std::string bytes, const udp::endpoint& to) {
    if (!running_.load()) return;
    boost::asio::post(io_, [this, bytes = std::move(bytes), to]() { send_now(bytes, to); });
}

void PeerDiscovery::send_to_peer(const std::string& peer_id, const proto::Message& msg) {
    if (!running_.load()) throw Error(ErrorKind::Network, "discovery is not running");
    udp::endpoint ep;
    {
        std::shared_lock<std::shared_mutex> lk(dir_mu_);
        auto it = directory_.find(peer_id);
        if (it == directory_.end()) throw Error(ErrorKind::PeerNotFound, peer_id);
        ep = it->second.endpoint;
    }
    post_send(proto::encode(msg), ep);
}

void PeerDiscovery::broadcast_to_all(const proto::Message& msg) {
    if (!running_.load()) throw Error(ErrorKind::Network, "discovery is not running");
    post_send(proto::encode(msg), broadcast_endpoint());
}

void PeerDiscovery::send_signal(const std::string& kind, const std::string& to, const std::string& payload) {
    const std::string from = local_id();
    proto::Message msg;
    if (kind == "offer") {
        msg = proto::Offer{from, to, payload};
    } else if (kind == "answer") {
        msg = proto::Answer{from, to, payload};
    } else if (kind == "ice-candidate" || kind == "ice") {
        msg = proto::IceCandidate{from, to, payload};
    } else {
        throw Error(ErrorKind::Validation, "unknown signal kind: " + kind);
    }
    if (to.empty()) {
        broadcast_to_all(msg);
    } else {
        send_to_peer(to, msg);
    }
}

void PeerDiscovery::broadcast_status(bool mic_enabled, std::optional<bool> muted) {
    proto::StatusUpdate su;
    su.peer_id = local_id();
    su.mic_enabled = mic_enabled;
    su.muted = muted;
    broadcast_to_all(su);
}

std::vector<PeerRecord> PeerDiscovery::peers() const {
    std::shared_lock<std::shared_mutex> lk(dir_mu_);
    std::vector<PeerRecord> out;
    out.reserve(directory_.size());
    for (const auto& kv : directory_) out.push_back(kv.second);
    return out;
}

std::optional<PeerRecord> PeerDiscovery::peer(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lk(dir_mu_);
    auto it = directory_.find(id);
    if (it == directory_.end()) return std::nullopt;
    return it->second;
}

size_t PeerDiscovery::peer_count() const {
    std::shared_lock<std::shared_mutex> lk(dir_mu_);
    return directory_.size();
}

} // namespace meshlobby
