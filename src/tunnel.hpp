#pragma once

#include <boost/asio.hpp>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "logger.hpp"
#include "process.hpp"

namespace meshlobby {

struct TunnelState {
    enum class Phase { Idle, Connecting, Connected, Disconnected, Error };

    Phase phase = Phase::Idle;
    std::string detail; // address when Connected, reason when Error

    bool connected() const { return phase == Phase::Connected; }
};

const char* phase_str(TunnelState::Phase p);

// Supervises the overlay daemon subprocess: spawns it for one set of
// credentials, recovers the virtual address it was assigned and tears
// everything down again.
//
// Threading:
// - start()/stop()/restart() block the calling thread; they must not be
//   called from the io_context thread.
// - Output readers and the exit monitor run on the io_context.
class TunnelSupervisor {
public:
    TunnelSupervisor(boost::asio::io_context& io, const Config& cfg, Logger& logger);
    ~TunnelSupervisor();

    TunnelSupervisor(const TunnelSupervisor&) = delete;
    TunnelSupervisor& operator=(const TunnelSupervisor&) = delete;

    // Returns the assigned virtual address. Throws Error: AlreadyRunning,
    // Process (spawn), Network (premature exit, fatal output), Timeout.
    std::string start(const std::string& network_name,
                      const std::string& secret,
                      const std::string& rendezvous);

    // Idempotent; always ends Disconnected.
    void stop();

    std::string restart(const std::string& network_name,
                        const std::string& secret,
                        const std::string& rendezvous);

    TunnelState check_connection() const;
    std::optional<std::string> get_virtual_ip() const;
    bool is_running() const;
    std::string instance_name() const;

    // Virtual addresses of the overlay peers, from the companion CLI.
    std::vector<std::string> list_overlay_peers();

    void set_event_sink(EventSink sink);

private:
    void set_state(TunnelState::Phase phase, const std::string& detail);
    void emit(const Event& ev);

    std::string resolve_work_dir() const;
    void stage_native_deps(const std::string& work_dir);
    std::vector<std::string> daemon_args(const std::string& network_name,
                                         const std::string& secret,
                                         const std::string& rendezvous,
                                         const std::string& instance,
                                         const std::string& config_dir) const;

    void attach_reader(int fd, bool is_stderr, uint64_t gen);
    void on_output_line(uint64_t gen, bool is_stderr, const std::string& line);
    void tick_exit_monitor(uint64_t gen);
    void poll_child_locked();

    std::optional<std::string> query_node_address(const std::string& instance);
    void deregister_instance(const std::string& instance);
    void cleanup_adapters();
    void remove_dir_with_retries(const std::string& dir);

    boost::asio::io_context& io_;
    Config cfg_;
    Logger& logger_;

    boost::asio::steady_timer exit_timer_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    TunnelState state_;
    std::optional<std::string> virtual_ip_;
    std::unique_ptr<ChildProcess> child_;
    std::string instance_;
    std::string config_dir_;
    uint64_t gen_ = 0;
    bool starting_ = false;

    // Filled by the io-side tasks while start() waits.
    std::optional<std::string> scanned_ip_;
    std::optional<std::string> fatal_reason_;
    bool exited_ = false;
    std::string exit_desc_;

    std::mutex sink_mu_;
    EventSink sink_;
};

} // namespace meshlobby
