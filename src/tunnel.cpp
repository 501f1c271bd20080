#include "tunnel.hpp"

#include "address_scan.hpp"
#include "crypto/Crypto.h"
#include "errors.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace meshlobby {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kPostKillSettleMs = 300;
constexpr uint32_t kRestartPauseMs = 1000;

void sleep_ms(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

const char* status_name(TunnelState::Phase p) {
    switch (p) {
        case TunnelState::Phase::Connecting: return "connecting";
        case TunnelState::Phase::Connected: return "connected";
        case TunnelState::Phase::Error: return "error";
        default: return "disconnected";
    }
}

} // namespace

const char* phase_str(TunnelState::Phase p) {
    switch (p) {
        case TunnelState::Phase::Idle: return "idle";
        case TunnelState::Phase::Connecting: return "connecting";
        case TunnelState::Phase::Connected: return "connected";
        case TunnelState::Phase::Disconnected: return "disconnected";
        case TunnelState::Phase::Error: return "error";
    }
    return "unknown";
}

TunnelSupervisor::TunnelSupervisor(boost::asio::io_context& io, const Config& cfg, Logger& logger)
    : io_(io), cfg_(cfg), logger_(logger), exit_timer_(io) {}

TunnelSupervisor::~TunnelSupervisor() {
    // ChildProcess kills and reaps on destruction; owners call stop() for the
    // full cleanup.
    std::lock_guard<std::mutex> lk(mu_);
    ++gen_;
}

void TunnelSupervisor::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    sink_ = std::move(sink);
}

void TunnelSupervisor::emit(const Event& ev) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mu_);
        sink = sink_;
    }
    if (sink) sink(ev);
}

void TunnelSupervisor::set_state(TunnelState::Phase phase, const std::string& detail) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_.phase = phase;
        state_.detail = detail;
    }
    logger_.info(std::string("tunnel state -> ") + phase_str(phase) +
                 (detail.empty() ? "" : " (" + detail + ")"));
    const std::string ip = phase == TunnelState::Phase::Connected ? detail : std::string();
    const std::string reason = phase == TunnelState::Phase::Error ? detail : std::string();
    emit(events::network_status(status_name(phase), ip, reason));
}

TunnelState TunnelSupervisor::check_connection() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::optional<std::string> TunnelSupervisor::get_virtual_ip() const {
    std::lock_guard<std::mutex> lk(mu_);
    return virtual_ip_;
}

bool TunnelSupervisor::is_running() const {
    std::lock_guard<std::mutex> lk(mu_);
    return child_ != nullptr && !exited_;
}

std::string TunnelSupervisor::instance_name() const {
    std::lock_guard<std::mutex> lk(mu_);
    return instance_;
}

std::string TunnelSupervisor::resolve_work_dir() const {
    if (!cfg_.work_dir.empty()) return fs::absolute(cfg_.work_dir).string();
    fs::path daemon(cfg_.daemon_path);
    if (daemon.has_parent_path()) return fs::absolute(daemon.parent_path()).string();
    return fs::current_path().string();
}

void TunnelSupervisor::stage_native_deps(const std::string& work_dir) {
    if (cfg_.native_deps.empty()) return;

    std::vector<fs::path> sources;
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) sources.push_back(exe.parent_path() / "resources" / "binaries");
    sources.push_back(fs::current_path(ec));

    for (const auto& name : cfg_.native_deps) {
        fs::path target = fs::path(work_dir) / name;
        if (fs::exists(target, ec)) continue;

        bool staged = false;
        for (const auto& dir : sources) {
            fs::path src = dir / name;
            if (!fs::exists(src, ec)) continue;
            fs::copy_file(src, target, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                logger_.warn("failed to stage " + name + " from " + src.string() + ": " + ec.message());
                continue;
            }
            logger_.info("staged " + name + " from " + src.string());
            staged = true;
            break;
        }
        if (!staged) logger_.warn("native dependency not found: " + name);
    }
}

std::vector<std::string> TunnelSupervisor::daemon_args(const std::string& network_name,
                                                       const std::string& secret,
                                                       const std::string& rendezvous,
                                                       const std::string& instance,
                                                       const std::string& config_dir) const {
    std::string exe = cfg_.daemon_path;
    if (fs::path(exe).has_parent_path()) exe = fs::absolute(exe).string();
    return {
        exe,
        "--network-name", network_name,
        "--network-secret", secret,
        "--peers", rendezvous,
        "--dhcp", "true",
        "--instance-name", instance,
        "--config-dir", config_dir,
        "--default-protocol", "udp",
        "--multi-thread",
        "--enable-kcp-proxy",
        "--latency-first",
        "--private-mode", "true",
    };
}

std::string TunnelSupervisor::start(const std::string& network_name,
                                    const std::string& secret,
                                    const std::string& rendezvous) {
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (starting_ || child_) {
            throw Error(ErrorKind::AlreadyRunning, "tunnel is already running");
        }
        starting_ = true;
        gen = ++gen_;
        scanned_ip_.reset();
        fatal_reason_.reset();
        exited_ = false;
        exit_desc_.clear();
        virtual_ip_.reset();
    }
    struct StartingReset {
        TunnelSupervisor* self;
        ~StartingReset() {
            std::lock_guard<std::mutex> lk(self->mu_);
            self->starting_ = false;
        }
    } starting_reset{this};

    set_state(TunnelState::Phase::Connecting, {});

    const std::string work_dir = resolve_work_dir();
    const std::string instance = cfg_.instance_prefix + "-" + std::to_string(unix_seconds()) +
                                 "-" + crypto::Random::Hex(4);
    const std::string config_dir = (fs::path(work_dir) / ("config_" + instance)).string();

    logger_.info("starting tunnel instance=" + instance + " network=" + network_name +
                 " secret#" + crypto::Sha256::Fingerprint(secret) + " peers=" + rendezvous);

    std::error_code fec;
    fs::create_directories(config_dir, fec);
    if (fec) {
        set_state(TunnelState::Phase::Error, "cannot create " + config_dir);
        stop();
        throw Error(ErrorKind::Process, "cannot create config dir " + config_dir + ": " + fec.message());
    }
    stage_native_deps(work_dir);

    SpawnOptions opts;
    opts.argv = daemon_args(network_name, secret, rendezvous, instance, config_dir);
    opts.cwd = work_dir;
    std::string ld_path = work_dir;
    if (const char* old = std::getenv("LD_LIBRARY_PATH")) {
        if (*old) ld_path += std::string(":") + old;
    }
    opts.env.emplace_back("LD_LIBRARY_PATH", ld_path);

    std::unique_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lk(mu_);
        instance_ = instance;
        config_dir_ = config_dir;
    }
    try {
        child = ChildProcess::spawn(opts);
    } catch (const Error& e) {
        logger_.error(std::string("daemon spawn failed: ") + e.what());
        set_state(TunnelState::Phase::Error, e.detail());
        stop();
        throw;
    }
    logger_.info("daemon pid=" + std::to_string(child->pid()));

    int out_fd = child->take_stdout_fd();
    int err_fd = child->take_stderr_fd();
    {
        std::lock_guard<std::mutex> lk(mu_);
        child_ = std::move(child);
    }
    attach_reader(out_fd, false, gen);
    attach_reader(err_fd, true, gen);
    boost::asio::post(io_, [this, gen]() { tick_exit_monitor(gen); });

    // Bounded wait: output scan on the io thread, CLI query here.
    const uint64_t started = now_ms();
    const uint64_t deadline = started + cfg_.address_timeout_ms;
    uint64_t next_cli = started + cfg_.cli_poll_every_ms;
    uint32_t cli_attempts = 0;

    std::optional<std::string> address;
    std::optional<std::string> cli_ip;
    ErrorKind fail_kind = ErrorKind::Network;
    std::string fail_reason;

    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (gen != gen_) {
            fail_reason = "start aborted by stop";
            break;
        }
        // Failures win over an address seen in the same wakeup.
        poll_child_locked();
        if (fatal_reason_) {
            fail_reason = *fatal_reason_;
            break;
        }
        if (exited_) {
            fail_reason = "daemon exited prematurely (" + exit_desc_ + ")";
            break;
        }
        if (scanned_ip_ || cli_ip) {
            address = scanned_ip_ ? scanned_ip_ : cli_ip;
            break;
        }
        uint64_t now = now_ms();
        if (now >= deadline) {
            fail_kind = ErrorKind::Timeout;
            fail_reason = "no virtual address within " + std::to_string(cfg_.address_timeout_ms) + " ms";
            break;
        }
        if (now >= next_cli && cli_attempts < cfg_.cli_poll_attempts) {
            ++cli_attempts;
            next_cli = now + cfg_.cli_poll_every_ms;
            lk.unlock();
            auto ip = query_node_address(instance);
            lk.lock();
            if (ip) {
                logger_.info("virtual address from cli query #" + std::to_string(cli_attempts) + ": " + *ip);
                cli_ip = ip;
            }
            continue;
        }
        cv_.wait_for(lk, std::chrono::milliseconds(cfg_.address_poll_ms));
    }

    if (address) {
        virtual_ip_ = address;
        lk.unlock();
        set_state(TunnelState::Phase::Connected, *address);

        // The exit monitor only reports a lost session once the phase is
        // Connected; an exit that landed before that is caught here.
        lk.lock();
        poll_child_locked();
        if (gen == gen_ && !exited_) return *address;
        fail_reason = gen != gen_ ? "start aborted by stop"
                                  : "daemon exited right after reporting " + *address +
                                    " (" + exit_desc_ + ")";
        virtual_ip_.reset();
    }
    lk.unlock();

    logger_.error("tunnel start failed: " + fail_reason);
    set_state(TunnelState::Phase::Error, fail_reason);
    stop();
    throw Error(fail_kind, fail_reason);
}

// Requires mu_.
void TunnelSupervisor::poll_child_locked() {
    if (exited_ || !child_) return;
    if (child_->try_wait()) {
        exited_ = true;
        exit_desc_ = describe_exit_status(child_->exit_status());
    }
}

void TunnelSupervisor::attach_reader(int fd, bool is_stderr, uint64_t gen) {
    if (fd < 0) return;
    auto reader = std::make_shared<LineReader>(io_, fd);
    reader->start(
        [this, gen, is_stderr](const std::string& line) { on_output_line(gen, is_stderr, line); },
        [this, is_stderr]() {
            logger_.debug(std::string("daemon ") + (is_stderr ? "stderr" : "stdout") + " closed");
        });
}

void TunnelSupervisor::on_output_line(uint64_t gen, bool is_stderr, const std::string& line) {
    if (line.empty()) return;
    if (is_stderr) {
        logger_.warn("[daemon] " + line);
    } else {
        logger_.info("[daemon] " + line);
    }

    auto fatal = detect_fatal_line(line);
    std::optional<std::string> ip;
    if (!fatal) ip = scan_address_line(line);
    if (!fatal && !ip) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (gen != gen_) return;
    if (state_.phase != TunnelState::Phase::Connecting) {
        if (fatal) logger_.error("daemon reported fatal error after start: " + *fatal);
        return;
    }
    if (fatal && !fatal_reason_) {
        fatal_reason_ = *fatal;
        cv_.notify_all();
    } else if (ip && !scanned_ip_) {
        logger_.info("virtual address from daemon output: " + *ip);
        scanned_ip_ = ip;
        cv_.notify_all();
    }
}

void TunnelSupervisor::tick_exit_monitor(uint64_t gen) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (gen != gen_ || !child_) return;
    }
    exit_timer_.expires_after(std::chrono::milliseconds(cfg_.exit_check_ms));
    exit_timer_.async_wait([this, gen](boost::system::error_code ec) {
        if (ec) return;

        bool lost_session = false;
        std::string desc;
        {
            std::lock_guard<std::mutex> lk(mu_);
            // An exit noticed by start() is reported there.
            if (gen != gen_ || !child_ || exited_) return;
            if (child_->try_wait()) {
                exited_ = true;
                exit_desc_ = describe_exit_status(child_->exit_status());
                desc = exit_desc_;
                lost_session = state_.phase == TunnelState::Phase::Connected;
                cv_.notify_all();
            }
        }
        if (desc.empty()) {
            tick_exit_monitor(gen);
            return;
        }

        logger_.warn("daemon exited: " + desc);
        if (lost_session) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                virtual_ip_.reset();
            }
            set_state(TunnelState::Phase::Error, "daemon exited (" + desc + ")");
            emit(events::error("overlay daemon exited unexpectedly (" + desc + ")"));
        }
    });
}

std::optional<std::string> TunnelSupervisor::query_node_address(const std::string& instance) {
    std::vector<std::string> argv = {
        cfg_.cli_path, "--instance-name", instance, "--output", "json", "node", "info"
    };
    try {
        CommandResult res = run_command(argv, cfg_.cli_timeout_ms);
        if (!res.ok()) {
            logger_.debug("node info query failed: " +
                          (res.timed_out ? std::string("timed out") : trim(res.err)));
            return std::nullopt;
        }
        return parse_node_info_address(res.out);
    } catch (const Error& e) {
        logger_.debug(std::string("node info query not available: ") + e.what());
        return std::nullopt;
    }
}

std::vector<std::string> TunnelSupervisor::list_overlay_peers() {
    std::string instance;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!child_) throw Error(ErrorKind::Network, "tunnel is not running");
        instance = instance_;
    }
    std::vector<std::string> argv = {
        cfg_.cli_path, "--instance-name", instance, "--output", "json", "peer", "list"
    };
    try {
        CommandResult res = run_command(argv, cfg_.cli_timeout_ms);
        if (!res.ok()) {
            logger_.warn("peer list query failed: " +
                         (res.timed_out ? std::string("timed out") : trim(res.err)));
            return {};
        }
        return parse_peer_list_addresses(res.out);
    } catch (const Error& e) {
        logger_.warn(std::string("peer list query not available: ") + e.what());
        return {};
    }
}

void TunnelSupervisor::deregister_instance(const std::string& instance) {
    try {
        CommandResult res = run_command({cfg_.cli_path, "--instance-name", instance, "stop"},
                                        cfg_.cli_timeout_ms);
        if (res.ok()) {
            logger_.info("instance deregistered: " + instance);
        } else {
            logger_.debug("cli stop for " + instance + " returned " +
                          (res.timed_out ? std::string("timeout") : std::to_string(res.exit_code)));
        }
    } catch (const Error& e) {
        logger_.warn(std::string("cli stop failed: ") + e.what());
    }
}

void TunnelSupervisor::cleanup_adapters() {
    std::error_code ec;
    fs::directory_iterator it(cfg_.sysfs_net_dir, ec);
    if (ec) {
        logger_.debug("cannot enumerate " + cfg_.sysfs_net_dir + ": " + ec.message());
        return;
    }
    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (name.compare(0, cfg_.adapter_prefix.size(), cfg_.adapter_prefix) == 0) {
            names.push_back(name);
        }
    }
    for (const auto& name : names) {
        try {
            CommandResult down = run_command({cfg_.ip_tool, "link", "set", name, "down"}, cfg_.cli_timeout_ms);
            CommandResult del = run_command({cfg_.ip_tool, "link", "delete", name}, cfg_.cli_timeout_ms);
            if (down.ok() && del.ok()) {
                logger_.info("removed adapter " + name);
            } else {
                logger_.warn("adapter cleanup incomplete for " + name + ": " + trim(del.err));
            }
        } catch (const Error& e) {
            logger_.warn("adapter cleanup failed for " + name + ": " + e.what());
        }
    }
}

void TunnelSupervisor::remove_dir_with_retries(const std::string& dir) {
    uint32_t attempts = cfg_.dir_remove_attempts == 0 ? 1 : cfg_.dir_remove_attempts;
    for (uint32_t i = 1; i <= attempts; ++i) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (!ec && !fs::exists(dir, ec)) {
            logger_.debug("removed " + dir);
            return;
        }
        logger_.warn("remove " + dir + " attempt " + std::to_string(i) + " failed: " +
                     (ec ? ec.message() : std::string("still present")));
        if (i < attempts) sleep_ms(cfg_.dir_remove_backoff_ms);
    }
}

void TunnelSupervisor::stop() {
    std::unique_ptr<ChildProcess> child;
    std::string instance;
    std::string dir;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++gen_;
        child = std::move(child_);
        instance = instance_;
        dir = config_dir_;
        instance_.clear();
        config_dir_.clear();
        cv_.notify_all();
    }

    if (child) {
        logger_.info("stopping daemon pid=" + std::to_string(child->pid()));
        child->terminate(cfg_.stop_grace_ms);
        logger_.info("daemon stopped: " + describe_exit_status(child->exit_status()));
        child.reset();
        sleep_ms(kPostKillSettleMs);
    }
    if (!instance.empty()) {
        deregister_instance(instance);
        if (cfg_.adapter_cleanup) cleanup_adapters();
    }
    if (!dir.empty()) remove_dir_with_retries(dir);

    {
        std::lock_guard<std::mutex> lk(mu_);
        virtual_ip_.reset();
        scanned_ip_.reset();
        fatal_reason_.reset();
    }
    set_state(TunnelState::Phase::Disconnected, {});
}

std::string TunnelSupervisor::restart(const std::string& network_name,
                                      const std::string& secret,
                                      const std::string& rendezvous) {
    logger_.info("restarting tunnel");
    stop();
    sleep_ms(kRestartPauseMs);
    return start(network_name, secret, rendezvous);
}

} // namespace meshlobby
