#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "cli.hpp"
#include "config.hpp"
#include "console.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "lobby.hpp"
#include "tunnel.hpp"

using namespace meshlobby;

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " [config_path]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string cfg_path = "./config/default.conf";
    if (argc == 2) {
        cfg_path = argv[1];
    } else if (argc > 2) {
        usage(argv[0]);
        return 2;
    }

    Config cfg;
    std::string err;
    if (!load_config(cfg_path, cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }
    if (cfg.discovery_port == 0) {
        std::cerr << "discovery_port must be set (non-zero)\n";
        return 2;
    }
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(cfg.bind_ip, ec);
    if (ec) {
        std::cerr << "bind_ip must be a valid IPv4 address\n";
        return 2;
    }

    Logger logger(cfg.log_file, parse_log_level(cfg.log_level));
    Console console;
    logger.info("meshlobby starting, config=" + cfg_path);

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    TunnelSupervisor tunnel(io, cfg, logger);
    PeerDiscovery discovery(io, cfg, logger);
    LobbyManager lobby(tunnel, discovery, cfg, logger);

    auto to_console = [&console](const Event& ev) { console.notify(ev); };
    lobby.set_event_sink(to_console);
    tunnel.set_event_sink(to_console);
    discovery.set_event_sink([&lobby](const Event& ev) { lobby.on_discovery_event(ev); });

    std::unique_ptr<Cli> cli;
    std::thread shutdown_thread;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& sec, int sig) {
        if (sec) return;
        logger.info("signal " + std::to_string(sig) + ", shutting down");
        if (cli) cli->stop();
        // Teardown blocks; keep the loop free for the discovery socket.
        // Joined below, before any component is destroyed.
        shutdown_thread = std::thread([&]() {
            try {
                lobby.leave();
            } catch (const Error& e) {
                logger.info(std::string("leave on shutdown: ") + e.what());
            }
            boost::asio::post(io, [&io]() { io.stop(); });
        });
    });

    if (cfg.cli_enabled) {
        cli = std::make_unique<Cli>(io, lobby, tunnel, discovery, cfg, cfg_path, console);
        cli->start();
    }

    io.run();
    if (cli) {
        cli->stop();
        cli->join();
    }
    if (shutdown_thread.joinable()) shutdown_thread.join();

    // A session can survive here only when the loop was stopped externally.
    if (tunnel.is_running() || !tunnel.instance_name().empty()) tunnel.stop();
    logger.info("meshlobby stopped");
    return 0;
}
