#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "console.hpp"
#include "discovery.hpp"
#include "lobby.hpp"
#include "tunnel.hpp"

namespace meshlobby {

// Splits a command line on whitespace; double quotes group words.
std::vector<std::string> tokenize_command(const std::string& line);

class Cli {
public:
    Cli(boost::asio::io_context& io, LobbyManager& lobby, TunnelSupervisor& tunnel,
        PeerDiscovery& discovery, Config& cfg, const std::string& cfg_path, Console& console);

    void start();
    // Asks the input loop to exit; join() then returns promptly.
    void stop();
    void join();

    // Executes one command line; false when the shell should exit.
    bool execute(const std::string& line);

private:
    void run();
    void cmd_create_or_join(const std::vector<std::string>& args, bool join);
    void cmd_leave();
    void cmd_status();
    void cmd_members();
    void cmd_peers();
    void cmd_overlay_peers();
    void cmd_mic(const std::vector<std::string>& args);
    void cmd_mute(const std::vector<std::string>& args);
    void cmd_signal(const std::vector<std::string>& args);
    void cmd_name(const std::vector<std::string>& args);
    void shutdown();

    boost::asio::io_context& io_;
    LobbyManager& lobby_;
    TunnelSupervisor& tunnel_;
    PeerDiscovery& discovery_;
    Config& cfg_;
    std::string cfg_path_;
    Console& console_;

    std::atomic<bool> stop_{false};
    std::thread th_;
};

} // namespace meshlobby
