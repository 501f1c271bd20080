#pragma once

#include <boost/asio.hpp>

#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace meshlobby {

struct SpawnOptions {
    std::vector<std::string> argv;   // argv[0] is resolved through PATH
    std::string cwd;                 // empty: inherit
    std::vector<std::pair<std::string, std::string>> env; // overrides
    bool capture_output = true;      // pipe stdout/stderr back to the parent
};

// Owns a forked child and the read ends of its output pipes.
// The destructor kills and reaps a child that is still alive.
class ChildProcess {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::unique_ptr<ChildProcess> spawn(const SpawnOptions& opts);

    // Only spawn() can name a Token.
    explicit ChildProcess(Token) {}

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }
    int exit_status() const { return status_; }

    // Ownership of the fd passes to the caller; -1 once taken.
    int take_stdout_fd();
    int take_stderr_fd();

    // Non-blocking reap; true once the child has exited.
    bool try_wait();

    // SIGTERM, wait up to grace_ms, then SIGKILL and a blocking reap.
    void terminate(uint32_t grace_ms);

private:
    void close_fds();

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int status_ = 0;
};

std::string describe_exit_status(int status);

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string out;
    std::string err;

    bool ok() const { return !timed_out && exit_code == 0; }
};

// Runs a short-lived command to completion, collecting both streams.
// Throws Error(Process) when the command cannot be started.
CommandResult run_command(const std::vector<std::string>& argv, uint32_t timeout_ms);

// Drains one pipe line by line on the io_context until EOF.
class LineReader : public std::enable_shared_from_this<LineReader> {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using EofHandler = std::function<void()>;

    LineReader(boost::asio::io_context& io, int fd);

    void start(LineHandler on_line, EofHandler on_eof);

private:
    void read_next();

    boost::asio::posix::stream_descriptor sd_;
    boost::asio::streambuf buf_;
    LineHandler on_line_;
    EofHandler on_eof_;
};

} // namespace meshlobby
