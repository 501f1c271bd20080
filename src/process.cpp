#include "process.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace meshlobby {
namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int r = -1;
    int w = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        r = fds[0];
        w = fds[1];
        return true;
    }
    void close_both() {
        close_fd(r);
        close_fd(w);
    }
};

// Runs in the forked child; only returns through _exit.
[[noreturn]] void exec_child(const SpawnOptions& opts,
                             char* const* argv,
                             const Pipe& out,
                             const Pipe& err,
                             int status_w) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    if (opts.capture_output) {
        ::dup2(out.w, STDOUT_FILENO);
        ::dup2(err.w, STDERR_FILENO);
    } else if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
    }

    // Inherited sockets and files must not leak into the daemon.
    for (int fd = 3; fd < 1024; fd++) {
        if (fd != status_w) ::close(fd);
    }

    for (const auto& kv : opts.env) {
        ::setenv(kv.first.c_str(), kv.second.c_str(), 1);
    }
    if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) {
        int e = errno;
        (void)!::write(status_w, &e, sizeof(e));
        _exit(127);
    }

    ::execvp(argv[0], argv);

    int e = errno;
    (void)!::write(status_w, &e, sizeof(e));
    _exit(127);
}

} // namespace

std::string describe_exit_status(int status) {
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "killed by signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnOptions& opts) {
    if (opts.argv.empty() || opts.argv[0].empty()) {
        throw Error(ErrorKind::Process, "empty command line");
    }

    std::vector<std::string> args = opts.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    Pipe out, err, status;
    if ((opts.capture_output && (!out.open() || !err.open())) || !status.open()) {
        int e = errno;
        out.close_both();
        err.close_both();
        status.close_both();
        throw Error(ErrorKind::Process, std::string("pipe failed: ") + std::strerror(e));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        out.close_both();
        err.close_both();
        status.close_both();
        throw Error(ErrorKind::Process, std::string("fork failed: ") + std::strerror(e));
    }
    if (pid == 0) {
        exec_child(opts, argv.data(), out, err, status.w);
    }

    // Parent process
    close_fd(out.w);
    close_fd(err.w);
    close_fd(status.w);

    // The status pipe is close-on-exec: EOF means exec succeeded, an errno
    // value means it did not.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status.r, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status.r);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(pid, nullptr, 0);
        out.close_both();
        err.close_both();
        throw Error(ErrorKind::Process,
                    "failed to start " + opts.argv[0] + ": " + std::strerror(child_errno));
    }

    auto child = std::make_unique<ChildProcess>(Token{});
    child->pid_ = pid;
    child->stdout_fd_ = out.r;
    child->stderr_fd_ = err.r;
    return child;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
        ::waitpid(pid_, &status_, 0);
        reaped_ = true;
    }
    close_fds();
}

void ChildProcess::close_fds() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

int ChildProcess::take_stdout_fd() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::take_stderr_fd() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

bool ChildProcess::try_wait() {
    if (reaped_) return true;
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;
    if (r == pid_) status_ = status;
    // r < 0 (ECHILD) also means there is nothing left to wait for.
    reaped_ = true;
    return true;
}

void ChildProcess::terminate(uint32_t grace_ms) {
    if (try_wait()) return;

    ::kill(pid_, SIGTERM);
    uint64_t deadline = now_ms() + grace_ms;
    while (now_ms() < deadline) {
        if (try_wait()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::kill(pid_, SIGKILL);
    int status = 0;
    if (::waitpid(pid_, &status, 0) == pid_) status_ = status;
    reaped_ = true;
}

CommandResult run_command(const std::vector<std::string>& argv, uint32_t timeout_ms) {
    SpawnOptions opts;
    opts.argv = argv;
    auto child = ChildProcess::spawn(opts);

    int fds[2] = {child->take_stdout_fd(), child->take_stderr_fd()};
    std::string* sinks[2];
    CommandResult res;
    sinks[0] = &res.out;
    sinks[1] = &res.err;

    uint64_t deadline = now_ms() + timeout_ms;
    char buf[4096];
    while (fds[0] >= 0 || fds[1] >= 0) {
        uint64_t now = now_ms();
        if (now >= deadline) {
            res.timed_out = true;
            break;
        }
        pollfd pfds[2];
        nfds_t count = 0;
        int index[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count].fd = fds[i];
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            index[count] = i;
            ++count;
        }
        int rc = ::poll(pfds, count, static_cast<int>(deadline - now));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t k = 0; k < count; ++k) {
            if (pfds[k].revents == 0) continue;
            int i = index[k];
            ssize_t n = ::read(fds[i], buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i]);
            }
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    if (res.timed_out) {
        child->terminate(0);
    } else {
        uint64_t reap_deadline = now_ms() + 1000;
        while (!child->try_wait() && now_ms() < reap_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!child->reaped()) {
            res.timed_out = true;
            child->terminate(0);
        }
    }

    int status = child->exit_status();
    if (!res.timed_out && WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    return res;
}

LineReader::LineReader(boost::asio::io_context& io, int fd) : sd_(io) {
    sd_.assign(fd);
}

void LineReader::start(LineHandler on_line, EofHandler on_eof) {
    on_line_ = std::move(on_line);
    on_eof_ = std::move(on_eof);
    auto self = shared_from_this();
    boost::asio::post(sd_.get_executor(), [self]() { self->read_next(); });
}

void LineReader::read_next() {
    auto self = shared_from_this();
    boost::asio::async_read_until(sd_, buf_, '\n',
                                  [self](boost::system::error_code ec, std::size_t n) {
        if (!ec) {
            std::string line(boost::asio::buffers_begin(self->buf_.data()),
                             boost::asio::buffers_begin(self->buf_.data()) + n);
            self->buf_.consume(n);
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
            if (self->on_line_) self->on_line_(line);
            self->read_next();
            return;
        }

        // EOF or a closed pipe: flush an unterminated last line, then stop.
        if (self->buf_.size() > 0) {
            std::string rest(boost::asio::buffers_begin(self->buf_.data()),
                             boost::asio::buffers_end(self->buf_.data()));
            self->buf_.consume(self->buf_.size());
            while (!rest.empty() && (rest.back() == '\n' || rest.back() == '\r')) rest.pop_back();
            if (!rest.empty() && self->on_line_) self->on_line_(rest);
        }
        boost::system::error_code ignored;
        self->sd_.close(ignored);
        if (self->on_eof_) self->on_eof_();
    });
}

} // namespace meshlobby
