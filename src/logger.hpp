#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

namespace meshlobby {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

LogLevel parse_log_level(const std::string& s);

// Thread-safe logger shared by every component.
// - Appends to a file when one is open, otherwise writes to stderr.
// - Never used for console interaction.
class Logger {
public:
    Logger() = default;
    explicit Logger(const std::string& path, LogLevel lvl = LogLevel::INFO);

    bool open(const std::string& path);
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void log(LogLevel lvl, const std::string& msg);
    static std::string ts();
    static const char* level_str(LogLevel lvl);

    std::mutex mu_;
    std::ofstream out_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace meshlobby
