#include "logger.hpp"

#include "util.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace meshlobby {

LogLevel parse_log_level(const std::string& s) {
    const std::string l = to_lower(trim(s));
    if (l == "debug") return LogLevel::DEBUG;
    if (l == "warn" || l == "warning") return LogLevel::WARN;
    if (l == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger::Logger(const std::string& path, LogLevel lvl) : level_(lvl) {
    if (!path.empty() && !open(path)) {
        std::cerr << "cannot open log file " << path << ", logging to stderr\n";
    }
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    if (out_.is_open()) out_.close();
    out_.clear();
    out_.open(path, std::ios::out | std::ios::app);
    return out_.is_open();
}

void Logger::set_level(LogLevel lvl) {
    level_.store(lvl);
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { log(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { log(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

// Local wall clock, millisecond precision.
std::string Logger::ts() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t tt = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(level_.load())) return;

    std::string line = ts();
    line += " [";
    line += level_str(lvl);
    line += "] ";
    line += msg;
    line += '\n';

    std::lock_guard<std::mutex> lk(mu_);
    std::ostream& sink = out_.is_open() ? static_cast<std::ostream&>(out_) : std::cerr;
    sink << line;
    sink.flush();
}

} // namespace meshlobby
