#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <cctype>

namespace meshlobby {

inline uint64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

inline int64_t unix_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

inline std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
    return s.substr(a, b-a);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::vector<std::string> split_list(const std::string& s, char sep = ',') {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        auto item = trim(s.substr(start, pos - start));
        if (!item.empty()) out.push_back(item);
        start = pos + 1;
    }
    return out;
}

// RFC 3339 UTC with second precision.
std::string format_utc(std::chrono::system_clock::time_point tp);

} // namespace meshlobby
