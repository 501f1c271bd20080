#include "address_scan.hpp"

#include "util.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <regex>

namespace meshlobby {
namespace {

const std::array<const char*, 5> kNodeInfoFields = {
    "virtual_ipv4", "ipv4", "virtual_ip", "ip", "ipv4_addr"
};

bool parse_octets(const std::string& ip, std::array<int, 4>& out) {
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        size_t end = ip.find('.', start);
        if (i < 3 && end == std::string::npos) return false;
        if (i == 3) {
            if (end != std::string::npos) return false;
            end = ip.size();
        }
        std::string part = ip.substr(start, end - start);
        if (part.empty() || part.size() > 3) return false;
        int v = 0;
        for (char c : part) {
            if (c < '0' || c > '9') return false;
            v = v * 10 + (c - '0');
        }
        if (v > 255) return false;
        out[static_cast<size_t>(i)] = v;
        start = end + 1;
    }
    return true;
}

// Accepts a bare string or {"address": "..."} style nesting.
std::optional<std::string> json_address_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_object()) {
        for (const char* key : {"address", "addr", "ip"}) {
            auto it = v.find(key);
            if (it != v.end() && it->is_string()) return it->get<std::string>();
        }
    }
    return std::nullopt;
}

void collect_peer_address(const nlohmann::json& peer, std::vector<std::string>& out) {
    if (!peer.is_object()) return;
    for (const char* key : {"virtual_ipv4", "ipv4"}) {
        auto it = peer.find(key);
        if (it == peer.end()) continue;
        auto s = json_address_string(*it);
        if (!s) continue;
        auto ip = strip_cidr(*s);
        if (is_valid_ipv4(ip)) {
            out.push_back(ip);
            return;
        }
    }
}

} // namespace

bool is_valid_ipv4(const std::string& ip) {
    std::array<int, 4> o{};
    return parse_octets(ip, o);
}

bool is_private_ipv4(const std::string& ip) {
    std::array<int, 4> o{};
    if (!parse_octets(ip, o)) return false;
    if (o[0] == 10) return true;
    if (o[0] == 172 && o[1] >= 16 && o[1] <= 31) return true;
    if (o[0] == 192 && o[1] == 168) return true;
    return false;
}

bool is_loopback_ipv4(const std::string& ip) {
    std::array<int, 4> o{};
    return parse_octets(ip, o) && o[0] == 127;
}

bool is_host_octet(const std::string& ip) {
    std::array<int, 4> o{};
    return parse_octets(ip, o) && o[3] >= 1 && o[3] <= 254;
}

bool is_acceptable_virtual_ip(const std::string& ip) {
    return is_private_ipv4(ip) && !is_loopback_ipv4(ip) && is_host_octet(ip);
}

std::string strip_cidr(const std::string& s) {
    auto t = trim(s);
    auto slash = t.find('/');
    return slash == std::string::npos ? t : t.substr(0, slash);
}

std::optional<std::string> extract_ip_from_line(const std::string& line) {
    static const std::regex kQuad(R"(\b(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})\b)");
    for (auto it = std::sregex_iterator(line.begin(), line.end(), kQuad);
         it != std::sregex_iterator(); ++it) {
        std::string ip = (*it)[1].str();
        if (is_acceptable_virtual_ip(ip)) return ip;
    }
    return std::nullopt;
}

bool is_address_line(const std::string& line) {
    // Config echoes and listener banners carry addresses that are not ours.
    if (line.find("local_addr") != std::string::npos ||
        line.find("local:") != std::string::npos ||
        line.find("ipv4 = \"") != std::string::npos ||
        line.find("listeners") != std::string::npos) {
        return false;
    }

    auto l = to_lower(line);
    return l.find("virtual ip") != std::string::npos ||
           l.find("assigned ip") != std::string::npos ||
           l.find("dhcp") != std::string::npos ||
           l.find("got ip") != std::string::npos ||
           l.find("ipv4 address") != std::string::npos ||
           l.find("ip addr") != std::string::npos ||
           l.find("my ipv4") != std::string::npos ||
           (l.find("ipv4") != std::string::npos && l.find('=') != std::string::npos);
}

std::optional<std::string> scan_address_line(const std::string& line) {
    if (!is_address_line(line)) return std::nullopt;
    return extract_ip_from_line(line);
}

std::optional<std::string> detect_fatal_line(const std::string& line) {
    bool is_error = line.find("error") != std::string::npos ||
                    line.find("Error") != std::string::npos ||
                    line.find("ERROR") != std::string::npos;
    if (!is_error) return std::nullopt;
    if (line.find("tun device error") != std::string::npos ||
        line.find("Failed to create adapter") != std::string::npos) {
        return std::string("virtual adapter creation failed (is the TUN driver available "
                           "and the process privileged?): ") + trim(line);
    }
    return std::nullopt;
}

std::optional<std::string> parse_node_info_address(const std::string& json_text) {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    for (const char* field : kNodeInfoFields) {
        auto it = j.find(field);
        if (it == j.end()) continue;
        auto s = json_address_string(*it);
        if (!s) continue;
        auto ip = strip_cidr(*s);
        if (is_valid_ipv4(ip) && is_acceptable_virtual_ip(ip)) return ip;
    }
    return std::nullopt;
}

std::vector<std::string> parse_peer_list_addresses(const std::string& json_text) {
    std::vector<std::string> out;
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) return out;

    if (j.is_array()) {
        for (const auto& peer : j) collect_peer_address(peer, out);
    } else if (j.is_object()) {
        auto it = j.find("peers");
        if (it != j.end() && it->is_array()) {
            for (const auto& peer : *it) collect_peer_address(peer, out);
        }
    }
    return out;
}

std::string broadcast_for(const std::string& ip, unsigned prefix_len) {
    if (!is_valid_ipv4(ip) || prefix_len > 32) return {};
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(ip, ec);
    if (ec) return {};
    uint32_t host_mask = prefix_len == 0 ? 0xffffffffu : ((1u << (32 - prefix_len)) - 1u);
    if (prefix_len == 32) host_mask = 0;
    auto bcast = boost::asio::ip::address_v4(addr.to_uint() | host_mask);
    return bcast.to_string();
}

} // namespace meshlobby
