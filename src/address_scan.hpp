#pragma once

#include <optional>
#include <string>
#include <vector>

namespace meshlobby {

// Dotted-quad parsing and the validity filter applied to every candidate
// virtual address, whether it was scraped from daemon output or returned by
// the companion CLI.

bool is_valid_ipv4(const std::string& ip);
bool is_private_ipv4(const std::string& ip);
bool is_loopback_ipv4(const std::string& ip);
bool is_host_octet(const std::string& ip);

// private && !loopback && host octet in 1..254
bool is_acceptable_virtual_ip(const std::string& ip);

// "10.1.2.3/24" -> "10.1.2.3"
std::string strip_cidr(const std::string& s);

// First dotted quad in the line that passes is_acceptable_virtual_ip.
std::optional<std::string> extract_ip_from_line(const std::string& line);

// Keyword heuristic: does this output line announce an assigned address?
bool is_address_line(const std::string& line);

// Full stdout/stderr line scan: keyword heuristic, then extraction.
std::optional<std::string> scan_address_line(const std::string& line);

// Non-empty when the line reports an unrecoverable daemon failure.
std::optional<std::string> detect_fatal_line(const std::string& line);

// `node info` JSON -> first acceptable address under the known field names.
std::optional<std::string> parse_node_info_address(const std::string& json_text);

// `peer list` JSON -> every valid peer address.
std::vector<std::string> parse_peer_list_addresses(const std::string& json_text);

// x.y.z.255 for a /prefix_len network containing ip, or empty on bad input.
std::string broadcast_for(const std::string& ip, unsigned prefix_len = 24);

} // namespace meshlobby
