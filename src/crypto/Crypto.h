#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace meshlobby {
namespace crypto {

using Byte = unsigned char;
static constexpr std::size_t kSha256Size = 32;
static constexpr std::size_t kUuidSize = 16;

using Digest = std::array<Byte, kSha256Size>;

class Random final {
public:
    static std::vector<Byte> Bytes(std::size_t n);
    // Lowercase hex of n random bytes.
    static std::string Hex(std::size_t n);
    // RFC 4122 version 4, canonical 8-4-4-4-12 form.
    static std::string Uuid();
};

class Sha256 final {
public:
    static Digest Hash(const std::string& data);
    static std::string HexDigest(const std::string& data);
    // Short non-reversible tag safe to log in place of a secret.
    static std::string Fingerprint(const std::string& data, std::size_t hex_chars = 12);
};

std::string ToHex(const Byte* data, std::size_t len);

} // namespace crypto
} // namespace meshlobby
