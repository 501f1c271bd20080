#include "Crypto.h"

#include <limits>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace meshlobby {
namespace crypto {
namespace {

inline void EnsureOpenSslInitialized() {
    static const int kInitOnce = []() -> int {
        OPENSSL_init_crypto(0, nullptr);
        return 1;
    }();
    (void)kInitOnce;
}

std::string GetOpenSslErrorString() {
    std::string out;
    for (;;) {
        unsigned long err = ERR_get_error();
        if (err == 0) break;
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) out += " | ";
        out += buf;
    }
    return out.empty() ? std::string("unknown OpenSSL error") : out;
}

[[noreturn]] void ThrowOpenSslError(const char* where) {
    throw std::runtime_error(std::string(where) + ": " + GetOpenSslErrorString());
}

inline void CheckSizeFitsInt(std::size_t n, const char* what) {
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for OpenSSL int length");
    }
}

} // namespace

std::string ToHex(const Byte* data, std::size_t len) {
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::vector<Byte> Random::Bytes(std::size_t n) {
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(n, "random length");
    std::vector<Byte> out(n);
    if (n == 0) return out;
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        ThrowOpenSslError("RAND_bytes");
    }
    return out;
}

std::string Random::Hex(std::size_t n) {
    auto bytes = Bytes(n);
    return ToHex(bytes.data(), bytes.size());
}

std::string Random::Uuid() {
    auto b = Bytes(kUuidSize);
    b[6] = static_cast<Byte>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<Byte>((b[8] & 0x3f) | 0x80);
    std::string hex = ToHex(b.data(), b.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

Digest Sha256::Hash(const std::string& data) {
    EnsureOpenSslInitialized();
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) ThrowOpenSslError("EVP_MD_CTX_new");

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ThrowOpenSslError("EVP_DigestInit_ex");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        ThrowOpenSslError("EVP_DigestUpdate");
    }
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != kSha256Size) {
        ThrowOpenSslError("EVP_DigestFinal_ex");
    }
    return out;
}

std::string Sha256::HexDigest(const std::string& data) {
    auto d = Hash(data);
    return ToHex(d.data(), d.size());
}

std::string Sha256::Fingerprint(const std::string& data, std::size_t hex_chars) {
    auto hex = HexDigest(data);
    if (hex_chars < hex.size()) hex.resize(hex_chars);
    return hex;
}

} // namespace crypto
} // namespace meshlobby
