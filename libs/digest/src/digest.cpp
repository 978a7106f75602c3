#include "geometrytools/digest.h"

#include <openssl/evp.h>

#include <format>
#include <memory>
#include <stdexcept>

namespace geometrytools::digest {

MD5Digest md5(const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("digest: failed to create hash context");

    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("digest: failed to initialize MD5");

    if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1)
        throw std::runtime_error(std::format("digest: failed to hash {} bytes", size));

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1)
        throw std::runtime_error("digest: failed to finalize MD5");
    if (out_len != 16)
        throw std::runtime_error(std::format("digest: unexpected MD5 length {}", out_len));

    MD5Digest d{};
    for (size_t i = 0; i < d.size(); i++)
        d[i] = out[i];
    return d;
}

MD5Digest md5(const std::vector<uint8_t>& data) {
    return md5(data.data(), data.size());
}

const MD5Digest& md5_empty() {
    static const MD5Digest empty = md5(nullptr, 0);
    return empty;
}

std::string to_hex(const MD5Digest& d) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (uint8_t b : d) {
        s += digits[b >> 4];
        s += digits[b & 0x0F];
    }
    return s;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<MD5Digest> parse_hex(std::string_view s) {
    if (s.size() != 32) return std::nullopt;
    MD5Digest d{};
    for (size_t i = 0; i < d.size(); i++) {
        int hi = hex_value(s[i * 2]);
        int lo = hex_value(s[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        d[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

} // namespace geometrytools::digest
