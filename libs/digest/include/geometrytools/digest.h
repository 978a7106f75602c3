#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geometrytools::digest {

using MD5Digest = std::array<uint8_t, 16>;

// md5 hashes size bytes starting at data. Throws std::runtime_error if
// OpenSSL fails to provide the digest.
MD5Digest md5(const uint8_t* data, size_t size);
MD5Digest md5(const std::vector<uint8_t>& data);

// md5_empty returns the digest of the empty byte string.
const MD5Digest& md5_empty();

// to_hex formats a digest as 32 lowercase hex digits.
std::string to_hex(const MD5Digest& d);

// parse_hex accepts 32 hex digits in either case.
std::optional<MD5Digest> parse_hex(std::string_view s);

} // namespace geometrytools::digest
