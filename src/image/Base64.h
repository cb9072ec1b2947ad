// Base64 (RFC 4648) codec for data URI payloads

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MapForge {
namespace Base64 {

// Standard alphabet with '=' padding
std::string encode(const uint8_t* data, size_t size);

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

// Accepts padded or unpadded input; ASCII whitespace is skipped.
// Returns nullopt on characters outside the alphabet or a truncated final quantum.
std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace Base64
} // namespace MapForge
