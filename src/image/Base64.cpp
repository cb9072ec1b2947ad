#include "Base64.h"
#include <array>

namespace MapForge {
namespace Base64 {

namespace {

constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t INVALID = -1;
constexpr int8_t PADDING = -2;
constexpr int8_t SKIP = -3;

constexpr std::array<int8_t, 256> buildDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = INVALID;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    table[static_cast<uint8_t>('=')] = PADDING;
    table[static_cast<uint8_t>(' ')] = SKIP;
    table[static_cast<uint8_t>('\t')] = SKIP;
    table[static_cast<uint8_t>('\r')] = SKIP;
    table[static_cast<uint8_t>('\n')] = SKIP;
    return table;
}

constexpr std::array<int8_t, 256> DECODE_TABLE = buildDecodeTable();

} // namespace

std::string encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back(ALPHABET[triple & 0x3F]);
    }

    size_t remaining = size - i;
    if (remaining == 1) {
        uint32_t triple = uint32_t(data[i]) << 16;
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    int quantum = 0;      // sextets seen in the current 4-char group
    bool padded = false;

    for (char c : text) {
        int8_t v = DECODE_TABLE[static_cast<uint8_t>(c)];
        if (v == SKIP) continue;
        if (v == INVALID) return std::nullopt;
        if (v == PADDING) {
            padded = true;
            continue;
        }
        // Data after padding is malformed
        if (padded) return std::nullopt;

        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        quantum = (quantum + 1) % 4;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    // A single leftover sextet cannot encode a byte
    if (quantum == 1) return std::nullopt;

    return out;
}

} // namespace Base64
} // namespace MapForge
