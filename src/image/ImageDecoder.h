#pragma once

// Decodes albedo input (raw bytes, data URI or file) into a PixelBuffer.
// PNG goes through lodepng, every other raster format through stb_image.
// Sources carrying alpha decode to RGBA, everything else to RGB.

#include "PixelBuffer.h"
#include "derive/DeriveError.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MapForge {
namespace ImageDecoder {

// True when the bytes start with the 8-byte PNG signature
bool isPng(const uint8_t* data, size_t size);

// Decode encoded image bytes. On failure returns nullopt and fills error (if given)
// with a DecodeError.
std::optional<PixelBuffer> decode(const uint8_t* data, size_t size, DeriveError* error = nullptr);

inline std::optional<PixelBuffer> decode(const std::vector<uint8_t>& bytes, DeriveError* error = nullptr) {
    return decode(bytes.data(), bytes.size(), error);
}

// Split "data:<mime>;base64,<payload>" and decode the payload.
// Only base64 data URIs are accepted.
std::optional<PixelBuffer> decodeDataUri(std::string_view uri, DeriveError* error = nullptr);

// Read a file and decode it
std::optional<PixelBuffer> decodeFile(const std::string& path, DeriveError* error = nullptr);

// Dispatch on the source text: data URIs are decoded inline, anything else is a path
std::optional<PixelBuffer> decodeSource(const std::string& source, DeriveError* error = nullptr);

bool isDataUri(std::string_view text);

} // namespace ImageDecoder
} // namespace MapForge
