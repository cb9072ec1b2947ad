#pragma once

// Lossless PNG serialization of PixelBuffers via lodepng.
// The PNG keeps the buffer's channel layout (RGB or RGBA, 8 bits per channel).

#include "PixelBuffer.h"
#include "derive/DeriveError.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MapForge {
namespace ImageEncoder {

std::optional<std::vector<uint8_t>> encodePng(const PixelBuffer& image, DeriveError* error = nullptr);

// "data:image/png;base64,..."
std::optional<std::string> encodeDataUri(const PixelBuffer& image, DeriveError* error = nullptr);

bool writePng(const PixelBuffer& image, const std::string& path, DeriveError* error = nullptr);

} // namespace ImageEncoder
} // namespace MapForge
