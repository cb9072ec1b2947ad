#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

namespace MapForge {

// 8-bit interleaved pixel storage, row-major with no row padding.
// channels is 3 (RGB) or 4 (RGBA).
struct PixelBuffer {
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t channels = 0;

    PixelBuffer() = default;
    PixelBuffer(uint32_t w, uint32_t h, uint32_t c);

    bool hasAlpha() const { return channels == 4; }

    size_t pixelCount() const { return static_cast<size_t>(width) * height; }

    size_t pixelIndex(uint32_t x, uint32_t y) const {
        return (static_cast<size_t>(y) * width + x) * channels;
    }

    // Mean of R,G,B in [0,255]
    double average(uint32_t x, uint32_t y) const {
        size_t idx = pixelIndex(x, y);
        return (pixels[idx + 0] + pixels[idx + 1] + pixels[idx + 2]) / 3.0;
    }

    // Mean of R,G,B normalized to [0,1]
    double luminance(uint32_t x, uint32_t y) const {
        size_t idx = pixelIndex(x, y);
        return (pixels[idx + 0] + pixels[idx + 1] + pixels[idx + 2]) / 765.0;
    }

    uint8_t alpha(uint32_t x, uint32_t y) const {
        return hasAlpha() ? pixels[pixelIndex(x, y) + 3] : 255;
    }

    // Dimensions are positive, channel count supported and storage matches
    bool isValid() const;

    bool sameDimensions(const PixelBuffer& other) const {
        return width == other.width && height == other.height;
    }

    // Describes why isValid() fails, empty when valid
    std::string describeInvalid() const;
};

// Clamp to [0,255] and round half to even, matching an 8-bit clamped canvas store
uint8_t toChannel(double value);

enum class MapKind : uint8_t {
    Albedo = 0,
    Normal,
    Roughness,
    AmbientOcclusion,
    Metalness,
    Height
};

// Lower-case identifier, e.g. "ao"
const char* mapKindName(MapKind kind);

// Upper-case export tag, e.g. "AO"
const char* mapKindTag(MapKind kind);

struct MaterialMap {
    MapKind kind = MapKind::Albedo;
    PixelBuffer image;
};

} // namespace MapForge
