#include "PixelBuffer.h"
#include <cmath>

namespace MapForge {

PixelBuffer::PixelBuffer(uint32_t w, uint32_t h, uint32_t c)
    : pixels(static_cast<size_t>(w) * h * c)
    , width(w)
    , height(h)
    , channels(c) {
}

bool PixelBuffer::isValid() const {
    return describeInvalid().empty();
}

std::string PixelBuffer::describeInvalid() const {
    if (width == 0 || height == 0) {
        return "empty image (" + std::to_string(width) + "x" + std::to_string(height) + ")";
    }
    if (channels != 3 && channels != 4) {
        return "unsupported channel count " + std::to_string(channels);
    }
    size_t expected = pixelCount() * channels;
    if (pixels.size() != expected) {
        return "pixel storage holds " + std::to_string(pixels.size()) +
               " bytes, expected " + std::to_string(expected);
    }
    return {};
}

uint8_t toChannel(double value) {
    if (!(value > 0.0)) return 0;     // also maps NaN to 0
    if (value >= 255.0) return 255;
    return static_cast<uint8_t>(std::nearbyint(value));
}

const char* mapKindName(MapKind kind) {
    switch (kind) {
        case MapKind::Albedo:           return "albedo";
        case MapKind::Normal:           return "normal";
        case MapKind::Roughness:        return "roughness";
        case MapKind::AmbientOcclusion: return "ao";
        case MapKind::Metalness:        return "metalness";
        case MapKind::Height:           return "height";
    }
    return "unknown";
}

const char* mapKindTag(MapKind kind) {
    switch (kind) {
        case MapKind::Albedo:           return "ALBEDO";
        case MapKind::Normal:           return "NORMAL";
        case MapKind::Roughness:        return "ROUGHNESS";
        case MapKind::AmbientOcclusion: return "AO";
        case MapKind::Metalness:        return "METALNESS";
        case MapKind::Height:           return "HEIGHT";
    }
    return "UNKNOWN";
}

} // namespace MapForge
