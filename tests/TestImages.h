#pragma once

// Small synthetic albedo images shared by the test files

#include "image/PixelBuffer.h"
#include <cstdint>

namespace TestImages {

inline MapForge::PixelBuffer solid(uint32_t w, uint32_t h, uint32_t channels,
                                   uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    MapForge::PixelBuffer image(w, h, channels);
    for (size_t i = 0; i < image.pixelCount(); ++i) {
        size_t idx = i * channels;
        image.pixels[idx + 0] = r;
        image.pixels[idx + 1] = g;
        image.pixels[idx + 2] = b;
        if (channels == 4) {
            image.pixels[idx + 3] = a;
        }
    }
    return image;
}

// Deterministic noise-like pattern with varying alpha
inline MapForge::PixelBuffer pattern(uint32_t w, uint32_t h, uint32_t channels) {
    MapForge::PixelBuffer image(w, h, channels);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            size_t idx = image.pixelIndex(x, y);
            image.pixels[idx + 0] = static_cast<uint8_t>((x * 37 + y * 11) & 0xFF);
            image.pixels[idx + 1] = static_cast<uint8_t>((x * 5 + y * 53) & 0xFF);
            image.pixels[idx + 2] = static_cast<uint8_t>((x * y * 7 + 19) & 0xFF);
            if (channels == 4) {
                image.pixels[idx + 3] = static_cast<uint8_t>((x * 29 + y * 3 + 40) & 0xFF);
            }
        }
    }
    return image;
}

// Every row is value(x) = x * step, so only horizontal gradients exist
inline MapForge::PixelBuffer horizontalRamp(uint32_t w, uint32_t h, uint8_t step) {
    MapForge::PixelBuffer image(w, h, 4);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            size_t idx = image.pixelIndex(x, y);
            uint8_t v = static_cast<uint8_t>(x * step);
            image.pixels[idx + 0] = v;
            image.pixels[idx + 1] = v;
            image.pixels[idx + 2] = v;
            image.pixels[idx + 3] = 255;
        }
    }
    return image;
}

// Storage does not match the declared dimensions
inline MapForge::PixelBuffer malformed() {
    MapForge::PixelBuffer image;
    image.width = 2;
    image.height = 2;
    image.channels = 4;
    image.pixels.resize(3);
    return image;
}

} // namespace TestImages
