#pragma once

// Shared validation and allocation for the map generators

#include "image/PixelBuffer.h"
#include "DeriveError.h"
#include <SDL3/SDL_log.h>
#include <new>
#include <optional>
#include <string>

namespace MapForge {
namespace MapGenerators {
namespace detail {

inline void reportFailure(DeriveError* error, DeriveErrorKind kind, MapKind map, const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MapGenerators: %s map: %s", mapKindName(map), message.c_str());
    if (error) {
        *error = makeError(kind, message, map);
    }
}

// Validate the source and allocate a same-sized output with the given channel count.
// Allocation failure is reported as RenderContextError.
inline std::optional<PixelBuffer> allocateOutput(const PixelBuffer& source, uint32_t channels,
                                                 MapKind map, DeriveError* error) {
    std::string invalid = source.describeInvalid();
    if (!invalid.empty()) {
        reportFailure(error, DeriveErrorKind::UnsupportedFormat, map, invalid);
        return std::nullopt;
    }

    try {
        return PixelBuffer(source.width, source.height, channels);
    } catch (const std::bad_alloc&) {
        reportFailure(error, DeriveErrorKind::RenderContextError, map,
                      "failed to allocate " + std::to_string(source.width) + "x" +
                      std::to_string(source.height) + " output");
        return std::nullopt;
    }
}

// Write one grayscale value per pixel computed from the source average; alpha is copied
template<typename Func>
std::optional<PixelBuffer> remapAverage(const PixelBuffer& source, MapKind map, DeriveError* error,
                                        Func&& valueForAverage) {
    auto output = allocateOutput(source, source.channels, map, error);
    if (!output) {
        return std::nullopt;
    }

    const uint32_t channels = source.channels;
    const size_t count = source.pixelCount();
    const uint8_t* src = source.pixels.data();
    uint8_t* dst = output->pixels.data();

    for (size_t i = 0; i < count; ++i) {
        size_t idx = i * channels;
        double avg = (src[idx + 0] + src[idx + 1] + src[idx + 2]) / 3.0;
        uint8_t val = toChannel(valueForAverage(avg));
        dst[idx + 0] = val;
        dst[idx + 1] = val;
        dst[idx + 2] = val;
        if (channels == 4) {
            dst[idx + 3] = src[idx + 3];
        }
    }

    return output;
}

} // namespace detail
} // namespace MapGenerators
} // namespace MapForge
