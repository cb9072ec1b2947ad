#include "MapGenerators.h"
#include "GeneratorSupport.h"
#include <algorithm>

namespace MapForge {
namespace MapGenerators {

double roughnessValue(double average, double multiplier) {
    double val = (255.0 - average) * multiplier;
    val = ((val / 255.0 - 0.5) * ROUGHNESS_CONTRAST + 0.5) * 255.0;
    return std::clamp(val, 0.0, 255.0);
}

double ambientOcclusionValue(double average) {
    return average < AO_THRESHOLD ? (average / AO_THRESHOLD) * 255.0 : 255.0;
}

double heightValue(double average) {
    double val = ((average / 255.0 - 0.5) * HEIGHT_CONTRAST + 0.5) * 255.0;
    return std::clamp(val, 0.0, 255.0);
}

std::optional<PixelBuffer> generateRoughnessMap(const PixelBuffer& source, double multiplier,
                                                DeriveError* error) {
    return detail::remapAverage(source, MapKind::Roughness, error,
                                [multiplier](double avg) { return roughnessValue(avg, multiplier); });
}

std::optional<PixelBuffer> generateAmbientOcclusionMap(const PixelBuffer& source, DeriveError* error) {
    return detail::remapAverage(source, MapKind::AmbientOcclusion, error, ambientOcclusionValue);
}

std::optional<PixelBuffer> generateHeightMap(const PixelBuffer& source, DeriveError* error) {
    return detail::remapAverage(source, MapKind::Height, error, heightValue);
}

std::optional<PixelBuffer> generateMetalnessMap(const PixelBuffer& source, bool isMetal,
                                                DeriveError* error) {
    auto output = detail::allocateOutput(source, 4, MapKind::Metalness, error);
    if (!output) {
        return std::nullopt;
    }

    const uint8_t val = isMetal ? 255 : 0;
    uint8_t* dst = output->pixels.data();
    const size_t count = output->pixelCount();
    for (size_t i = 0; i < count; ++i) {
        dst[i * 4 + 0] = val;
        dst[i * 4 + 1] = val;
        dst[i * 4 + 2] = val;
        dst[i * 4 + 3] = 255;
    }

    return output;
}

} // namespace MapGenerators
} // namespace MapForge
