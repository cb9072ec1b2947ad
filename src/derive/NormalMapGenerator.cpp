#include "MapGenerators.h"
#include "GeneratorSupport.h"
#include <glm/glm.hpp>
#include <algorithm>
#include <new>
#include <vector>

namespace MapForge {
namespace MapGenerators {

namespace {

// Smoothed heights on a grid padded by one pixel on every side, so the
// gradient taps at x-1, x+1, y-1, y+1 can be read for border pixels.
// Only the 3x3 neighbor coordinates are clamped, the tap centre is not:
// the value at (-1, y) averages column 0 three times.
class SmoothedHeightField {
public:
    explicit SmoothedHeightField(const PixelBuffer& source)
        : width_(static_cast<int>(source.width))
        , height_(static_cast<int>(source.height))
        , stride_(width_ + 2) {
        std::vector<double> lum(static_cast<size_t>(width_) * height_);
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                lum[static_cast<size_t>(y) * width_ + x] = source.luminance(x, y);
            }
        }

        heights_.resize(static_cast<size_t>(stride_) * (height_ + 2));
        for (int py = -1; py <= height_; ++py) {
            for (int px = -1; px <= width_; ++px) {
                double total = 0.0;
                for (int ox = -1; ox <= 1; ++ox) {
                    int nx = std::clamp(px + ox, 0, width_ - 1);
                    for (int oy = -1; oy <= 1; ++oy) {
                        int ny = std::clamp(py + oy, 0, height_ - 1);
                        total += lum[static_cast<size_t>(ny) * width_ + nx];
                    }
                }
                heights_[index(px, py)] = total / 9.0;
            }
        }
    }

    // x in [-1, width], y in [-1, height]
    double at(int x, int y) const { return heights_[index(x, y)]; }

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y + 1) * stride_ + static_cast<size_t>(x + 1);
    }

    int width_;
    int height_;
    int stride_;
    std::vector<double> heights_;
};

} // namespace

std::optional<PixelBuffer> generateNormalMap(const PixelBuffer& source, double strength,
                                             DeriveError* error) {
    auto output = detail::allocateOutput(source, 4, MapKind::Normal, error);
    if (!output) {
        return std::nullopt;
    }

    try {
        SmoothedHeightField field(source);

        const int width = static_cast<int>(source.width);
        const int height = static_cast<int>(source.height);
        uint8_t* dst = output->pixels.data();

        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                double hL = field.at(x - 1, y);
                double hR = field.at(x + 1, y);
                double hU = field.at(x, y - 1);
                double hD = field.at(x, y + 1);

                glm::dvec3 normal = glm::normalize(glm::dvec3(
                    (hL - hR) * strength,
                    (hU - hD) * strength,
                    1.0));

                // [-1,1] -> [0,255]
                glm::dvec3 encoded = (normal * 0.5 + 0.5) * 255.0;

                size_t idx = (static_cast<size_t>(y) * width + x) * 4;
                dst[idx + 0] = toChannel(encoded.x);
                dst[idx + 1] = toChannel(encoded.y);
                dst[idx + 2] = toChannel(encoded.z);
                dst[idx + 3] = 255;
            }
        }
    } catch (const std::bad_alloc&) {
        detail::reportFailure(error, DeriveErrorKind::RenderContextError, MapKind::Normal,
                              "failed to allocate height field");
        return std::nullopt;
    }

    return output;
}

} // namespace MapGenerators
} // namespace MapForge
