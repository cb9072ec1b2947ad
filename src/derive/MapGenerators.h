#pragma once

// Per-pixel PBR map derivation from an albedo image.
//
// Every generator is a pure function of (source, parameters): it validates the
// source, allocates a fresh output of identical width/height and never touches
// the source. Grayscale maps keep the source channel layout and copy its alpha;
// normal and metalness maps are always RGBA with opaque alpha.
//
// Luminance-driven remaps work on avg = (R+G+B)/3 in [0,255].

#include "image/PixelBuffer.h"
#include "DeriveError.h"
#include <cstdint>
#include <optional>

namespace MapForge {
namespace MapGenerators {

constexpr double ROUGHNESS_CONTRAST = 1.5;
constexpr double HEIGHT_CONTRAST = 1.2;
constexpr double AO_THRESHOLD = 100.0;

// Tangent-space normals from 3x3-smoothed luminance gradients. Neighbor samples
// are clamped to the image bounds (no wraparound), which differs from how a
// seamlessly tiling texture would be sampled at its borders.
std::optional<PixelBuffer> generateNormalMap(const PixelBuffer& source, double strength,
                                             DeriveError* error = nullptr);

// Darker = rougher: inverted luminance scaled by multiplier, then contrast boosted
std::optional<PixelBuffer> generateRoughnessMap(const PixelBuffer& source, double multiplier,
                                                DeriveError* error = nullptr);

// Hard threshold: below AO_THRESHOLD darkens linearly, above is unoccluded
std::optional<PixelBuffer> generateAmbientOcclusionMap(const PixelBuffer& source,
                                                       DeriveError* error = nullptr);

// Whole-texture classification, 255 for metal and 0 otherwise
std::optional<PixelBuffer> generateMetalnessMap(const PixelBuffer& source, bool isMetal,
                                                DeriveError* error = nullptr);

// Luminance with a mild fixed contrast boost
std::optional<PixelBuffer> generateHeightMap(const PixelBuffer& source,
                                             DeriveError* error = nullptr);

// Channel values for a single average, before byte conversion
double roughnessValue(double average, double multiplier);
double ambientOcclusionValue(double average);
double heightValue(double average);

} // namespace MapGenerators
} // namespace MapForge
