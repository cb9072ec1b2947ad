#pragma once

// Roughness/metalness suggestions from an external vision-analysis reply.
// The reply is JSON: {"suggestedRoughness": 0.7, "suggestedMetalness": 0.1}.
// Anything unusable falls back to fixed defaults instead of failing.

#include "MapDerivation.h"
#include <string>

namespace MapForge {

struct MaterialHints {
    static constexpr double DEFAULT_ROUGHNESS = 0.6;
    static constexpr double DEFAULT_METALNESS = 0.0;

    // Multiplier used when the analysis reply was unusable
    static constexpr double FALLBACK_ROUGHNESS_MULTIPLIER = 0.6;

    double suggestedRoughness = DEFAULT_ROUGHNESS;   // [0,1]
    double suggestedMetalness = DEFAULT_METALNESS;   // [0,1]

    // True when the whole reply was unusable and both values are defaults
    bool fromFallback = true;

    static MaterialHints fallback() { return MaterialHints{}; }

    // A suggested roughness of exactly 0 counts as unset
    double effectiveRoughness() const {
        return suggestedRoughness > 0.0 ? suggestedRoughness : DEFAULT_ROUGHNESS;
    }

    // Parse a reply body. Numeric fields are clamped to [0,1]; missing or
    // non-numeric fields take their defaults.
    static MaterialHints parse(const std::string& replyText);

    static MaterialHints loadFromJson(const std::string& path);
};

namespace MaterialHintsMapping {

// Scale applied to the suggested roughness to form the roughness multiplier
constexpr double DEFAULT_ROUGHNESS_SCALE = 1.2;

// Metalness suggestions above this classify the texture as metal
constexpr double DEFAULT_METALNESS_THRESHOLD = 0.5;

// Fallback hints give {fallbackMultiplier, non-metal}; otherwise
// roughnessMultiplier = effectiveRoughness() * roughnessScale and
// isMetal = suggestedMetalness > metalnessThreshold.
DerivationParams toDerivationParams(const MaterialHints& hints, double normalStrength,
                                    double roughnessScale = DEFAULT_ROUGHNESS_SCALE,
                                    double metalnessThreshold = DEFAULT_METALNESS_THRESHOLD,
                                    double fallbackMultiplier = MaterialHints::FALLBACK_ROUGHNESS_MULTIPLIER);

} // namespace MaterialHintsMapping
} // namespace MapForge
