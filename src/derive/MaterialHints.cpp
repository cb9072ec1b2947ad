#include "MaterialHints.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace MapForge {

namespace {

// Accepts integer or floating JSON numbers; NaN/inf never reach here from a parsed document
bool readUnitNumber(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return false;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return false;
    }
    out = std::clamp(value, 0.0, 1.0);
    return true;
}

} // namespace

MaterialHints MaterialHints::parse(const std::string& replyText) {
    if (replyText.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MaterialHints: Empty analysis reply, using defaults");
        return fallback();
    }

    json j = json::parse(replyText, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MaterialHints: Analysis reply is not a JSON object, using defaults");
        return fallback();
    }

    MaterialHints hints;
    hints.fromFallback = false;

    if (!readUnitNumber(j, "suggestedRoughness", hints.suggestedRoughness)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "MaterialHints: suggestedRoughness missing or not a number, using %.2f", DEFAULT_ROUGHNESS);
        hints.suggestedRoughness = DEFAULT_ROUGHNESS;
    }
    if (!readUnitNumber(j, "suggestedMetalness", hints.suggestedMetalness)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "MaterialHints: suggestedMetalness missing or not a number, using %.2f", DEFAULT_METALNESS);
        hints.suggestedMetalness = DEFAULT_METALNESS;
    }

    SDL_Log("MaterialHints: roughness=%.3f metalness=%.3f", hints.suggestedRoughness, hints.suggestedMetalness);
    return hints;
}

MaterialHints MaterialHints::loadFromJson(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MaterialHints: Could not open %s, using defaults", path.c_str());
        return fallback();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

namespace MaterialHintsMapping {

DerivationParams toDerivationParams(const MaterialHints& hints, double normalStrength,
                                    double roughnessScale, double metalnessThreshold,
                                    double fallbackMultiplier) {
    if (hints.fromFallback) {
        return DerivationParams{normalStrength, fallbackMultiplier, false};
    }
    return DerivationParams{
        normalStrength,
        hints.effectiveRoughness() * roughnessScale,
        hints.suggestedMetalness > metalnessThreshold
    };
}

} // namespace MaterialHintsMapping
} // namespace MapForge
