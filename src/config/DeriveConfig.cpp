#include "DeriveConfig.h"
#include "core/threading/TaskScheduler.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace MapForge {

const char* failurePolicyName(FailurePolicy policy) {
    return policy == FailurePolicy::PartialResults ? "partial" : "fail_fast";
}

std::optional<uint32_t> workerThreadCount(int64_t requested) {
    if (requested < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "DeriveConfig: Negative worker thread count %lld rejected", static_cast<long long>(requested));
        return std::nullopt;
    }

    uint32_t maxThreads = TaskScheduler::maxThreadCount();
    if (requested > static_cast<int64_t>(maxThreads)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "DeriveConfig: Worker thread count %lld capped at %u",
                    static_cast<long long>(requested), maxThreads);
        return maxThreads;
    }
    return static_cast<uint32_t>(requested);
}

DeriveConfig DeriveConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeriveConfig: Failed to open config file: %s", jsonPath.c_str());
        return defaults();
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

DeriveConfig DeriveConfig::loadFromJsonString(const std::string& jsonString) {
    DeriveConfig config;

    try {
        json j = json::parse(jsonString);

        config.normalStrength = j.value("normalStrength", config.normalStrength);
        config.roughnessScale = j.value("roughnessScale", config.roughnessScale);
        config.fallbackRoughnessMultiplier = j.value("fallbackRoughnessMultiplier",
                                                     config.fallbackRoughnessMultiplier);
        config.metalnessThreshold = j.value("metalnessThreshold", config.metalnessThreshold);
        int64_t threads = j.value("workerThreads", static_cast<int64_t>(config.workerThreads));
        if (auto count = workerThreadCount(threads)) {
            config.workerThreads = *count;
        }

        std::string policy = j.value("failurePolicy", "fail_fast");
        if (policy == "partial") {
            config.failurePolicy = FailurePolicy::PartialResults;
        } else if (policy == "fail_fast") {
            config.failurePolicy = FailurePolicy::FailFast;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "DeriveConfig: Unknown failurePolicy '%s', using fail_fast", policy.c_str());
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            config.output.directory = out.value("directory", config.output.directory);
            config.output.prefix = out.value("prefix", config.output.prefix);
            config.output.writeManifest = out.value("writeManifest", config.output.writeManifest);
        }

        if (j.contains("material")) {
            const auto& m = j["material"];
            config.material.repeat = m.value("repeat", config.material.repeat);
            config.material.normalScale = m.value("normalScale", config.material.normalScale);
            config.material.roughnessIntensity = m.value("roughnessIntensity", config.material.roughnessIntensity);
            config.material.metalnessIntensity = m.value("metalnessIntensity", config.material.metalnessIntensity);
            config.material.displacementScale = m.value("displacementScale", config.material.displacementScale);
        }

        SDL_Log("DeriveConfig: normalStrength=%.2f roughnessScale=%.2f policy=%s",
                config.normalStrength, config.roughnessScale, failurePolicyName(config.failurePolicy));

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DeriveConfig: JSON parse error: %s", e.what());
        return defaults();
    }

    return config;
}

} // namespace MapForge
