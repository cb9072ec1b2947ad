#pragma once

#include "derive/MapDerivation.h"
#include "export/MaterialExporter.h"
#include <cstdint>
#include <optional>
#include <string>

namespace MapForge {

// Output options
struct OutputOptions {
    std::string directory = "pbr_out";
    std::string prefix = "PBR_";        // Files are named <prefix><KIND>.png
    bool writeManifest = true;          // material.json beside the maps
};

// Tool configuration. Every field is optional in the JSON file:
// {
//   "normalStrength": 2.5,
//   "roughnessScale": 1.2,
//   "fallbackRoughnessMultiplier": 0.6,
//   "metalnessThreshold": 0.5,
//   "workerThreads": 0,
//   "failurePolicy": "fail_fast",
//   "output": { "directory": "pbr_out", "prefix": "PBR_", "writeManifest": true },
//   "material": { "repeat": 1, "normalScale": 1.2, "roughnessIntensity": 0.8,
//                 "metalnessIntensity": 0.2, "displacementScale": 0.08 }
// }
struct DeriveConfig {
    double normalStrength = 2.5;
    double roughnessScale = 1.2;
    double fallbackRoughnessMultiplier = 0.6;
    double metalnessThreshold = 0.5;

    uint32_t workerThreads = 0;         // 0 = hardware concurrency - 1
    FailurePolicy failurePolicy = FailurePolicy::FailFast;

    OutputOptions output;
    MaterialSettings material;

    static DeriveConfig defaults() { return DeriveConfig{}; }

    // Missing or unreadable files log an error and return defaults
    static DeriveConfig loadFromJson(const std::string& jsonPath);
    static DeriveConfig loadFromJsonString(const std::string& jsonString);
};

const char* failurePolicyName(FailurePolicy policy);

// Validates a requested worker count: negative is rejected (nullopt), counts
// above TaskScheduler::maxThreadCount() are capped. 0 keeps meaning "auto".
std::optional<uint32_t> workerThreadCount(int64_t requested);

} // namespace MapForge
