#pragma once

#include "image/PixelBuffer.h"
#include "DeriveError.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MapForge {

class TaskScheduler;

// Per-invocation inputs; the pipeline itself has no defaults
struct DerivationParams {
    double normalStrength;
    double roughnessMultiplier;
    bool isMetal;
};

struct MaterialMapSet {
    MaterialMap normal;
    MaterialMap roughness;
    MaterialMap ao;
    MaterialMap metalness;
    MaterialMap height;

    // Albedo is not part of the set and returns nullptr
    const MaterialMap* get(MapKind kind) const;
};

enum class FailurePolicy : uint8_t {
    FailFast,        // Any generator failure discards every map
    PartialResults   // Successful maps are returned alongside the failures
};

struct DerivationResult {
    // Present only when all five generators succeeded
    std::optional<MaterialMapSet> maps;

    // PartialResults: maps that succeeded while others failed
    std::vector<MaterialMap> partialMaps;

    // FailFast: the first failure in generator order. PartialResults: every failure.
    std::vector<DeriveError> errors;

    bool ok() const { return maps.has_value(); }
};

namespace MapDerivation {

// Generator order; also the order errors are reported in
constexpr MapKind GENERATED_KINDS[] = {
    MapKind::Normal,
    MapKind::Roughness,
    MapKind::AmbientOcclusion,
    MapKind::Metalness,
    MapKind::Height
};

// Run the five generators as independent tasks on the scheduler and join them.
// With no scheduler the process-wide instance is used; a scheduler that is not
// running executes the tasks on the calling thread.
DerivationResult deriveMaps(const PixelBuffer& albedo, const DerivationParams& params,
                            FailurePolicy policy = FailurePolicy::FailFast,
                            TaskScheduler* scheduler = nullptr);

// Decode the source (data URI or file path) first; a decode failure is returned
// without running any generator. The decoded albedo is stored in albedoOut if given.
DerivationResult deriveMapsFromSource(const std::string& source, const DerivationParams& params,
                                      FailurePolicy policy = FailurePolicy::FailFast,
                                      TaskScheduler* scheduler = nullptr,
                                      PixelBuffer* albedoOut = nullptr);

// Checks every map in the set is width x height; reports the first mismatch
std::optional<DeriveError> validateMapSet(const MaterialMapSet& maps, uint32_t width, uint32_t height);

} // namespace MapDerivation
} // namespace MapForge
