#include "MapDerivation.h"
#include "MapGenerators.h"
#include "core/threading/TaskScheduler.h"
#include "image/ImageDecoder.h"
#include <SDL3/SDL_log.h>
#include <array>
#include <chrono>
#include <iterator>

namespace MapForge {

const MaterialMap* MaterialMapSet::get(MapKind kind) const {
    switch (kind) {
        case MapKind::Normal:           return &normal;
        case MapKind::Roughness:        return &roughness;
        case MapKind::AmbientOcclusion: return &ao;
        case MapKind::Metalness:        return &metalness;
        case MapKind::Height:           return &height;
        case MapKind::Albedo:           break;
    }
    return nullptr;
}

namespace MapDerivation {

namespace {

constexpr size_t KIND_COUNT = std::size(GENERATED_KINDS);

// One slot per generator; each task writes only its own slot
struct GeneratorSlot {
    MapKind kind = MapKind::Normal;
    std::optional<PixelBuffer> image;
    DeriveError error;
};

std::optional<PixelBuffer> runGenerator(MapKind kind, const PixelBuffer& albedo,
                                        const DerivationParams& params, DeriveError* error) {
    switch (kind) {
        case MapKind::Normal:
            return MapGenerators::generateNormalMap(albedo, params.normalStrength, error);
        case MapKind::Roughness:
            return MapGenerators::generateRoughnessMap(albedo, params.roughnessMultiplier, error);
        case MapKind::AmbientOcclusion:
            return MapGenerators::generateAmbientOcclusionMap(albedo, error);
        case MapKind::Metalness:
            return MapGenerators::generateMetalnessMap(albedo, params.isMetal, error);
        case MapKind::Height:
            return MapGenerators::generateHeightMap(albedo, error);
        case MapKind::Albedo:
            break;
    }
    if (error) {
        *error = makeError(DeriveErrorKind::UnsupportedFormat, "albedo is not a derived map", kind);
    }
    return std::nullopt;
}

MaterialMap takeMap(GeneratorSlot& slot) {
    return MaterialMap{slot.kind, std::move(*slot.image)};
}

} // namespace

DerivationResult deriveMaps(const PixelBuffer& albedo, const DerivationParams& params,
                            FailurePolicy policy, TaskScheduler* scheduler) {
    auto startTime = std::chrono::steady_clock::now();

    TaskScheduler& pool = scheduler ? *scheduler : TaskScheduler::instance();

    std::array<GeneratorSlot, KIND_COUNT> slots;
    {
        ScopedTaskGroup group(pool);
        for (size_t i = 0; i < KIND_COUNT; ++i) {
            GeneratorSlot* slot = &slots[i];
            slot->kind = GENERATED_KINDS[i];
            group.submit([slot, &albedo, &params] {
                slot->image = runGenerator(slot->kind, albedo, params, &slot->error);
            });
        }
    } // Joins all five tasks

    DerivationResult result;
    for (auto& slot : slots) {
        if (!slot.image) {
            result.errors.push_back(slot.error);
            if (policy == FailurePolicy::FailFast) {
                break;
            }
        }
    }

    if (result.errors.empty()) {
        MaterialMapSet maps;
        maps.normal = takeMap(slots[0]);
        maps.roughness = takeMap(slots[1]);
        maps.ao = takeMap(slots[2]);
        maps.metalness = takeMap(slots[3]);
        maps.height = takeMap(slots[4]);
        result.maps = std::move(maps);
    } else if (policy == FailurePolicy::PartialResults) {
        for (auto& slot : slots) {
            if (slot.image) {
                result.partialMaps.push_back(takeMap(slot));
            }
        }
    }

    float elapsedMs = std::chrono::duration<float, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();

    if (result.ok()) {
        SDL_Log("MapDerivation: Derived %zu maps from %ux%u albedo in %.1f ms",
                KIND_COUNT, albedo.width, albedo.height, elapsedMs);
    } else {
        for (const auto& error : result.errors) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MapDerivation: %s", error.describe().c_str());
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "MapDerivation: %zu of %zu generators failed, %zu partial maps returned",
                    result.errors.size(), KIND_COUNT, result.partialMaps.size());
    }

    return result;
}

DerivationResult deriveMapsFromSource(const std::string& source, const DerivationParams& params,
                                      FailurePolicy policy, TaskScheduler* scheduler,
                                      PixelBuffer* albedoOut) {
    DeriveError error;
    auto albedo = ImageDecoder::decodeSource(source, &error);
    if (!albedo) {
        DerivationResult result;
        result.errors.push_back(error);
        return result;
    }

    DerivationResult result = deriveMaps(*albedo, params, policy, scheduler);
    if (albedoOut) {
        *albedoOut = std::move(*albedo);
    }
    return result;
}

std::optional<DeriveError> validateMapSet(const MaterialMapSet& maps, uint32_t width, uint32_t height) {
    for (MapKind kind : GENERATED_KINDS) {
        const MaterialMap* map = maps.get(kind);
        if (map->image.width != width || map->image.height != height) {
            return makeError(DeriveErrorKind::DimensionMismatch,
                             "map is " + std::to_string(map->image.width) + "x" +
                             std::to_string(map->image.height) + ", expected " +
                             std::to_string(width) + "x" + std::to_string(height),
                             kind);
        }
    }
    return std::nullopt;
}

} // namespace MapDerivation
} // namespace MapForge
