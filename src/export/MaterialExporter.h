#pragma once

#include "derive/MapDerivation.h"
#include "derive/DeriveError.h"
#include <string>
#include <vector>

namespace MapForge {

// Renderer-facing material parameters written to the manifest
struct MaterialSettings {
    float repeat = 1.0f;
    float normalScale = 1.2f;
    float roughnessIntensity = 0.8f;
    float metalnessIntensity = 0.2f;
    float displacementScale = 0.08f;
};

struct ExportOptions {
    std::string directory;
    std::string prefix = "PBR_";
    bool writeManifest = true;
};

struct ExportedFile {
    MapKind kind = MapKind::Albedo;
    std::string path;
};

namespace MaterialExporter {

// "<prefix><TAG>.png", e.g. PBR_ROUGHNESS.png
std::string mapFileName(const std::string& prefix, MapKind kind);

// Writes the albedo and all five maps as PNGs, then material.json.
// Every map must match the albedo dimensions (DimensionMismatch otherwise);
// nothing is written when validation fails.
bool exportMaterial(const PixelBuffer& albedo, const MaterialMapSet& maps,
                    const MaterialSettings& settings, const ExportOptions& options,
                    std::vector<ExportedFile>* written = nullptr, DeriveError* error = nullptr);

bool writeManifest(const std::string& path, const PixelBuffer& albedo,
                   const MaterialSettings& settings, const std::string& prefix,
                   DeriveError* error = nullptr);

} // namespace MaterialExporter
} // namespace MapForge
