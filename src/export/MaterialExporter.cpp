#include "MaterialExporter.h"
#include "image/ImageEncoder.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace MapForge {
namespace MaterialExporter {

namespace {

constexpr int MANIFEST_VERSION = 1;

bool fail(DeriveError* error, DeriveError failure) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MaterialExporter: %s", failure.describe().c_str());
    if (error) {
        *error = std::move(failure);
    }
    return false;
}

} // namespace

std::string mapFileName(const std::string& prefix, MapKind kind) {
    return prefix + mapKindTag(kind) + ".png";
}

bool writeManifest(const std::string& path, const PixelBuffer& albedo,
                   const MaterialSettings& settings, const std::string& prefix,
                   DeriveError* error) {
    nlohmann::json manifest;
    manifest["version"] = MANIFEST_VERSION;
    manifest["width"] = albedo.width;
    manifest["height"] = albedo.height;

    nlohmann::json maps = nlohmann::json::object();
    maps[mapKindName(MapKind::Albedo)] = mapFileName(prefix, MapKind::Albedo);
    for (MapKind kind : MapDerivation::GENERATED_KINDS) {
        maps[mapKindName(kind)] = mapFileName(prefix, kind);
    }
    manifest["maps"] = maps;

    manifest["settings"] = {
        {"repeat", settings.repeat},
        {"normalScale", settings.normalScale},
        {"roughnessIntensity", settings.roughnessIntensity},
        {"metalnessIntensity", settings.metalnessIntensity},
        {"displacementScale", settings.displacementScale}
    };

    std::ofstream file(path);
    if (!file.is_open()) {
        return fail(error, makeError(DeriveErrorKind::RenderContextError, "failed to open " + path));
    }

    file << manifest.dump(2);
    if (!file) {
        return fail(error, makeError(DeriveErrorKind::RenderContextError, "failed to write " + path));
    }

    SDL_Log("MaterialExporter: Saved manifest to %s", path.c_str());
    return true;
}

bool exportMaterial(const PixelBuffer& albedo, const MaterialMapSet& maps,
                    const MaterialSettings& settings, const ExportOptions& options,
                    std::vector<ExportedFile>* written, DeriveError* error) {
    if (auto mismatch = MapDerivation::validateMapSet(maps, albedo.width, albedo.height)) {
        return fail(error, *mismatch);
    }

    std::error_code ec;
    fs::create_directories(options.directory, ec);
    if (ec) {
        return fail(error, makeError(DeriveErrorKind::RenderContextError,
                                     "failed to create " + options.directory + ": " + ec.message()));
    }

    auto writeMap = [&](MapKind kind, const PixelBuffer& image) {
        std::string path = (fs::path(options.directory) / mapFileName(options.prefix, kind)).string();
        DeriveError writeError;
        if (!ImageEncoder::writePng(image, path, &writeError)) {
            writeError.map = kind;
            return fail(error, writeError);
        }
        if (written) {
            written->push_back(ExportedFile{kind, path});
        }
        SDL_Log("MaterialExporter: Wrote %s", path.c_str());
        return true;
    };

    if (!writeMap(MapKind::Albedo, albedo)) {
        return false;
    }
    for (MapKind kind : MapDerivation::GENERATED_KINDS) {
        if (!writeMap(kind, maps.get(kind)->image)) {
            return false;
        }
    }

    if (options.writeManifest) {
        std::string manifestPath = (fs::path(options.directory) / "material.json").string();
        if (!writeManifest(manifestPath, albedo, settings, options.prefix, error)) {
            return false;
        }
    }

    return true;
}

} // namespace MaterialExporter
} // namespace MapForge
