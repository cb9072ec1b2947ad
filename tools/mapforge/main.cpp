#include "config/DeriveConfig.h"
#include "core/threading/TaskScheduler.h"
#include "derive/MapDerivation.h"
#include "derive/MaterialHints.h"
#include "export/MaterialExporter.h"
#include "image/ImageDecoder.h"
#include "image/ImageEncoder.h"
#include <SDL3/SDL_log.h>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace MapForge;

void printUsage(const char* programName) {
    SDL_Log("MapForge PBR Map Generator");
    SDL_Log("Usage: %s --input <file|data-uri> [options]", programName);
    SDL_Log("");
    SDL_Log("Required options:");
    SDL_Log("  --input <src>           Albedo image path or data:image/...;base64 URI");
    SDL_Log("");
    SDL_Log("Optional options:");
    SDL_Log("  --output <dir>          Output directory (default: pbr_out)");
    SDL_Log("  --config <path>         JSON config file");
    SDL_Log("  --hints <path>          Material analysis reply (suggestedRoughness/suggestedMetalness)");
    SDL_Log("  --normal-strength <f>   Normal map gradient strength (default: 2.5)");
    SDL_Log("  --roughness <f>         Explicit roughness multiplier, ignores hints");
    SDL_Log("  --metal                 Classify the texture as metal");
    SDL_Log("  --non-metal             Classify the texture as non-metal");
    SDL_Log("  --partial               Keep successful maps when a generator fails");
    SDL_Log("  --threads <n>           Worker threads (default: hardware concurrency - 1)");
    SDL_Log("  --prefix <str>          Output file prefix (default: PBR_)");
    SDL_Log("  --data-uri              Print each map as a data URI on stdout instead of writing files");
    SDL_Log("  --help                  Show this help message");
}

struct CliOptions {
    std::string input;
    std::string configPath;
    std::string hintsPath;

    std::optional<std::string> outputDir;
    std::optional<std::string> prefix;
    std::optional<double> normalStrength;
    std::optional<double> roughnessMultiplier;
    std::optional<bool> isMetal;
    std::optional<uint32_t> threads;

    bool partial = false;
    bool printDataUris = false;
};

bool parseArguments(int argc, char* argv[], CliOptions& opts) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                return false; // Signal to show help
            }
            else if (arg == "--input" && i + 1 < argc) {
                opts.input = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc) {
                opts.outputDir = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc) {
                opts.configPath = argv[++i];
            }
            else if (arg == "--hints" && i + 1 < argc) {
                opts.hintsPath = argv[++i];
            }
            else if (arg == "--normal-strength" && i + 1 < argc) {
                opts.normalStrength = std::stod(argv[++i]);
            }
            else if (arg == "--roughness" && i + 1 < argc) {
                opts.roughnessMultiplier = std::stod(argv[++i]);
            }
            else if (arg == "--metal") {
                opts.isMetal = true;
            }
            else if (arg == "--non-metal") {
                opts.isMetal = false;
            }
            else if (arg == "--partial") {
                opts.partial = true;
            }
            else if (arg == "--threads" && i + 1 < argc) {
                auto count = workerThreadCount(std::stoll(argv[++i]));
                if (!count) {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "--threads must not be negative");
                    return false;
                }
                opts.threads = *count;
            }
            else if (arg == "--prefix" && i + 1 < argc) {
                opts.prefix = argv[++i];
            }
            else if (arg == "--data-uri") {
                opts.printDataUris = true;
            }
            else {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument: %s", arg.c_str());
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stod / std::stoll reject non-numeric or out-of-range values
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid numeric argument: %s", e.what());
        return false;
    }

    if (opts.input.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Missing required argument: --input");
        return false;
    }

    return true;
}

static void logErrors(const std::vector<DeriveError>& errors) {
    for (const auto& error : errors) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "  %s", error.describe().c_str());
    }
}

static bool printDataUri(MapKind kind, const PixelBuffer& image) {
    DeriveError error;
    auto uri = ImageEncoder::encodeDataUri(image, &error);
    if (!uri) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to encode %s: %s",
                     mapKindName(kind), error.describe().c_str());
        return false;
    }
    std::cout << mapKindName(kind) << " " << *uri << "\n";
    return true;
}

// Partial runs have no complete set to export; write what succeeded one file at a time
static bool writePartialMaps(const std::vector<MaterialMap>& maps, const std::string& dir,
                             const std::string& prefix, bool asDataUri) {
    if (!asDataUri) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create %s: %s",
                         dir.c_str(), ec.message().c_str());
            return false;
        }
    }

    bool success = true;
    for (const auto& map : maps) {
        if (asDataUri) {
            success = printDataUri(map.kind, map.image) && success;
            continue;
        }
        std::string path = (std::filesystem::path(dir) /
                            MaterialExporter::mapFileName(prefix, map.kind)).string();
        if (ImageEncoder::writePng(map.image, path)) {
            SDL_Log("Wrote partial map %s", path.c_str());
        } else {
            success = false;
        }
    }
    return success;
}

int main(int argc, char* argv[]) {
    CliOptions opts;

    if (!parseArguments(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    DeriveConfig config = opts.configPath.empty() ? DeriveConfig::defaults()
                                                  : DeriveConfig::loadFromJson(opts.configPath);

    // Command line wins over the config file
    if (opts.outputDir) config.output.directory = *opts.outputDir;
    if (opts.prefix) config.output.prefix = *opts.prefix;
    if (opts.normalStrength) config.normalStrength = *opts.normalStrength;
    if (opts.threads) config.workerThreads = *opts.threads;
    if (opts.partial) config.failurePolicy = FailurePolicy::PartialResults;

    MaterialHints hints = opts.hintsPath.empty() ? MaterialHints::fallback()
                                                 : MaterialHints::loadFromJson(opts.hintsPath);

    DerivationParams params = MaterialHintsMapping::toDerivationParams(
        hints, config.normalStrength, config.roughnessScale,
        config.metalnessThreshold, config.fallbackRoughnessMultiplier);
    if (opts.roughnessMultiplier) params.roughnessMultiplier = *opts.roughnessMultiplier;
    if (opts.isMetal) params.isMetal = *opts.isMetal;

    // Analysis suggestions also drive the renderer defaults in the manifest
    if (!hints.fromFallback) {
        config.material.roughnessIntensity = static_cast<float>(hints.effectiveRoughness());
        config.material.metalnessIntensity = static_cast<float>(hints.suggestedMetalness);
    }

    bool isDataUri = ImageDecoder::isDataUri(opts.input);

    SDL_Log("=== MapForge ===");
    SDL_Log("Input:           %s", isDataUri ? "<data uri>" : opts.input.c_str());
    SDL_Log("Output:          %s", opts.printDataUris ? "<stdout>" : config.output.directory.c_str());
    SDL_Log("Prefix:          %s", config.output.prefix.c_str());
    SDL_Log("Normal strength: %.2f", params.normalStrength);
    SDL_Log("Roughness mult:  %.3f%s", params.roughnessMultiplier,
            hints.fromFallback && !opts.roughnessMultiplier ? " (fallback)" : "");
    SDL_Log("Metal:           %s", params.isMetal ? "yes" : "no");
    SDL_Log("Failure policy:  %s", failurePolicyName(config.failurePolicy));

    TaskScheduler& scheduler = TaskScheduler::instance();
    if (!scheduler.initialize(config.workerThreads)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Worker pool unavailable, deriving on the main thread");
    }

    PixelBuffer albedo;
    DerivationResult result = MapDerivation::deriveMapsFromSource(
        opts.input, params, config.failurePolicy, &scheduler, &albedo);

    scheduler.shutdown();

    if (!result.ok()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Derivation failed:");
        logErrors(result.errors);
        if (!result.partialMaps.empty()) {
            writePartialMaps(result.partialMaps, config.output.directory,
                             config.output.prefix, opts.printDataUris);
        }
        return 1;
    }

    const MaterialMapSet& maps = *result.maps;

    if (opts.printDataUris) {
        bool success = printDataUri(MapKind::Albedo, albedo);
        for (MapKind kind : MapDerivation::GENERATED_KINDS) {
            success = printDataUri(kind, maps.get(kind)->image) && success;
        }
        return success ? 0 : 1;
    }

    ExportOptions exportOptions;
    exportOptions.directory = config.output.directory;
    exportOptions.prefix = config.output.prefix;
    exportOptions.writeManifest = config.output.writeManifest;

    std::vector<ExportedFile> written;
    DeriveError exportError;
    if (!MaterialExporter::exportMaterial(albedo, maps, config.material, exportOptions,
                                          &written, &exportError)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Export failed: %s", exportError.describe().c_str());
        return 1;
    }

    SDL_Log("");
    SDL_Log("Done: %zu maps (%ux%u) written to %s", written.size(), albedo.width, albedo.height,
            config.output.directory.c_str());
    return 0;
}
