#include "ImageEncoder.h"
#include "Base64.h"
#include <SDL3/SDL_log.h>
#include <lodepng.h>

namespace MapForge {
namespace ImageEncoder {

namespace {

void reportFailure(DeriveError* error, DeriveErrorKind kind, const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageEncoder: %s", message.c_str());
    if (error) {
        *error = makeError(kind, message);
    }
}

} // namespace

std::optional<std::vector<uint8_t>> encodePng(const PixelBuffer& image, DeriveError* error) {
    std::string invalid = image.describeInvalid();
    if (!invalid.empty()) {
        reportFailure(error, DeriveErrorKind::UnsupportedFormat, "cannot encode " + invalid);
        return std::nullopt;
    }

    LodePNGColorType colorType = image.hasAlpha() ? LCT_RGBA : LCT_RGB;
    std::vector<unsigned char> png;
    unsigned err = lodepng::encode(png, image.pixels, image.width, image.height, colorType, 8);
    if (err) {
        reportFailure(error, DeriveErrorKind::RenderContextError,
                      std::string("PNG encode failed: ") + lodepng_error_text(err));
        return std::nullopt;
    }

    return png;
}

std::optional<std::string> encodeDataUri(const PixelBuffer& image, DeriveError* error) {
    auto png = encodePng(image, error);
    if (!png) {
        return std::nullopt;
    }
    return "data:image/png;base64," + Base64::encode(*png);
}

bool writePng(const PixelBuffer& image, const std::string& path, DeriveError* error) {
    auto png = encodePng(image, error);
    if (!png) {
        return false;
    }

    unsigned err = lodepng::save_file(*png, path);
    if (err) {
        reportFailure(error, DeriveErrorKind::RenderContextError,
                      "failed to save " + path + ": " + lodepng_error_text(err));
        return false;
    }
    return true;
}

} // namespace ImageEncoder
} // namespace MapForge
