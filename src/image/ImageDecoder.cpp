#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#include "ImageDecoder.h"
#include "Base64.h"
#include "core/ScopeGuard.h"
#include <SDL3/SDL_log.h>
#include <lodepng.h>
#include <cctype>
#include <climits>
#include <cstring>
#include <fstream>

namespace MapForge {
namespace ImageDecoder {

namespace {

constexpr uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

std::nullopt_t fail(DeriveError* error, const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageDecoder: %s", message.c_str());
    if (error) {
        *error = makeError(DeriveErrorKind::DecodeError, message);
    }
    return std::nullopt;
}

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool endsWithNoCase(std::string_view text, std::string_view suffix) {
    if (text.size() < suffix.size()) return false;
    return startsWithNoCase(text.substr(text.size() - suffix.size()), suffix);
}

// Copy an interleaved RGBA8 image into a buffer with the requested channel count
PixelBuffer fromRgba(const uint8_t* rgba, uint32_t width, uint32_t height, uint32_t channels) {
    PixelBuffer buffer(width, height, channels);
    if (channels == 4) {
        std::memcpy(buffer.pixels.data(), rgba, buffer.pixels.size());
        return buffer;
    }

    size_t count = buffer.pixelCount();
    for (size_t i = 0; i < count; ++i) {
        buffer.pixels[i * 3 + 0] = rgba[i * 4 + 0];
        buffer.pixels[i * 3 + 1] = rgba[i * 4 + 1];
        buffer.pixels[i * 3 + 2] = rgba[i * 4 + 2];
    }
    return buffer;
}

std::optional<PixelBuffer> decodePng(const uint8_t* data, size_t size, DeriveError* error) {
    lodepng::State state;
    std::vector<unsigned char> rgba;
    unsigned w = 0;
    unsigned h = 0;

    // info_raw defaults to RGBA8, lodepng converts any PNG color type to it
    unsigned err = lodepng::decode(rgba, w, h, state, data, size);
    if (err) {
        return fail(error, std::string("PNG decode failed: ") + lodepng_error_text(err));
    }
    if (w == 0 || h == 0) {
        return fail(error, "PNG has zero size");
    }

    uint32_t channels = lodepng_can_have_alpha(&state.info_png.color) ? 4 : 3;
    return fromRgba(rgba.data(), w, h, channels);
}

std::optional<PixelBuffer> decodeStb(const uint8_t* data, size_t size, DeriveError* error) {
    if (size > static_cast<size_t>(INT_MAX)) {
        return fail(error, "image data too large (" + std::to_string(size) + " bytes)");
    }

    int w = 0;
    int h = 0;
    int comp = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &w, &h, &comp)) {
        return fail(error, std::string("unrecognized image data: ") + stbi_failure_reason());
    }

    // Grey+alpha and RGBA keep alpha, grey and RGB expand to RGB
    int desired = (comp == 2 || comp == 4) ? STBI_rgb_alpha : STBI_rgb;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &comp, desired);
    if (!pixels) {
        return fail(error, std::string("image decode failed: ") + stbi_failure_reason());
    }
    auto pixelGuard = makeScopeGuard([&]() { stbi_image_free(pixels); });

    if (w <= 0 || h <= 0) {
        return fail(error, "image has zero size");
    }

    PixelBuffer buffer(static_cast<uint32_t>(w), static_cast<uint32_t>(h), static_cast<uint32_t>(desired));
    std::memcpy(buffer.pixels.data(), pixels, buffer.pixels.size());
    return buffer;
}

} // namespace

bool isPng(const uint8_t* data, size_t size) {
    return size >= sizeof(PNG_SIGNATURE) && std::memcmp(data, PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) == 0;
}

bool isDataUri(std::string_view text) {
    return startsWithNoCase(text, "data:");
}

std::optional<PixelBuffer> decode(const uint8_t* data, size_t size, DeriveError* error) {
    if (!data || size == 0) {
        return fail(error, "empty image data");
    }

    if (isPng(data, size)) {
        return decodePng(data, size, error);
    }
    return decodeStb(data, size, error);
}

std::optional<PixelBuffer> decodeDataUri(std::string_view uri, DeriveError* error) {
    if (!isDataUri(uri)) {
        return fail(error, "not a data URI");
    }

    size_t comma = uri.find(',');
    if (comma == std::string_view::npos) {
        return fail(error, "data URI has no payload separator");
    }

    std::string_view header = uri.substr(5, comma - 5);
    if (!endsWithNoCase(header, ";base64")) {
        return fail(error, "only base64 data URIs are supported (header '" + std::string(header) + "')");
    }

    auto bytes = Base64::decode(uri.substr(comma + 1));
    if (!bytes) {
        return fail(error, "data URI payload is not valid base64");
    }

    return decode(*bytes, error);
}

std::optional<PixelBuffer> decodeFile(const std::string& path, DeriveError* error) {
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open()) {
        return fail(error, "failed to open " + path);
    }

    std::streamoff fileSize = file.tellg();
    if (fileSize <= 0) {
        return fail(error, "file is empty: " + path);
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(fileSize));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(bytes.data()), fileSize);
    if (!file) {
        return fail(error, "failed to read " + path);
    }

    auto image = decode(bytes, error);
    if (image) {
        SDL_Log("ImageDecoder: Loaded %s (%ux%u, %u channels)", path.c_str(),
                image->width, image->height, image->channels);
    }
    return image;
}

std::optional<PixelBuffer> decodeSource(const std::string& source, DeriveError* error) {
    if (isDataUri(source)) {
        return decodeDataUri(source, error);
    }
    return decodeFile(source, error);
}

} // namespace ImageDecoder
} // namespace MapForge
