#pragma once

#include "image/PixelBuffer.h"
#include <cstdint>
#include <optional>
#include <string>

namespace MapForge {

enum class DeriveErrorKind : uint8_t {
    DecodeError,         // Malformed or unsupported input image
    UnsupportedFormat,   // Buffer handed to a generator is not a valid RGB(A) image
    DimensionMismatch,   // Maps supplied independently disagree on width/height
    RenderContextError   // Output allocation or write failure
};

const char* deriveErrorKindName(DeriveErrorKind kind);

struct DeriveError {
    DeriveErrorKind kind = DeriveErrorKind::DecodeError;
    std::optional<MapKind> map;     // Set when a specific map failed
    std::string message;

    // "[normal] UnsupportedFormat: ..." style text for logs
    std::string describe() const;
};

inline DeriveError makeError(DeriveErrorKind kind, std::string message,
                             std::optional<MapKind> map = std::nullopt) {
    DeriveError error;
    error.kind = kind;
    error.map = map;
    error.message = std::move(message);
    return error;
}

} // namespace MapForge
