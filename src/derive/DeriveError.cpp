#include "DeriveError.h"

namespace MapForge {

const char* deriveErrorKindName(DeriveErrorKind kind) {
    switch (kind) {
        case DeriveErrorKind::DecodeError:        return "DecodeError";
        case DeriveErrorKind::UnsupportedFormat:  return "UnsupportedFormat";
        case DeriveErrorKind::DimensionMismatch:  return "DimensionMismatch";
        case DeriveErrorKind::RenderContextError: return "RenderContextError";
    }
    return "Unknown";
}

std::string DeriveError::describe() const {
    std::string text;
    if (map) {
        text += "[";
        text += mapKindName(*map);
        text += "] ";
    }
    text += deriveErrorKindName(kind);
    text += ": ";
    text += message;
    return text;
}

} // namespace MapForge
