#pragma once

#include <string>
#include <string_view>

enum class ClipErrorKind {
    Unavailable,   // clipboard empty or helper failed; retried on next poll
    StagingIo,
    Thumbnail,
    Alias,
    Unsupported,
    InvalidInput,
    Backend,
};

struct ClipError {
    ClipErrorKind kind;
    std::string message;
};

inline std::string_view clip_error_name(ClipErrorKind kind) {
    switch (kind) {
        case ClipErrorKind::Unavailable: return "unavailable";
        case ClipErrorKind::StagingIo: return "staging-io";
        case ClipErrorKind::Thumbnail: return "thumbnail";
        case ClipErrorKind::Alias: return "alias";
        case ClipErrorKind::Unsupported: return "unsupported";
        case ClipErrorKind::InvalidInput: return "invalid-input";
        case ClipErrorKind::Backend: return "backend";
    }
    return "unknown";
}
