#pragma once

#include "clip_error.hpp"
#include "clipboard/snapshot.hpp"
#include "platform/clipboard_backend.hpp"

#include <expected>
#include <mutex>
#include <string>
#include <string_view>

// The only path to the system clipboard. Every backend call runs under one
// mutex; decoding and encoding happen outside it.
class ClipboardAccessor {
public:
    explicit ClipboardAccessor(ClipboardBackend& backend);

    ClipboardAccessor(const ClipboardAccessor&) = delete;
    ClipboardAccessor& operator=(const ClipboardAccessor&) = delete;

    // Images win over text. Unavailable when nothing readable is offered.
    std::expected<ClipboardSnapshot, ClipError> read();

    std::expected<void, ClipError> write(const ClipboardContent& content);
    std::expected<void, ClipError> write_text(std::string_view text);
    // Text and image in a single offer; Unsupported without backend support.
    std::expected<void, ClipError> write_dual(std::string_view text, const RasterImage& image);

    bool supports_dual_format() const;

private:
    std::expected<std::string, std::string> read_raw(const std::string& mime_type);
    static std::expected<std::string, ClipError> encoded_image(const RasterImage& image);

    ClipboardBackend& backend_;
    mutable std::mutex mutex_;
};
