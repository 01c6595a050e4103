#pragma once

#include "clip_error.hpp"
#include "clipboard/clipboard_accessor.hpp"
#include "clipboard/snapshot.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

// How a staged image is handed back to the clipboard. Chosen once at startup
// from the backend's capabilities.
class ClipboardWriteStrategy {
public:
    virtual ~ClipboardWriteStrategy() = default;
    virtual std::expected<void, ClipError> present(ClipboardAccessor& accessor,
                                                   const std::string& path,
                                                   const RasterImage& image) const = 0;
    virtual std::string_view name() const = 0;
};

// Path as text plus the original image, so terminals paste the path and
// image-aware applications paste the picture.
class DualFormatCapable : public ClipboardWriteStrategy {
public:
    std::expected<void, ClipError> present(ClipboardAccessor& accessor,
                                           const std::string& path,
                                           const RasterImage& image) const override;
    std::string_view name() const override { return "dual-format"; }
};

// The clipboard is overwritten with the path as plain text; the image itself
// is only reachable through the staged file.
class TextOnlyFallback : public ClipboardWriteStrategy {
public:
    std::expected<void, ClipError> present(ClipboardAccessor& accessor,
                                           const std::string& path,
                                           const RasterImage& image) const override;
    std::string_view name() const override { return "text-only"; }
};

std::unique_ptr<ClipboardWriteStrategy> select_write_strategy(const ClipboardAccessor& accessor);
