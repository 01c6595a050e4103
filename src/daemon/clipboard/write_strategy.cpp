#include "clipboard/write_strategy.hpp"

#include <print>

std::expected<void, ClipError> DualFormatCapable::present(ClipboardAccessor& accessor,
                                                          const std::string& path,
                                                          const RasterImage& image) const {
    auto res = accessor.write_dual(path, image);
    if (res) return {};

    std::println(stderr, "clipboard: dual-format write failed ({}), writing path only",
                 res.error().message);
    return accessor.write_text(path);
}

std::expected<void, ClipError> TextOnlyFallback::present(ClipboardAccessor& accessor,
                                                         const std::string& path,
                                                         const RasterImage& /*image*/) const {
    return accessor.write_text(path);
}

std::unique_ptr<ClipboardWriteStrategy> select_write_strategy(const ClipboardAccessor& accessor) {
    if (accessor.supports_dual_format()) {
        return std::make_unique<DualFormatCapable>();
    }
    return std::make_unique<TextOnlyFallback>();
}
