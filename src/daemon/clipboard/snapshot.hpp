#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class ImageCodec { Png, Jpeg, Rgba };

std::string_view image_codec_mime(ImageCodec codec);
std::string_view image_codec_extension(ImageCodec codec);

struct TextContent {
    std::string bytes;
    bool truncated = false;
};

// Either `payload` holds the image bytes (encoded for Png/Jpeg, 8-bit RGBA
// pixels for Rgba) or `reference` names a staged file holding them.
struct RasterImage {
    std::vector<uint8_t> payload;
    std::string reference;
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t byte_size = 0;
    ImageCodec codec = ImageCodec::Png;

    bool resident() const { return !payload.empty(); }
};

using ClipboardContent = std::variant<TextContent, RasterImage>;

struct SnapshotMetadata {
    std::chrono::system_clock::time_point captured_at;
    std::optional<std::string> source;
};

struct ClipboardSnapshot {
    ClipboardContent content;
    SnapshotMetadata metadata;

    bool is_text() const { return std::holds_alternative<TextContent>(content); }
    bool is_image() const { return std::holds_alternative<RasterImage>(content); }
    const TextContent& text() const { return std::get<TextContent>(content); }
    const RasterImage& image() const { return std::get<RasterImage>(content); }

    static ClipboardSnapshot from_text(std::string text, std::optional<std::string> source = {});
    static ClipboardSnapshot from_image(RasterImage image, std::optional<std::string> source = {});
};
