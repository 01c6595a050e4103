#include "clipboard/snapshot.hpp"

std::string_view image_codec_mime(ImageCodec codec) {
    switch (codec) {
        case ImageCodec::Png: return "image/png";
        case ImageCodec::Jpeg: return "image/jpeg";
        case ImageCodec::Rgba: return "image/x-rgba";
    }
    return "application/octet-stream";
}

std::string_view image_codec_extension(ImageCodec codec) {
    switch (codec) {
        case ImageCodec::Png: return "png";
        case ImageCodec::Jpeg: return "jpeg";
        case ImageCodec::Rgba: return "rgba";
    }
    return "bin";
}

ClipboardSnapshot ClipboardSnapshot::from_text(std::string text, std::optional<std::string> source) {
    return ClipboardSnapshot{
        .content = TextContent{.bytes = std::move(text), .truncated = false},
        .metadata = {.captured_at = std::chrono::system_clock::now(), .source = std::move(source)},
    };
}

ClipboardSnapshot ClipboardSnapshot::from_image(RasterImage image, std::optional<std::string> source) {
    if (image.byte_size == 0) image.byte_size = image.payload.size();
    return ClipboardSnapshot{
        .content = std::move(image),
        .metadata = {.captured_at = std::chrono::system_clock::now(), .source = std::move(source)},
    };
}
