#include "clipboard/clipboard_accessor.hpp"

#include "image/image_codec.hpp"

#include <algorithm>
#include <array>
#include <span>

namespace {

constexpr std::array<const char*, 2> kImageTypes = {"image/png", "image/jpeg"};
constexpr std::array<const char*, 5> kTextTypes = {
    "text/plain;charset=utf-8", "UTF8_STRING", "text/plain", "TEXT", "STRING",
};

constexpr const char* kTextMime = "text/plain;charset=utf-8";

} // namespace

ClipboardAccessor::ClipboardAccessor(ClipboardBackend& backend)
    : backend_(backend) {}

std::expected<std::string, std::string> ClipboardAccessor::read_raw(const std::string& mime_type) {
    std::lock_guard lock(mutex_);
    return backend_.read(mime_type);
}

std::expected<ClipboardSnapshot, ClipError> ClipboardAccessor::read() {
    std::vector<std::string> types;
    {
        std::lock_guard lock(mutex_);
        auto offered = backend_.offered_types();
        if (!offered) {
            return std::unexpected(ClipError{ClipErrorKind::Unavailable, offered.error()});
        }
        types = std::move(*offered);
    }

    if (types.empty()) {
        return std::unexpected(ClipError{ClipErrorKind::Unavailable, "no content in clipboard"});
    }

    auto offered = [&types](const char* mime) {
        return std::ranges::find(types, std::string_view(mime)) != types.end();
    };

    for (const char* mime : kImageTypes) {
        if (!offered(mime)) continue;

        auto data = read_raw(mime);
        if (!data || data->empty()) continue;

        std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(data->data()), data->size());
        auto info = image_codec::probe(bytes);
        if (!info) continue; // fall through to text

        RasterImage image;
        image.payload.assign(bytes.begin(), bytes.end());
        image.width = info->width;
        image.height = info->height;
        image.byte_size = bytes.size();
        image.codec = info->codec;
        return ClipboardSnapshot::from_image(std::move(image), std::string(mime));
    }

    for (const char* mime : kTextTypes) {
        if (!offered(mime)) continue;

        auto data = read_raw(mime);
        if (!data) {
            return std::unexpected(ClipError{ClipErrorKind::Unavailable, data.error()});
        }
        return ClipboardSnapshot::from_text(std::move(*data), std::string(mime));
    }

    return std::unexpected(ClipError{ClipErrorKind::Unavailable, "no supported content type offered"});
}

std::expected<std::string, ClipError> ClipboardAccessor::encoded_image(const RasterImage& image) {
    if (!image.resident()) {
        return std::unexpected(ClipError{ClipErrorKind::InvalidInput,
                                         "cannot set clipboard from file reference"});
    }

    if (image.codec == ImageCodec::Rgba) {
        auto png = image_codec::encode_png(image.payload, image.width, image.height);
        if (!png) {
            return std::unexpected(ClipError{ClipErrorKind::InvalidInput, png.error()});
        }
        return std::string(png->begin(), png->end());
    }

    return std::string(image.payload.begin(), image.payload.end());
}

std::expected<void, ClipError> ClipboardAccessor::write(const ClipboardContent& content) {
    if (auto* text = std::get_if<TextContent>(&content)) {
        return write_text(text->bytes);
    }

    const auto& image = std::get<RasterImage>(content);
    auto encoded = encoded_image(image);
    if (!encoded) return std::unexpected(encoded.error());

    // Raw pixels are offered as PNG
    std::string mime(image.codec == ImageCodec::Jpeg ? "image/jpeg" : "image/png");

    std::lock_guard lock(mutex_);
    auto res = backend_.write(mime, *encoded);
    if (!res) {
        return std::unexpected(ClipError{ClipErrorKind::Backend, res.error()});
    }
    return {};
}

std::expected<void, ClipError> ClipboardAccessor::write_text(std::string_view text) {
    std::lock_guard lock(mutex_);
    auto res = backend_.write(kTextMime, text);
    if (!res) {
        return std::unexpected(ClipError{ClipErrorKind::Backend, res.error()});
    }
    return {};
}

std::expected<void, ClipError> ClipboardAccessor::write_dual(std::string_view text, const RasterImage& image) {
    if (!supports_dual_format()) {
        return std::unexpected(ClipError{ClipErrorKind::Unsupported, "backend offers one type at a time"});
    }

    auto encoded = encoded_image(image);
    if (!encoded) return std::unexpected(encoded.error());

    std::vector<ClipboardOffer> offers;
    offers.push_back({kTextMime, std::string(text)});
    offers.push_back({image.codec == ImageCodec::Jpeg ? "image/jpeg" : "image/png", std::move(*encoded)});

    std::lock_guard lock(mutex_);
    auto res = backend_.write_multi(offers);
    if (!res) {
        return std::unexpected(ClipError{ClipErrorKind::Backend, res.error()});
    }
    return {};
}

bool ClipboardAccessor::supports_dual_format() const {
    std::lock_guard lock(mutex_);
    return backend_.supports_multi_type();
}
