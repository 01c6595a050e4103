#pragma once

#include "clipboard/snapshot.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace image_codec {

struct ImageInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    ImageCodec codec = ImageCodec::Png;
};

// Reads dimensions and format from the header without decoding pixels.
std::expected<ImageInfo, std::string> probe(std::span<const uint8_t> data);

// `rgba` holds width * height * 4 bytes, rows top to bottom.
std::expected<std::vector<uint8_t>, std::string> encode_png(std::span<const uint8_t> rgba,
                                                            uint32_t width, uint32_t height);

// PNG no larger than max_edge on either side, aspect ratio kept, never upscaled.
std::expected<std::vector<uint8_t>, std::string> make_thumbnail(std::span<const uint8_t> data,
                                                                int max_edge = 256);

} // namespace image_codec
