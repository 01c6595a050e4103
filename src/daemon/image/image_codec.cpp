#include "image/image_codec.hpp"

#include <QBuffer>
#include <QByteArray>
#include <QImage>
#include <QImageReader>
#include <string>

namespace image_codec {

namespace {

QByteArray wrap(std::span<const uint8_t> data) {
    return QByteArray::fromRawData(reinterpret_cast<const char*>(data.data()),
                                   static_cast<qsizetype>(data.size()));
}

std::expected<std::vector<uint8_t>, std::string> save_png(const QImage& img) {
    QByteArray out;
    QBuffer buffer(&out);
    if (!buffer.open(QIODevice::WriteOnly) || !img.save(&buffer, "PNG")) {
        return std::unexpected(std::string("PNG encoding failed"));
    }
    return std::vector<uint8_t>(out.begin(), out.end());
}

} // namespace

std::expected<ImageInfo, std::string> probe(std::span<const uint8_t> data) {
    if (data.empty()) return std::unexpected(std::string("empty image data"));

    QByteArray bytes = wrap(data);
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::ReadOnly)) {
        return std::unexpected(std::string("cannot open image buffer"));
    }

    QImageReader reader(&buffer);
    QByteArray format = reader.format();
    QSize size = reader.size();
    if (!size.isValid()) {
        return std::unexpected("unreadable image: " + reader.errorString().toStdString());
    }

    ImageInfo info;
    info.width = static_cast<uint32_t>(size.width());
    info.height = static_cast<uint32_t>(size.height());
    if (format == "png") {
        info.codec = ImageCodec::Png;
    } else if (format == "jpeg" || format == "jpg") {
        info.codec = ImageCodec::Jpeg;
    } else {
        return std::unexpected("unsupported image format: " + format.toStdString());
    }
    return info;
}

std::expected<std::vector<uint8_t>, std::string> encode_png(std::span<const uint8_t> rgba,
                                                            uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return std::unexpected(std::string("image has zero dimension"));
    }
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        return std::unexpected("pixel buffer is " + std::to_string(rgba.size()) + " bytes, expected " +
                               std::to_string(static_cast<size_t>(width) * height * 4));
    }

    QImage img(rgba.data(), static_cast<int>(width), static_cast<int>(height),
               static_cast<qsizetype>(width) * 4, QImage::Format_RGBA8888);
    return save_png(img);
}

std::expected<std::vector<uint8_t>, std::string> make_thumbnail(std::span<const uint8_t> data,
                                                                int max_edge) {
    QImage img;
    if (!img.loadFromData(wrap(data))) {
        return std::unexpected(std::string("image decode failed"));
    }

    if (img.width() > max_edge || img.height() > max_edge) {
        img = img.scaled(max_edge, max_edge, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
    return save_png(img);
}

} // namespace image_codec
