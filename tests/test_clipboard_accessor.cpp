#include <catch2/catch_test_macros.hpp>

#include "clipboard/clipboard_accessor.hpp"
#include "clipboard/write_strategy.hpp"
#include "mock_clipboard_backend.hpp"

#include <string>
#include <vector>

TEST_CASE("ClipboardAccessor", "[clipboard]") {

    SECTION("EmptyClipboardIsUnavailable") {
        MockClipboardBackend backend;
        ClipboardAccessor accessor(backend);
        auto snap = accessor.read();
        REQUIRE_FALSE(snap);
        REQUIRE(snap.error().kind == ClipErrorKind::Unavailable);
    }

    SECTION("HelperFailureIsUnavailable") {
        MockClipboardBackend backend;
        backend.set_text("x");
        backend.fail_reads(true);
        ClipboardAccessor accessor(backend);
        auto snap = accessor.read();
        REQUIRE_FALSE(snap);
        REQUIRE(snap.error().kind == ClipErrorKind::Unavailable);
    }

    SECTION("ReadsText") {
        MockClipboardBackend backend;
        backend.set_text("hello world");
        ClipboardAccessor accessor(backend);

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->is_text());
        REQUIRE(snap->text().bytes == "hello world");
        REQUIRE(snap->metadata.source == "text/plain;charset=utf-8");
    }

    SECTION("FallsBackToLegacyTextTypes") {
        MockClipboardBackend backend;
        backend.set_offer({"UTF8_STRING"}, {{"UTF8_STRING", "legacy"}});
        ClipboardAccessor accessor(backend);

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->text().bytes == "legacy");
    }

    SECTION("ImageWinsOverText") {
        MockClipboardBackend backend;
        auto png = make_png(100, 50);
        backend.set_offer({"text/plain", "image/png"}, {{"text/plain", "caption"}, {"image/png", png}});
        ClipboardAccessor accessor(backend);

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->is_image());
        const auto& img = snap->image();
        REQUIRE(img.width == 100);
        REQUIRE(img.height == 50);
        REQUIRE(img.codec == ImageCodec::Png);
        REQUIRE(img.byte_size == png.size());
        REQUIRE(img.resident());
    }

    SECTION("UndecodableImageFallsThroughToText") {
        MockClipboardBackend backend;
        backend.set_offer({"image/png", "text/plain"}, {{"image/png", "garbage"}, {"text/plain", "alt"}});
        ClipboardAccessor accessor(backend);

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->is_text());
        REQUIRE(snap->text().bytes == "alt");
    }

    SECTION("UnsupportedTypesOnly") {
        MockClipboardBackend backend;
        backend.set_offer({"application/x-custom"}, {{"application/x-custom", "?"}});
        ClipboardAccessor accessor(backend);
        auto snap = accessor.read();
        REQUIRE_FALSE(snap);
        REQUIRE(snap.error().kind == ClipErrorKind::Unavailable);
    }

    SECTION("WriteTextRoundTrips") {
        MockClipboardBackend backend;
        ClipboardAccessor accessor(backend);
        REQUIRE(accessor.write(TextContent{.bytes = "written"}));

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->text().bytes == "written");
    }

    SECTION("WriteRgbaIsEncodedAsPng") {
        MockClipboardBackend backend;
        ClipboardAccessor accessor(backend);

        RasterImage img;
        img.width = 2;
        img.height = 2;
        img.codec = ImageCodec::Rgba;
        img.payload.assign(2 * 2 * 4, 0x40);
        REQUIRE(accessor.write(img));

        auto writes = backend.writes();
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0].offers.at(0).mime_type == "image/png");

        auto snap = accessor.read();
        REQUIRE(snap);
        REQUIRE(snap->is_image());
        REQUIRE(snap->image().width == 2);
    }

    SECTION("WriteFileReferenceIsRejected") {
        MockClipboardBackend backend;
        ClipboardAccessor accessor(backend);

        RasterImage img;
        img.reference = "/tmp/clipstage/clip-00000000.png";
        auto res = accessor.write(img);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ClipErrorKind::InvalidInput);
    }

    SECTION("BackendWriteFailureIsBackendError") {
        MockClipboardBackend backend;
        backend.fail_writes(true);
        ClipboardAccessor accessor(backend);
        auto res = accessor.write_text("x");
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ClipErrorKind::Backend);
    }

    SECTION("DualWriteNeedsMultiTypeBackend") {
        MockClipboardBackend backend(false);
        ClipboardAccessor accessor(backend);
        REQUIRE_FALSE(accessor.supports_dual_format());

        RasterImage img;
        img.width = 1;
        img.height = 1;
        img.payload = {1, 2, 3};
        auto res = accessor.write_dual("/tmp/x.png", img);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ClipErrorKind::Unsupported);
        REQUIRE(backend.writes().empty());
    }
}

TEST_CASE("ClipboardWriteStrategy", "[clipboard]") {
    auto png = make_png(100, 50);
    RasterImage img;
    img.width = 100;
    img.height = 50;
    img.payload.assign(png.begin(), png.end());

    SECTION("SelectionFollowsBackendCapability") {
        MockClipboardBackend single(false);
        MockClipboardBackend multi(true);
        ClipboardAccessor a(single);
        ClipboardAccessor b(multi);
        REQUIRE(select_write_strategy(a)->name() == "text-only");
        REQUIRE(select_write_strategy(b)->name() == "dual-format");
    }

    SECTION("TextOnlyWritesPath") {
        MockClipboardBackend backend(false);
        ClipboardAccessor accessor(backend);
        TextOnlyFallback strategy;
        REQUIRE(strategy.present(accessor, "/desk/clip-paste.png", img));

        auto writes = backend.writes();
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0].offers.size() == 1);
        REQUIRE(writes[0].offers[0].data == "/desk/clip-paste.png");
    }

    SECTION("DualFormatOffersPathAndImage") {
        MockClipboardBackend backend(true);
        ClipboardAccessor accessor(backend);
        DualFormatCapable strategy;
        REQUIRE(strategy.present(accessor, "/desk/clip-paste.png", img));

        auto writes = backend.writes();
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0].offers.size() == 2);
        REQUIRE(writes[0].offers[0].data == "/desk/clip-paste.png");
        REQUIRE(writes[0].offers[1].mime_type == "image/png");
        REQUIRE(writes[0].offers[1].data == png);
    }

    SECTION("DualFormatFallsBackToText") {
        MockClipboardBackend backend(false);
        ClipboardAccessor accessor(backend);
        DualFormatCapable strategy;
        REQUIRE(strategy.present(accessor, "/desk/clip-paste.png", img));

        auto writes = backend.writes();
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0].offers[0].data == "/desk/clip-paste.png");
    }
}
