#include <catch2/catch_test_macros.hpp>

#include "mock_clipboard_backend.hpp"
#include "storage/staging_store.hpp"
#include "temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<uint8_t> bytes_of(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("MediaKind", "[staging]") {
    REQUIRE(media_kind_extension(MediaKind::Text) == "txt");
    REQUIRE(media_kind_extension(MediaKind::Png) == "png");
    REQUIRE(media_kind_extension(MediaKind::Jpeg) == "jpeg");

    REQUIRE(media_kind_from_extension(".png") == MediaKind::Png);
    REQUIRE(media_kind_from_extension("jpg") == MediaKind::Jpeg);
    REQUIRE(media_kind_from_extension("text") == MediaKind::Text);
    REQUIRE_FALSE(media_kind_from_extension("gif"));
    REQUIRE_FALSE(media_kind_from_extension(""));

    REQUIRE(is_raster(MediaKind::Png));
    REQUIRE_FALSE(is_raster(MediaKind::Text));
}

TEST_CASE("StagingStore", "[staging]") {
    TempDir tmp("staging");
    fs::path root = tmp.path / "stage";
    StagingStore store(root, 15min);

    SECTION("StagesTextUnderContentAddressedName") {
        auto a = store.stage_text("hello");
        REQUIRE(a);
        REQUIRE(a->path == root / "clip-2cf24dba.txt");
        REQUIRE(a->content_hash ==
                "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
        REQUIRE(a->byte_size == 5);
        REQUIRE(a->kind == MediaKind::Text);
        REQUIRE_FALSE(a->thumbnail_path);
        REQUIRE(slurp(a->path) == "hello");
        REQUIRE(store.write_count() == 1);
    }

    SECTION("RestagingSameContentDoesNotWrite") {
        auto a = store.stage_text("hello");
        auto b = store.stage_text("hello");
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(a->path == b->path);
        REQUIRE(store.write_count() == 1);
        REQUIRE(store.index_size() == 1);
    }

    SECTION("SameBytesDifferentKindAreDistinct") {
        auto data = bytes_of("payload");
        auto t = store.stage(data, MediaKind::Text);
        auto j = store.stage(data, MediaKind::Jpeg);
        REQUIRE(t);
        REQUIRE(j);
        REQUIRE(t->path != j->path);
        REQUIRE(t->path.stem() == j->path.stem());
    }

    SECTION("ShortHashCollisionIsRestaged") {
        // Both digests start with ecebe2dd
        auto a = store.stage_text("payload-90261");
        auto b = store.stage_text("payload-146011");
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(a->path == b->path);
        REQUIRE(a->path == root / "clip-ecebe2dd.txt");
        REQUIRE(a->content_hash != b->content_hash);
        REQUIRE(b->content_hash ==
                "ecebe2dd4a15d2332c8020b4e163c1403c9fca325f02a6ad69dfd2341c60b21b");
        REQUIRE(slurp(b->path) == "payload-146011");
        REQUIRE(store.write_count() == 2);
        REQUIRE(store.index_size() == 1);
    }

    SECTION("VanishedFileIsRestaged") {
        auto a = store.stage_text("hello");
        REQUIRE(a);
        fs::remove(a->path);

        auto b = store.stage_text("hello");
        REQUIRE(b);
        REQUIRE(b->path == a->path);
        REQUIRE(fs::exists(b->path));
        REQUIRE(store.write_count() == 2);
    }

    SECTION("SurvivesRestartWithSamePath") {
        auto a = store.stage_text("persisted");
        REQUIRE(a);

        StagingStore again(root, 15min);
        auto b = again.stage_text("persisted");
        REQUIRE(b);
        REQUIRE(b->path == a->path);
        REQUIRE(slurp(b->path) == "persisted");
    }

    SECTION("NoTemporaryFilesLeftBehind") {
        REQUIRE(store.stage_text("one"));
        REQUIRE(store.stage_text("two"));
        for (const auto& entry : fs::directory_iterator(root)) {
            REQUIRE(entry.path().extension() != ".tmp");
        }
    }

    SECTION("ImageGetsThumbnail") {
        auto png = make_png(600, 300);
        REQUIRE_FALSE(png.empty());

        auto a = store.stage(bytes_of(png), MediaKind::Png);
        REQUIRE(a);
        REQUIRE(a->path.extension() == ".png");
        REQUIRE(a->thumbnail_path);
        REQUIRE(a->thumbnail_path->filename() == a->content_hash.substr(0, 8) + ".thumb.png");
        REQUIRE(fs::exists(*a->thumbnail_path));
    }

    SECTION("UndecodableImageStillStages") {
        auto a = store.stage(bytes_of("not really a png"), MediaKind::Png);
        REQUIRE(a);
        REQUIRE(fs::exists(a->path));
        REQUIRE_FALSE(a->thumbnail_path);
    }

    SECTION("UnwritableRootIsStagingIo") {
        fs::path blocker = tmp.path / "blocker";
        std::ofstream(blocker) << "file, not a directory";

        StagingStore broken(blocker / "stage", 15min);
        auto a = broken.stage_text("x");
        REQUIRE_FALSE(a);
        REQUIRE(a.error().kind == ClipErrorKind::StagingIo);
    }

    SECTION("EvictionRemovesOnlyExpiredFiles") {
        auto a = store.stage_text("hello");
        REQUIRE(a);

        auto fresh = store.evict_expired(std::chrono::system_clock::now());
        REQUIRE(fresh.files_removed == 0);
        REQUIRE(fs::exists(a->path));
        REQUIRE(store.index_size() == 1);

        auto later = store.evict_expired(std::chrono::system_clock::now() + 20min);
        REQUIRE(later.files_removed == 1);
        REQUIRE(later.index_pruned == 1);
        REQUIRE(later.failures == 0);
        REQUIRE_FALSE(fs::exists(a->path));
        REQUIRE(store.index_size() == 0);
    }

    SECTION("EvictionHonoursFileAge") {
        auto old_file = store.stage_text("old");
        auto young_file = store.stage_text("young");
        REQUIRE(old_file);
        REQUIRE(young_file);

        fs::last_write_time(old_file->path, fs::file_time_type::clock::now() - 20min);

        auto stats = store.evict_expired();
        REQUIRE(stats.files_removed == 1);
        REQUIRE_FALSE(fs::exists(old_file->path));
        REQUIRE(fs::exists(young_file->path));
    }

    SECTION("EvictionOfMissingDirectoryIsNoop") {
        StagingStore empty(tmp.path / "never-created", 15min);
        auto stats = empty.evict_expired();
        REQUIRE(stats.files_removed == 0);
        REQUIRE(stats.failures == 0);
    }

    SECTION("EvictionTaskStopsPromptly") {
        std::stop_source src;
        auto start = std::chrono::steady_clock::now();
        std::jthread t([&] { store.run_eviction(src.get_token(), 3600s); });
        std::this_thread::sleep_for(20ms);
        src.request_stop();
        t.join();
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }
}
