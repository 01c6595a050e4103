#include <catch2/catch_test_macros.hpp>

#include "storage/symlink_rotator.hpp"
#include "temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path make_target(const fs::path& dir, const std::string& name) {
    fs::path p = dir / name;
    std::ofstream(p) << name;
    return p;
}

} // namespace

TEST_CASE("SymlinkRotator", "[alias]") {
    TempDir tmp("alias");
    fs::path targets = tmp.path / "stage";
    fs::path aliases = tmp.path / "desk";
    fs::create_directories(targets);

    SECTION("CreatesNumberedAndLatestAlias") {
        SymlinkRotator rot(aliases, "clip-paste", 5);
        auto target = make_target(targets, "clip-aaaaaaaa.png");

        auto alias = rot.create_alias(target, "png");
        REQUIRE(alias);
        REQUIRE(fs::is_symlink(*alias));
        REQUIRE(fs::read_symlink(*alias) == target);
        REQUIRE(alias->filename().string().starts_with("clip-paste-"));
        REQUIRE(alias->extension() == ".png");

        auto latest = rot.latest_alias("png");
        REQUIRE(latest.filename() == "clip-paste.png");
        REQUIRE(fs::read_symlink(latest) == target);
    }

    SECTION("SameSecondAliasesDoNotCollide") {
        SymlinkRotator rot(aliases, "clip-paste", 10);
        auto a = rot.create_alias(make_target(targets, "a.txt"), "txt");
        auto b = rot.create_alias(make_target(targets, "b.txt"), "txt");
        auto c = rot.create_alias(make_target(targets, "c.txt"), "txt");
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(c);
        REQUIRE(*a != *b);
        REQUIRE(*b != *c);
        REQUIRE(rot.numbered_aliases("txt").size() == 3);
    }

    SECTION("RotationKeepsNewestK") {
        SymlinkRotator rot(aliases, "clip-paste", 3);
        std::vector<fs::path> created;
        fs::path last_target;
        for (int i = 0; i < 7; ++i) {
            last_target = make_target(targets, "t" + std::to_string(i) + ".png");
            auto alias = rot.create_alias(last_target, "png");
            REQUIRE(alias);
            created.push_back(*alias);
        }

        REQUIRE(rot.rotate("png") == 4);

        auto remaining = rot.numbered_aliases("png");
        REQUIRE(remaining.size() == 3);
        // Newest first, and exactly the last three created
        REQUIRE(remaining[0] == created[6]);
        REQUIRE(remaining[1] == created[5]);
        REQUIRE(remaining[2] == created[4]);
        for (int i = 0; i < 4; ++i) {
            REQUIRE_FALSE(fs::exists(fs::symlink_status(created[i])));
        }

        REQUIRE(fs::read_symlink(rot.latest_alias("png")) == last_target);
    }

    SECTION("RotationIsPerKind") {
        SymlinkRotator rot(aliases, "clip-paste", 1);
        REQUIRE(rot.create_alias(make_target(targets, "x.png"), "png"));
        REQUIRE(rot.create_alias(make_target(targets, "y.txt"), "txt"));
        REQUIRE(rot.create_alias(make_target(targets, "z.txt"), "txt"));

        REQUIRE(rot.rotate("txt") == 1);
        REQUIRE(rot.numbered_aliases("txt").size() == 1);
        REQUIRE(rot.numbered_aliases("png").size() == 1);
    }

    SECTION("ForeignFilesAreIgnored") {
        fs::create_directories(aliases);
        std::ofstream(aliases / "clip-paste-notes.png") << "regular file";
        fs::create_symlink(targets, aliases / "other-20250101-000000.png");

        SymlinkRotator rot(aliases, "clip-paste", 0);
        REQUIRE(rot.create_alias(make_target(targets, "a.png"), "png"));
        REQUIRE(rot.rotate("png") == 1);

        REQUIRE(fs::exists(aliases / "clip-paste-notes.png"));
        REQUIRE(fs::is_symlink(aliases / "other-20250101-000000.png"));
    }

    SECTION("DanglingAliasesAreStillRotated") {
        SymlinkRotator rot(aliases, "clip-paste", 1);
        auto gone = make_target(targets, "gone.png");
        auto first = rot.create_alias(gone, "png");
        REQUIRE(first);
        fs::remove(gone);
        REQUIRE(rot.create_alias(make_target(targets, "kept.png"), "png"));

        REQUIRE(rot.rotate("png") == 1);
        REQUIRE_FALSE(fs::exists(fs::symlink_status(*first)));
    }

    SECTION("UnusableDirectoryIsAliasError") {
        std::ofstream(tmp.path / "blocker") << "x";
        SymlinkRotator rot(tmp.path / "blocker" / "sub", "clip-paste", 5);
        auto alias = rot.create_alias(make_target(targets, "a.png"), "png");
        REQUIRE_FALSE(alias);
        REQUIRE(alias.error().kind == ClipErrorKind::Alias);
    }

    SECTION("RotateWithoutDirectoryIsNoop") {
        SymlinkRotator rot(tmp.path / "missing", "clip-paste", 2);
        REQUIRE(rot.rotate("png") == 0);
        REQUIRE(rot.numbered_aliases("png").empty());
    }
}
