#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("clipstage_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

HistoryEntry staged(const std::string& hash, const std::string& alias = "") {
    HistoryEntry e;
    e.action = "staged-text";
    e.kind = "txt";
    e.content_hash = hash;
    e.byte_size = 70000;
    e.staged_path = "/tmp/clipstage/clip-" + hash.substr(0, 8) + ".txt";
    e.alias_path = alias;
    return e;
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        HistoryEntry e;
        e.action = "staged-image";
        e.kind = "png";
        e.content_hash = "0123456789abcdef";
        e.byte_size = 4096;
        e.staged_path = "/tmp/clipstage/clip-01234567.png";
        e.alias_path = "/home/u/Desktop/clip-paste-20250101-120000.png";
        REQUIRE(db.insert(e));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].id > 0);
        REQUIRE(entries[0].action == "staged-image");
        REQUIRE(entries[0].kind == "png");
        REQUIRE(entries[0].content_hash == "0123456789abcdef");
        REQUIRE(entries[0].byte_size == 4096);
        REQUIRE(entries[0].staged_path == "/tmp/clipstage/clip-01234567.png");
        REQUIRE(entries[0].alias_path == "/home/u/Desktop/clip-paste-20250101-120000.png");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(staged("hash0000" + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(staged("aaaaaaaa1")));
        REQUIRE(db.insert(staged("bbbbbbbb2")));
        REQUIRE(db.insert(staged("cccccccc3")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].content_hash == "cccccccc3");
        REQUIRE(entries[1].content_hash == "bbbbbbbb2");
        REQUIRE(entries[2].content_hash == "aaaaaaaa1");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Missing alias is stored as NULL, retrieved as empty
        REQUIRE(db.insert(staged("deadbeef00")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].alias_path.empty());
        REQUIRE_FALSE(entries[0].staged_path.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(staged("feedface00")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("ClosedDbRejectsWrites") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(staged("00000000")));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("OpenFailsUnderRegularFile") {
        TmpDb blocker;
        { std::ofstream(blocker.path) << "not a directory"; }
        HistoryDb db;
        REQUIRE_FALSE(db.open(blocker.path + "/sub/history.db"));
        REQUIRE_FALSE(db.is_open());
    }
}
