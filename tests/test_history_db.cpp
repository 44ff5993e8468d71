#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("vd_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

HistoryEntry entry(const std::string& text) {
    return {
        .filename = "clip.wav",
        .model_used = "whisper-taiwanese",
        .transcription = text,
        .duration = 1.5,
    };
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {
    TmpDb tmp;
    HistoryDb db;

    SECTION("OpenCreatesFile") {
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        REQUIRE(db.open(tmp.path));

        auto e = entry("今天天氣很好");
        e.reference_text = "今天天氣真好";
        e.diff_json = R"([{"type":"equal","text":"今天天氣"}])";
        auto id = db.insert(e);
        REQUIRE(id.has_value());

        auto got = db.get(*id);
        REQUIRE(got.has_value());
        REQUIRE(got->id == *id);
        REQUIRE(got->filename == "clip.wav");
        REQUIRE(got->model_used == "whisper-taiwanese");
        REQUIRE(got->transcription == "今天天氣很好");
        REQUIRE(got->reference_text == "今天天氣真好");
        REQUIRE(got->duration == 1.5);
        REQUIRE(got->diff_json == e.diff_json);
        REQUIRE_FALSE(got->created_at.empty());
    }

    SECTION("NullableFields") {
        REQUIRE(db.open(tmp.path));
        auto id = db.insert(entry("plain"));
        REQUIRE(id.has_value());

        auto got = db.get(*id);
        REQUIRE(got.has_value());
        REQUIRE_FALSE(got->reference_text.has_value());
        REQUIRE_FALSE(got->diff_json.has_value());
    }

    SECTION("ReverseChronologicalWithPaging") {
        REQUIRE(db.open(tmp.path));
        for (const char* t : {"first", "second", "third", "fourth"}) {
            REQUIRE(db.insert(entry(t)).has_value());
        }

        REQUIRE(db.count() == 4);

        auto page = db.recent(2);
        REQUIRE(page.size() == 2);
        REQUIRE(page[0].transcription == "fourth");
        REQUIRE(page[1].transcription == "third");

        auto next = db.recent(2, 2);
        REQUIRE(next.size() == 2);
        REQUIRE(next[0].transcription == "second");
        REQUIRE(next[1].transcription == "first");

        REQUIRE(db.recent(10, 4).empty());
    }

    SECTION("RemoveAndClear") {
        REQUIRE(db.open(tmp.path));
        auto a = db.insert(entry("a"));
        auto b = db.insert(entry("b"));
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());

        REQUIRE(db.remove(*a));
        REQUIRE_FALSE(db.remove(*a));
        REQUIRE_FALSE(db.get(*a).has_value());
        REQUIRE(db.count() == 1);

        REQUIRE(db.clear() == 1);
        REQUIRE(db.count() == 0);
        REQUIRE(db.clear() == 0);
    }

    SECTION("ClosedDbIsInert") {
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(entry("x")).has_value());
        REQUIRE(db.recent().empty());
        REQUIRE(db.count() == 0);
        REQUIRE_FALSE(db.get(1).has_value());
    }
}
