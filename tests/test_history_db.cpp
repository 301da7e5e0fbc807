#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>

namespace {

TranscriptResult result(const std::string& text, const std::string& file = "") {
    return TranscriptResult{
        .text = text,
        .duration_s = 2.5,
        .processing_s = 0.3,
        .audio_file = file,
    };
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {
    TmpDir dir;
    auto path = (dir / "data" / "history.db").string();

    SECTION("OpenCreatesFileAndDirectory") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(path));
    }

    SECTION("InsertAndRetrieve") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert(result("hello world", "/tmp/recording_1.wav"), "base"));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].audio_duration == 2.5);
        REQUIRE(entries[0].processing_time == 0.3);
        REQUIRE(entries[0].audio_file == "/tmp/recording_1.wav");
        REQUIRE(entries[0].model == "base");
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("NewestFirstWithLimit") {
        HistoryDb db;
        REQUIRE(db.open(path));
        for (auto t : {"first", "second", "third"}) {
            REQUIRE(db.insert(result(t), "base"));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
    }

    SECTION("EmptyOptionalColumns") {
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert(result("x"), ""));

        auto entries = db.recent(1);
        REQUIRE(entries[0].audio_file.empty());
        REQUIRE(entries[0].model.empty());
    }

    SECTION("SurvivesReopen") {
        {
            HistoryDb db;
            REQUIRE(db.open(path));
            REQUIRE(db.insert(result("kept"), "small"));
        }
        HistoryDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.recent(10).size() == 1);
    }

    SECTION("ClosedDbRefusesWork") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(result("x"), "base"));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("UnopenablePathFails") {
        write_file(dir / "blocker", "x");
        HistoryDb db;
        REQUIRE_FALSE(db.open((dir / "blocker" / "history.db").string()));
        REQUIRE_FALSE(db.is_open());
    }
}
