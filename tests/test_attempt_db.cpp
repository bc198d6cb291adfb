#include <catch2/catch_test_macros.hpp>

#include "storage/attempt_db.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <string>

using test::TmpDir;

TEST_CASE("AttemptDb", "[attempts]") {
    TmpDir dir;
    auto path = dir.file("attempts.db");

    SECTION("OpenCreatesFile") {
        AttemptDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(path));
    }

    SECTION("OpenCreatesParentDirectory") {
        AttemptDb db;
        REQUIRE(db.open(dir.file("nested/deeper/attempts.db")));
        REQUIRE(std::filesystem::exists(dir.file("nested/deeper/attempts.db")));
    }

    SECTION("InsertAndRetrieve") {
        AttemptDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert("job-1", "cloud-openai", "failed", "HTTP 500", 0.25));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].job_id == "job-1");
        REQUIRE(entries[0].strategy == "cloud-openai");
        REQUIRE(entries[0].outcome == "failed");
        REQUIRE(entries[0].error == "HTTP 500");
        REQUIRE(entries[0].processing_time == 0.25);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("EmptyErrorStoredAsNull") {
        AttemptDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert("job-1", "local", "completed", "", 1.0));
        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].error.empty());
    }

    SECTION("RecentIsNewestFirstAndLimited") {
        AttemptDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert("a", "local", "failed", "x", 0.1));
        REQUIRE(db.insert("b", "cloud-openai", "failed", "y", 0.1));
        REQUIRE(db.insert("c", "fallback", "completed", "", 0.1));

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].job_id == "c");
        REQUIRE(entries[1].job_id == "b");
    }

    SECTION("ForJobInAttemptOrder") {
        AttemptDb db;
        REQUIRE(db.open(path));
        REQUIRE(db.insert("job-1", "local", "failed", "timeout", 0.1));
        REQUIRE(db.insert("job-2", "local", "completed", "", 0.1));
        REQUIRE(db.insert("job-1", "fallback", "completed", "", 0.2));

        auto entries = db.for_job("job-1");
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].strategy == "local");
        REQUIRE(entries[1].strategy == "fallback");
        REQUIRE(db.for_job("nope").empty());
    }

    SECTION("SurvivesReopen") {
        {
            AttemptDb db;
            REQUIRE(db.open(path));
            REQUIRE(db.insert("job-1", "local", "cancelled", "Cancelled by user", 0.5));
        }
        AttemptDb db;
        REQUIRE(db.open(path));
        auto entries = db.recent();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].outcome == "cancelled");
    }

    SECTION("ClosedDbRefusesWork") {
        AttemptDb db;
        REQUIRE_FALSE(db.insert("job-1", "local", "completed", "", 0.1));
        REQUIRE(db.recent().empty());

        REQUIRE(db.open(path));
        db.close();
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert("job-1", "local", "completed", "", 0.1));
    }
}
