#include <doctest/doctest.h>
#include "../../shared/cpp/interview_core/include/transcript_log.hpp"
#include "../support/fakes.hpp"

#include <regex>

TEST_SUITE("TranscriptLog") {
TEST_CASE("records interactions, errors and completion as JSON lines") {
    TempDir dir;
    TranscriptLog log(dir / "nested" / "t.jsonl");
    CHECK(std::filesystem::exists(dir / "nested" / "t.jsonl"));

    log.interaction("interview", "What brings you in?", "I have a headache");
    log.error("validate", "reasoning fallback used");
    log.completion("summary text", "patients/s1/reports/r.txt");

    auto recs = log.read_all();
    REQUIRE(recs.size() == 3);
    CHECK(recs[0]["type"] == "interaction");
    CHECK(recs[0]["stage"] == "interview");
    CHECK(recs[0]["question"] == "What brings you in?");
    CHECK(recs[0]["answer"] == "I have a headache");
    CHECK(recs[1]["type"] == "error");
    CHECK(recs[1]["error"] == "reasoning fallback used");
    CHECK(recs[2]["type"] == "completion");
    CHECK(recs[2]["location"] == "patients/s1/reports/r.txt");
    for (const auto& r : recs) CHECK(r.contains("timestamp"));
}

TEST_CASE("remove deletes the file and drops later appends") {
    TempDir dir;
    TranscriptLog log(dir / "t.jsonl");
    log.interaction("interview", "q", "a");
    log.remove();
    CHECK(log.removed());
    CHECK_FALSE(std::filesystem::exists(log.path()));

    log.error("interview", "too late");
    CHECK_FALSE(std::filesystem::exists(log.path()));
    CHECK(log.read_all().empty());
}

TEST_CASE("an unwritable location throws on construction") {
    TempDir dir;
    std::ofstream(dir / "file") << "x";
    CHECK_THROWS(TranscriptLog(dir / "file" / "t.jsonl"));
}

TEST_CASE("utc_timestamp is ISO-8601 with milliseconds") {
    std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    CHECK(std::regex_match(utc_timestamp(), iso));
}

TEST_CASE("file_safe_name keeps plain ids and encodes the rest") {
    CHECK(file_safe_name("session_2025-01-01") == "session_2025-01-01");
    CHECK(file_safe_name("patient/42") == "patient%2F42");
    CHECK(file_safe_name("../etc") == "%2E%2E%2Fetc");
    CHECK(file_safe_name("100%") == "100%25");
    CHECK(file_safe_name("a b") != file_safe_name("a_b"));
}
}
