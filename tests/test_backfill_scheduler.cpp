#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/common/error.h>
#include <dcarchive/sync/backfill_scheduler.h>
#include <doctest/doctest.h>

#include <stdexcept>

#include "testing_utilities.h"

using namespace dcarchive;
using namespace dcarchive_test;

namespace {

BackfillConfig five_years_from_1950() {
    BackfillConfig config;
    config.chunk_years = 5;
    config.epoch_start = Date(1950, 1, 1);
    return config;
}

}  // namespace

TEST_CASE("next_chunk - chunk boundaries") {
    Date today(2024, 6, 10);
    Date epoch(1950, 1, 1);

    auto first = next_chunk(std::nullopt, 5, today, epoch);
    REQUIRE(first.has_value());
    CHECK(first->start == Date(1950, 1, 1));
    CHECK(first->end == Date(1954, 12, 31));

    auto second = next_chunk(first->end, 5, today, epoch);
    REQUIRE(second.has_value());
    CHECK(second->start == Date(1955, 1, 1));
    CHECK(second->end == Date(1959, 12, 31));

    auto last = next_chunk(Date(2019, 12, 31), 5, today, epoch);
    REQUIRE(last.has_value());
    CHECK(last->end == today);

    CHECK_FALSE(next_chunk(today, 5, today, epoch).has_value());
    CHECK_THROWS_AS(next_chunk(std::nullopt, 0, today, epoch),
                    std::invalid_argument);
}

TEST_CASE("BackfillCursorStore - the cursor only moves forward") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    Timestamp now = Timestamp::now(330);

    CHECK_FALSE(cursor.load().has_value());
    cursor.commit(Date(1954, 12, 31), now);
    CHECK(cursor.load() == Date(1954, 12, 31));

    CHECK_THROWS_AS(cursor.commit(Date(1954, 12, 31), now), CursorError);
    CHECK_THROWS_AS(cursor.commit(Date(1950, 1, 1), now), CursorError);
    CHECK(cursor.load() == Date(1954, 12, 31));

    cursor.commit(Date(1959, 12, 31), now);
    CHECK(cursor.load() == Date(1959, 12, 31));
    CHECK(env.read_file("backfill.json").find("\"last_chunk_end\": "
                                              "\"1959-12-31\"") !=
          std::string::npos);
}

TEST_CASE("BackfillCursorStore - corrupt tracking file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));

    env.write_file("backfill.json", "not json");
    CHECK_THROWS_AS(cursor.load(), CursorError);

    env.write_file("backfill.json", "{\"last_chunk_end\": \"31-12-1954\"}");
    CHECK_THROWS_AS(cursor.load(), CursorError);

    env.write_file("backfill.json", "{}");
    CHECK_FALSE(cursor.load().has_value());
}

TEST_CASE("BackfillScheduler - successful chunks advance the cursor") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    CancellationToken token;
    BackfillScheduler scheduler(cursor, five_years_from_1950(), token);
    Date today(2024, 6, 10);

    std::vector<DateRange> seen;
    auto work = [&seen](const DateRange &range) {
        seen.push_back(range);
        return true;
    };

    auto first = scheduler.run_chunk(today, work);
    CHECK(first.outcome == BackfillOutcome::COMMITTED);
    CHECK(first.cursor_advanced);
    CHECK(scheduler.state() == BackfillState::IDLE);

    auto second = scheduler.run_chunk(today, work);
    CHECK(second.outcome == BackfillOutcome::COMMITTED);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == DateRange{Date(1950, 1, 1), Date(1954, 12, 31)});
    CHECK(seen[1] == DateRange{Date(1955, 1, 1), Date(1959, 12, 31)});
    CHECK(cursor.load() == Date(1959, 12, 31));
    CHECK(scheduler.next_chunk(today)->start == Date(1960, 1, 1));
}

TEST_CASE("BackfillScheduler - failures leave the cursor alone") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    CancellationToken token;
    BackfillScheduler scheduler(cursor, five_years_from_1950(), token);
    Date today(2024, 6, 10);

    SUBCASE("Work reports failure") {
        auto report = scheduler.run_chunk(
            today, [](const DateRange &) { return false; });
        CHECK(report.outcome == BackfillOutcome::FAILED);
        CHECK(scheduler.state() == BackfillState::FAILED);
    }

    SUBCASE("Work throws") {
        auto report = scheduler.run_chunk(today, [](const DateRange &) -> bool {
            throw ArchiveError(ArchiveError::FLUSH_ERROR, "store down");
        });
        CHECK(report.outcome == BackfillOutcome::FAILED);
        CHECK(report.error.find("store down") != std::string::npos);
    }

    CHECK_FALSE(cursor.load().has_value());
    CHECK(scheduler.next_chunk(today)->start == Date(1950, 1, 1));
}

TEST_CASE("BackfillScheduler - cancellation interrupts the chunk") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    CancellationToken token;
    BackfillScheduler scheduler(cursor, five_years_from_1950(), token);

    auto report = scheduler.run_chunk(Date(2024, 6, 10),
                                      [&token](const DateRange &) {
                                          token.cancel(CancelReason::TIMEOUT);
                                          return true;
                                      });
    CHECK(report.outcome == BackfillOutcome::INTERRUPTED);
    CHECK(scheduler.state() == BackfillState::INTERRUPTED);
    CHECK_FALSE(report.cursor_advanced);
    CHECK_FALSE(cursor.load().has_value());

    bool ran = false;
    auto skipped = scheduler.run_chunk(Date(2024, 6, 10),
                                       [&ran](const DateRange &) {
                                           ran = true;
                                           return true;
                                       });
    CHECK(skipped.outcome == BackfillOutcome::INTERRUPTED);
    CHECK_FALSE(ran);
}

TEST_CASE("BackfillScheduler - explicit range does not move the cursor") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    CancellationToken token;
    BackfillScheduler scheduler(cursor, five_years_from_1950(), token);

    DateRange range{Date(1980, 1, 1), Date(1980, 12, 31)};
    std::optional<DateRange> seen;
    auto report = scheduler.run_chunk(
        Date(2024, 6, 10),
        [&seen](const DateRange &r) {
            seen = r;
            return true;
        },
        range);
    CHECK(report.outcome == BackfillOutcome::COMMITTED);
    CHECK_FALSE(report.cursor_advanced);
    CHECK(seen == range);
    CHECK_FALSE(cursor.load().has_value());
}

TEST_CASE("BackfillScheduler - complete once past today") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    BackfillCursorStore cursor(env.path("backfill.json"));
    cursor.commit(Date(2024, 6, 10), Timestamp::now(330));
    CancellationToken token;
    BackfillScheduler scheduler(cursor, five_years_from_1950(), token);

    bool ran = false;
    auto report = scheduler.run_chunk(Date(2024, 6, 10),
                                      [&ran](const DateRange &) {
                                          ran = true;
                                          return true;
                                      });
    CHECK(report.outcome == BackfillOutcome::COMPLETE);
    CHECK_FALSE(report.chunk.has_value());
    CHECK_FALSE(ran);
}
