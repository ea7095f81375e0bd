#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/common/error.h>
#include <dcarchive/ledger/completion_ledger.h>
#include <doctest/doctest.h>

#include <thread>
#include <vector>

#include "testing_utilities.h"

using namespace dcarchive;
using namespace dcarchive_test;

TEST_CASE("CompletionLedger - marks survive a restart") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    auto path = env.path("state/track.json");
    const std::string key = "29_9_1290105_2025-01-01_2025-01-10";

    {
        CompletionLedger ledger(path);
        CHECK_FALSE(ledger.is_completed(key));
        CHECK(ledger.size() == 0);
        ledger.mark_completed(key);
        CHECK(ledger.is_completed(key));
        // Marking twice is harmless
        ledger.mark_completed(key);
        CHECK(ledger.size() == 1);
    }

    CompletionLedger reopened(path);
    CHECK(reopened.is_completed(key));
    CHECK_FALSE(reopened.is_completed("29_9_1290105_2025-01-11_2025-01-20"));
    CHECK(env.read_file("state/track.json") ==
          "{\n  \"completed\": [\n    \"29_9_1290105_2025-01-01_2025-01-10\"\n"
          "  ]\n}");
}

TEST_CASE("CompletionLedger - picks up marks from another instance") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    auto path = env.path("track.json");

    CompletionLedger reader(path);
    CompletionLedger writer(path);
    CHECK_FALSE(reader.is_completed("a"));

    writer.mark_completed("a");
    reader.mark_completed("b");
    CHECK(reader.is_completed("a"));
    CHECK(writer.is_completed("b"));
    CHECK(writer.size() == 2);
}

TEST_CASE("CompletionLedger - corrupt file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    env.write_file("track.json", "{\"completed\": [\"a\", ");

    CompletionLedger ledger(env.path("track.json"));
    CHECK_FALSE(ledger.is_completed("a"));
    CHECK_THROWS_AS(ledger.mark_completed("b"), LedgerError);
    // Left untouched
    CHECK(env.read_file("track.json") == "{\"completed\": [\"a\", ");

    env.write_file("track.json", "{\"completed\": \"a\"}");
    CHECK_THROWS_AS(ledger.mark_completed("b"), LedgerError);
}

TEST_CASE("CompletionLedger - concurrent marks from one process") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    CompletionLedger ledger(env.path("track.json"));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&ledger, t]() {
            for (int i = 0; i < 10; ++i) {
                ledger.mark_completed("task_" + std::to_string(t) + "_" +
                                      std::to_string(i));
            }
        });
    }
    for (auto &thread : threads) thread.join();

    CompletionLedger reopened(env.path("track.json"));
    CHECK(reopened.size() == 40);
}
