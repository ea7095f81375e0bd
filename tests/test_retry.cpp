#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/common/error.h>
#include <dcarchive/crawl/retry.h>
#include <dcarchive/runtime/cancellation.h>
#include <doctest/doctest.h>

#include <vector>

using namespace dcarchive;
using std::chrono::milliseconds;

namespace {

struct RecordingSleeper {
    std::vector<milliseconds> delays;

    Sleeper sleeper() {
        return [this](milliseconds delay) { delays.push_back(delay); };
    }
};

SearchResponse response(SearchStatus status) {
    SearchResponse r;
    r.status = status;
    if (status == SearchStatus::CHALLENGE_REJECTED) {
        r.error_message = "Invalid Captcha";
    }
    return r;
}

}  // namespace

TEST_CASE("backoff_delay - exponential with jitter, capped") {
    RetryPolicy policy;
    std::mt19937 rng(42);

    for (int attempt = 0; attempt < 4; ++attempt) {
        auto delay = backoff_delay(policy, attempt, rng);
        long floor_ms = 1000L << attempt;
        CHECK(delay.count() >= floor_ms);
        CHECK(delay.count() <= floor_ms + 1000);
    }
    CHECK(backoff_delay(policy, 5, rng) == milliseconds(30000));
    CHECK(backoff_delay(policy, 20, rng) == milliseconds(30000));
}

TEST_CASE("retry_with_backoff - transient errors") {
    RetryPolicy policy;
    RecordingSleeper sleeper;

    SUBCASE("Succeeds after two failures") {
        int calls = 0;
        int retries = retry_with_backoff(
            policy,
            [&calls]() {
                if (++calls < 3) {
                    throw CrawlError(CrawlError::TRANSIENT, "timeout");
                }
            },
            sleeper.sleeper());
        CHECK(retries == 2);
        CHECK(calls == 3);
        CHECK(sleeper.delays.size() == 2);
    }

    SUBCASE("Gives up after max_retries") {
        int calls = 0;
        CHECK_THROWS_AS(retry_with_backoff(
                            policy,
                            [&calls]() {
                                ++calls;
                                throw CrawlError(CrawlError::TRANSIENT,
                                                 "rate limited");
                            },
                            sleeper.sleeper()),
                        CrawlError);
        CHECK(calls == policy.max_retries + 1);
        CHECK(sleeper.delays.size() == 3);
    }
}

TEST_CASE("retry_with_backoff - permanent errors are not retried") {
    RetryPolicy policy;
    RecordingSleeper sleeper;
    int calls = 0;

    CHECK_THROWS_AS(retry_with_backoff(
                        policy,
                        [&calls]() {
                            ++calls;
                            throw CrawlError(CrawlError::PERMANENT, "403");
                        },
                        sleeper.sleeper()),
                    CrawlError);
    CHECK(calls == 1);
    CHECK(sleeper.delays.empty());

    CHECK_THROWS_AS(retry_with_backoff(
                        policy, []() { throw std::runtime_error("bug"); },
                        sleeper.sleeper()),
                    std::runtime_error);
}

TEST_CASE("retry_with_backoff - cancellation stops retrying") {
    RetryPolicy policy;
    RecordingSleeper sleeper;
    CancellationToken token;
    token.cancel(CancelReason::INTERRUPT);
    int calls = 0;

    CHECK_THROWS_AS(retry_with_backoff(
                        policy,
                        [&calls]() {
                            ++calls;
                            throw CrawlError(CrawlError::TRANSIENT, "timeout");
                        },
                        sleeper.sleeper(), &token),
                    CrawlError);
    CHECK(calls == 1);
}

TEST_CASE("RetryBudget - counts attempts") {
    RetryBudget budget(2);
    CHECK(budget.remaining() == 2);
    CHECK(budget.consume());
    CHECK(budget.consume());
    CHECK_FALSE(budget.consume());
    CHECK(budget.exhausted());
    CHECK(budget.used() == 2);

    RetryBudget none(-1);
    CHECK(none.exhausted());
}

TEST_CASE("run_challenge_search - budgets") {
    ChallengeLimits limits;
    CHECK(limits.combined_ceiling() == 44);

    SUBCASE("Accepted on the first try") {
        auto result = run_challenge_search(
            limits, []() { return std::optional<std::string>("abc123"); },
            [](const std::string &answer) {
                auto r = response(SearchStatus::OK);
                r.body = answer;
                return r;
            });
        CHECK(result.response.status == SearchStatus::OK);
        CHECK(result.response.body == "abc123");
        CHECK(result.solver_calls == 1);
        CHECK(result.search_calls == 1);
        CHECK_FALSE(result.exhausted);
    }

    SUBCASE("Solver never produces an answer") {
        int searches = 0;
        auto result = run_challenge_search(
            limits, []() { return std::optional<std::string>(); },
            [&searches](const std::string &) {
                ++searches;
                return response(SearchStatus::OK);
            });
        CHECK(result.exhausted);
        CHECK(result.solver_calls == limits.solver_attempts);
        CHECK(searches == 0);
        CHECK(result.response.status == SearchStatus::ERROR);
    }

    SUBCASE("Portal keeps rejecting the answer") {
        int solves = 0;
        auto result = run_challenge_search(
            limits,
            [&solves]() -> std::optional<std::string> {
                // Two unreadable images before each readable one
                if (++solves % 3 != 0) return std::nullopt;
                return std::string("guess");
            },
            [](const std::string &) {
                return response(SearchStatus::CHALLENGE_REJECTED);
            });
        CHECK(result.exhausted);
        CHECK(result.search_calls == limits.search_attempts);
        CHECK(result.solver_calls == 3 * limits.search_attempts);
        CHECK(result.solver_calls <= limits.combined_ceiling());
        CHECK(result.response.status == SearchStatus::CHALLENGE_REJECTED);
    }

    SUBCASE("Rejected once, then accepted") {
        int searches = 0;
        auto result = run_challenge_search(
            limits, []() { return std::optional<std::string>("x"); },
            [&searches](const std::string &) {
                return response(++searches == 1
                                    ? SearchStatus::CHALLENGE_REJECTED
                                    : SearchStatus::NO_DATA);
            });
        CHECK_FALSE(result.exhausted);
        CHECK(result.search_calls == 2);
        CHECK(result.response.status == SearchStatus::NO_DATA);
    }
}
