#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/retry.h>
#include <dcarchive/runtime/cancellation.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace dcarchive {

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt,
                                        std::mt19937 &rng) {
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    double seconds =
        policy.base_delay_seconds * std::pow(2.0, std::max(attempt, 0)) +
        jitter(rng);
    seconds = std::min(seconds, policy.max_delay_seconds);
    return std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(seconds * 1000.0));
}

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    };
}

int retry_with_backoff(const RetryPolicy &policy,
                       const std::function<void()> &fn, const Sleeper &sleep,
                       const CancellationToken *token) {
    thread_local std::mt19937 rng{std::random_device{}()};

    for (int attempt = 0;; ++attempt) {
        try {
            fn();
            return attempt;
        } catch (const CrawlError &e) {
            if (!e.is_transient() || attempt >= policy.max_retries ||
                (token != nullptr && token->is_cancelled())) {
                throw;
            }
            auto delay = backoff_delay(policy, attempt, rng);
            DCARCHIVE_LOG_WARN(
                "Attempt %d/%d failed: %s. Retrying in %.2fs", attempt + 1,
                policy.max_retries + 1, e.what(),
                static_cast<double>(delay.count()) / 1000.0);
            sleep(delay);
        }
    }
}

RetryBudget::RetryBudget(int limit) : limit_(std::max(limit, 0)) {}

bool RetryBudget::consume() {
    if (exhausted()) return false;
    ++used_;
    return true;
}

ChallengeSearchResult run_challenge_search(const ChallengeLimits &limits,
                                           const ChallengeSolver &solve,
                                           const SearchSubmitter &submit) {
    ChallengeSearchResult result;
    RetryBudget searches(limits.search_attempts);

    while (searches.consume()) {
        RetryBudget solver(limits.solver_attempts);
        std::optional<std::string> answer;
        while (!answer && solver.consume()) {
            ++result.solver_calls;
            answer = solve();
        }
        if (!answer) {
            DCARCHIVE_LOG_ERROR("Failed to solve challenge after %d attempts",
                                solver.used());
            result.exhausted = true;
            result.response.status = SearchStatus::ERROR;
            result.response.error_message = "challenge solver exhausted";
            return result;
        }

        ++result.search_calls;
        result.response = submit(*answer);
        if (result.response.status != SearchStatus::CHALLENGE_REJECTED) {
            return result;
        }
        DCARCHIVE_LOG_WARN("Search error: %s",
                           result.response.error_message.c_str());
    }

    DCARCHIVE_LOG_ERROR("Challenge rejected %d times, giving up",
                        searches.used());
    result.exhausted = true;
    return result;
}

}  // namespace dcarchive
