#ifndef DCARCHIVE_CRAWL_RETRY_H
#define DCARCHIVE_CRAWL_RETRY_H

#include <dcarchive/common/constants.h>
#include <dcarchive/crawl/response_parser.h>

#include <chrono>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace dcarchive {

class CancellationToken;

struct RetryPolicy {
    // Attempts after the first one
    int max_retries = constants::runner::DEFAULT_MAX_RETRIES;
    double base_delay_seconds = constants::runner::DEFAULT_BASE_DELAY_SECONDS;
    double max_delay_seconds = constants::runner::DEFAULT_MAX_DELAY_SECONDS;
};

/**
 * Delay before retry number `attempt` (0-based):
 * min(base * 2^attempt + U(0, 1) seconds, max).
 */
std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt,
                                        std::mt19937 &rng);

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Sleeper backed by std::this_thread::sleep_for
Sleeper thread_sleeper();

/**
 * Call fn, retrying transient CrawlErrors up to policy.max_retries times
 * with backoff_delay between attempts. Any other exception, and the last
 * transient one, propagates. A cancelled token stops further retries.
 * @return number of retries that were needed
 */
int retry_with_backoff(const RetryPolicy &policy,
                       const std::function<void()> &fn,
                       const Sleeper &sleep = thread_sleeper(),
                       const CancellationToken *token = nullptr);

/**
 * Counts attempts against a fixed limit.
 */
class RetryBudget {
   public:
    explicit RetryBudget(int limit);

    // Take one attempt; false once the budget is spent
    bool consume();

    int limit() const { return limit_; }
    int used() const { return used_; }
    int remaining() const { return limit_ - used_; }
    bool exhausted() const { return used_ >= limit_; }

   private:
    int limit_;
    int used_ = 0;
};

struct ChallengeLimits {
    // Images fetched and decoded before giving up on one search
    int solver_attempts = constants::runner::DEFAULT_SOLVER_ATTEMPTS;
    // Searches submitted after the portal rejected the answer
    int search_attempts = constants::runner::DEFAULT_SEARCH_ATTEMPTS;

    // Upper bound on solver calls for one task
    int combined_ceiling() const { return solver_attempts * search_attempts; }
};

// Returns the answer, or std::nullopt when the image could not be read
using ChallengeSolver = std::function<std::optional<std::string>()>;
using SearchSubmitter =
    std::function<SearchResponse(const std::string &answer)>;

struct ChallengeSearchResult {
    SearchResponse response;
    int solver_calls = 0;
    int search_calls = 0;
    // True when a budget ran out before the portal accepted an answer
    bool exhausted = false;
};

/**
 * Solve-then-search loop. Each search gets a fresh RetryBudget of
 * solver_attempts; running out of it ends the whole loop. A response of
 * CHALLENGE_REJECTED starts another search while search_attempts allows.
 *
 * This is the retry contract for Crawler implementations that talk to the
 * live portal: they supply the HTTP submitter and the image solver, and map
 * an exhausted result to CrawlError(TRANSIENT). DirectoryCrawler reads
 * responses an external fetcher already obtained and does not call it.
 */
ChallengeSearchResult run_challenge_search(const ChallengeLimits &limits,
                                           const ChallengeSolver &solve,
                                           const SearchSubmitter &submit);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_RETRY_H
