#ifndef DCARCHIVE_SYNC_BACKFILL_SCHEDULER_H
#define DCARCHIVE_SYNC_BACKFILL_SCHEDULER_H

#include <dcarchive/common/constants.h>
#include <dcarchive/common/date.h>
#include <dcarchive/runtime/cancellation.h>
#include <dcarchive/utils/filesystem.h>

#include <functional>
#include <optional>
#include <string>

namespace dcarchive {

/**
 * Next historical chunk after cursor: starts at epoch_start (cursor unset)
 * or the day after the cursor, ends on December 31 of start year +
 * chunk_years - 1, capped at today. std::nullopt once start is past today.
 */
std::optional<DateRange> next_chunk(const std::optional<Date> &cursor,
                                    int chunk_years, const Date &today,
                                    const Date &epoch_start);

/**
 * Persists the backfill cursor as
 * {"last_chunk_end": "YYYY-MM-DD", "last_updated": "<iso>"}.
 */
class BackfillCursorStore {
   public:
    explicit BackfillCursorStore(fs::path path);

    // @throws CursorError if the file exists but cannot be parsed
    std::optional<Date> load() const;

    /**
     * @throws CursorError if chunk_end does not strictly advance the cursor
     *         or the file cannot be written
     */
    void commit(const Date &chunk_end, const Timestamp &now);

    const fs::path &path() const { return path_; }

   private:
    fs::path path_;
};

struct BackfillConfig {
    int chunk_years = constants::backfill::DEFAULT_CHUNK_YEARS;
    Date epoch_start{constants::backfill::DEFAULT_EPOCH_YEAR, 1, 1};
    int utc_offset_minutes = constants::IST_OFFSET_MINUTES;
};

enum class BackfillState {
    IDLE,
    COMPUTING_CHUNK,
    RUNNING_CHUNK,
    COMMITTED,
    FAILED,
    INTERRUPTED
};

enum class BackfillOutcome {
    // Nothing left to backfill
    COMPLETE,
    COMMITTED,
    FAILED,
    INTERRUPTED
};

const char *backfill_state_name(BackfillState state);
const char *backfill_outcome_name(BackfillOutcome outcome);

struct BackfillReport {
    BackfillOutcome outcome = BackfillOutcome::COMPLETE;
    std::optional<DateRange> chunk;
    bool cursor_advanced = false;
    std::string error;
};

/**
 * Work for one chunk: dispatch its tasks and flush the archive. Returns
 * true only if every task succeeded and the flush went through.
 */
using ChunkWork = std::function<bool(const DateRange &)>;

/**
 * Idle -> ComputingChunk -> RunningChunk -> (Committed | Failed).
 * Interrupted is reported when the token is cancelled while the chunk
 * runs. Only Committed moves the cursor, and then returns to Idle.
 */
class BackfillScheduler {
   public:
    BackfillScheduler(BackfillCursorStore &cursor_store, BackfillConfig config,
                      const CancellationToken &token);

    BackfillState state() const { return state_; }
    std::optional<DateRange> next_chunk(const Date &today) const;

    /**
     * Run one chunk. An explicit range replaces the computed chunk and
     * never moves the cursor.
     */
    BackfillReport run_chunk(const Date &today, const ChunkWork &work,
                             const std::optional<DateRange> &explicit_range =
                                 std::nullopt);

   private:
    BackfillCursorStore &cursor_store_;
    BackfillConfig config_;
    const CancellationToken &token_;
    BackfillState state_ = BackfillState::IDLE;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_SYNC_BACKFILL_SCHEDULER_H
