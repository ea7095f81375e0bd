#ifndef DCARCHIVE_RUNNER_TASK_RUNNER_H
#define DCARCHIVE_RUNNER_TASK_RUNNER_H

#include <dcarchive/archive/archive_manager.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/date.h>
#include <dcarchive/crawl/compressor.h>
#include <dcarchive/crawl/crawler.h>
#include <dcarchive/crawl/retry.h>
#include <dcarchive/crawl/task.h>
#include <dcarchive/ledger/completion_ledger.h>
#include <dcarchive/runtime/cancellation.h>

#include <memory>
#include <string>
#include <vector>

namespace dcarchive {

/**
 * Everything a task needs from the running process. Built once by the
 * command that owns these objects and passed down by reference.
 */
struct RunContext {
    ArchiveManager &archive;
    CompletionLedger &ledger;
    const CancellationToken &token;
    int utc_offset_minutes = constants::IST_OFFSET_MINUTES;
};

struct TaskRunnerConfig {
    // Flush the partitions a task touched before marking it completed
    bool flush_before_mark = true;
    RetryPolicy retry;
};

enum class TaskStatus {
    // Already in the Completion Ledger; no crawling done
    SKIPPED,
    // Confirmed empty and marked completed
    NO_DATA,
    COMPLETED,
    FAILED,
    // Not started because the run was cancelled
    CANCELLED
};

const char *task_status_name(TaskStatus status);

struct TaskResult {
    std::string task_key;
    TaskStatus status = TaskStatus::FAILED;
    std::size_t records = 0;
    std::size_t metadata_stored = 0;
    std::size_t documents_stored = 0;
    std::string error;
};

struct RunSummary {
    std::size_t total = 0;
    std::size_t skipped = 0;
    std::size_t no_data = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::size_t metadata_stored = 0;
    std::size_t documents_stored = 0;
    std::vector<TaskResult> failures;

    void add(const TaskResult &result);
    bool all_succeeded() const { return failed == 0 && cancelled == 0; }
};

/**
 * Runs task units: ledger check, listing, dedup against the archive,
 * staging, flush and finally the ledger mark. A task is marked completed
 * only when every record was stored and flushed, or when the source
 * confirmed there is no data.
 */
class TaskRunner {
   public:
    /**
     * @param compressor applied to documents; null stores them as fetched
     * @param sleep used between retries
     */
    TaskRunner(RunContext context, Crawler &crawler,
               std::shared_ptr<Compressor> compressor,
               TaskRunnerConfig config = TaskRunnerConfig(),
               Sleeper sleep = thread_sleeper());

    // Never throws for task-level failures; they come back as FAILED
    TaskResult run_task(const CourtTask &task);

    // Run tasks on a pool of max_workers threads; one failure does not
    // stop the others
    RunSummary run_tasks(const std::vector<CourtTask> &tasks,
                         std::size_t max_workers);

   private:
    void process_record(const CourtTask &task, const RecordRef &record,
                        TaskResult &result,
                        std::vector<PartitionKey> &touched);

    RunContext context_;
    Crawler &crawler_;
    std::shared_ptr<Compressor> compressor_;
    TaskRunnerConfig config_;
    Sleeper sleep_;
};

/**
 * Metadata document stored as {record_id}.json: jurisdiction fields, the
 * scrape time, then the listing fields not already present. Pretty-printed
 * with two-space indentation.
 */
std::string build_metadata_document(const CourtTask &task,
                                    const RecordRef &record,
                                    const Timestamp &scraped_at);

// Log per-location, per-archive counts of what the run stored
void log_change_summary(const ChangeLog &changes);

}  // namespace dcarchive

#endif  // DCARCHIVE_RUNNER_TASK_RUNNER_H
