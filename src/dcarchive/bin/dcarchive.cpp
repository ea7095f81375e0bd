#include <dcarchive/archive/archive_manager.h>
#include <dcarchive/archive/partition_catalog.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/date.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/compressor.h>
#include <dcarchive/crawl/court_catalog.h>
#include <dcarchive/crawl/crawler.h>
#include <dcarchive/crawl/task.h>
#include <dcarchive/ledger/completion_ledger.h>
#include <dcarchive/runner/task_runner.h>
#include <dcarchive/runtime/cancellation.h>
#include <dcarchive/storage/object_store.h>
#include <dcarchive/sync/backfill_scheduler.h>
#include <dcarchive/sync/sync_planner.h>
#include <dcarchive/upload/upload_local.h>
#include <dcarchive/utils/filesystem.h>
#include <dcarchive/utils/logger.h>

#ifdef DCARCHIVE_ENABLE_S3
#include <dcarchive/storage/s3_object_store.h>
#endif

#include <algorithm>
#include <argparse/argparse.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace dcarchive;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_INTERRUPTED = 130;

struct CliOptions {
    std::string mode;
    std::string prefix;
    fs::path local_dir;
    fs::path store_root;
    std::string s3_bucket;
    std::string s3_region;
    std::string s3_endpoint;
    fs::path courts_csv;
    fs::path spool_dir;
    fs::path ledger_file;
    fs::path tracking_file;
    CourtFilter filter;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    int day_step = constants::runner::DEFAULT_DAY_STEP;
    std::size_t max_workers = constants::runner::DEFAULT_MAX_WORKERS;
    double timeout_hours = 0.0;
    int chunk_years = constants::backfill::DEFAULT_CHUNK_YEARS;
    bool local_only = false;
    bool compress = true;
    bool dry_run = false;
};

// Flag value, else environment variable, else the default
std::string flag_or_env(const argparse::ArgumentParser &program,
                        const std::string &flag, const char *env) {
    if (!program.is_used(flag)) {
        if (const char *value = std::getenv(env)) {
            return value;
        }
    }
    return program.get<std::string>(flag);
}

std::optional<Date> parse_date_flag(const argparse::ArgumentParser &program,
                                    const std::string &flag) {
    if (!program.is_used(flag)) return std::nullopt;
    std::string text = program.get<std::string>(flag);
    auto date = Date::parse(text);
    if (!date) {
        throw std::invalid_argument("Invalid date for " + flag + ": " + text +
                                    " (expected YYYY-MM-DD)");
    }
    return date;
}

std::optional<std::string> optional_flag(
    const argparse::ArgumentParser &program, const std::string &flag) {
    if (!program.is_used(flag)) return std::nullopt;
    return program.get<std::string>(flag);
}

/**
 * Remote store selected on the command line: S3 when a bucket is given,
 * a directory store for --store-root, otherwise none.
 */
class StoreHandle {
   public:
    explicit StoreHandle(const CliOptions &options) {
        if (!options.s3_bucket.empty()) {
#ifdef DCARCHIVE_ENABLE_S3
            session_ = std::make_unique<AwsSession>();
            S3StoreConfig config;
            config.bucket = options.s3_bucket;
            config.region = options.s3_region;
            config.endpoint = options.s3_endpoint;
            store_ = std::make_shared<S3ObjectStore>(config);
#else
            throw std::invalid_argument(
                "--s3-bucket needs a build with DCARCHIVE_ENABLE_S3=ON");
#endif
        } else if (!options.store_root.empty()) {
            store_ = std::make_shared<LocalObjectStore>(options.store_root);
        }
    }

    ~StoreHandle() {
        // The store must go before the SDK shuts down
        store_.reset();
    }

    StoreHandle(const StoreHandle &) = delete;
    StoreHandle &operator=(const StoreHandle &) = delete;

    const std::shared_ptr<ObjectStore> &store() const { return store_; }

   private:
#ifdef DCARCHIVE_ENABLE_S3
    std::unique_ptr<AwsSession> session_;
#endif
    std::shared_ptr<ObjectStore> store_;
};

std::vector<CourtComplex> load_courts(const CliOptions &options) {
    if (!fs::exists(options.courts_csv)) {
        throw std::runtime_error("Courts file not found: " +
                                 options.courts_csv.string());
    }
    auto catalog = CourtCatalog::load(options.courts_csv);
    auto courts = catalog.filter(options.filter);
    if (courts.empty()) {
        throw std::runtime_error("No courts match the specified filters");
    }
    DCARCHIVE_LOG_INFO("Processing %zu court complexes", courts.size());
    return courts;
}

int exit_code_for(const CancellationToken &token, bool succeeded) {
    if (token.reason() == CancelReason::INTERRUPT) return EXIT_INTERRUPTED;
    return succeeded ? EXIT_OK : EXIT_FAILED;
}

/**
 * Everything a crawling mode needs, built in dependency order and torn down
 * in reverse. The archive is closed explicitly by finish() so that a
 * failing close changes the exit code.
 */
class CrawlSession {
   public:
    CrawlSession(const CliOptions &options, const StoreHandle &store,
                 const CancellationToken &token)
        : options_(options),
          archive_(make_archive_config(options, store),
                   options.local_only ? nullptr : store.store()),
          ledger_(options.ledger_file),
          crawler_(options.spool_dir),
          runner_(RunContext{archive_, ledger_, token,
                             constants::IST_OFFSET_MINUTES},
                  crawler_,
                  options.compress ? std::make_shared<GzipCompressor>()
                                   : nullptr) {}

    RunSummary run(const std::vector<CourtComplex> &courts,
                   const DateRange &window) {
        auto ranges = split_date_range(window.start, window.end,
                                       options_.day_step,
                                       Date::today(constants::IST_OFFSET_MINUTES));
        auto tasks = generate_tasks(courts, ranges);
        DCARCHIVE_LOG_INFO("Generated %zu tasks for %s", tasks.size(),
                           window.to_string().c_str());
        return runner_.run_tasks(tasks, options_.max_workers);
    }

    ArchiveManager &archive() { return archive_; }

    // @return false if the archive could not be closed
    bool finish() {
        try {
            archive_.close();
        } catch (const ArchiveError &e) {
            DCARCHIVE_LOG_ERROR("Closing the archive failed: %s", e.what());
            return false;
        }
        log_change_summary(archive_.changes());
        return true;
    }

   private:
    static ArchiveConfig make_archive_config(const CliOptions &options,
                                             const StoreHandle &store) {
        ArchiveConfig config;
        config.prefix = options.prefix;
        config.local_dir = options.local_dir;
        config.local_only = options.local_only || !store.store();
        config.immediate_upload = true;
        return config;
    }

    const CliOptions &options_;
    ArchiveManager archive_;
    CompletionLedger ledger_;
    DirectoryCrawler crawler_;
    TaskRunner runner_;
};

int run_mode(const CliOptions &options, const StoreHandle &store,
             const CancellationToken &token) {
    if (!options.start_date) {
        DCARCHIVE_LOG_ERROR("--start-date is required for run mode");
        return EXIT_FAILED;
    }
    auto courts = load_courts(options);
    Date today = Date::today(constants::IST_OFFSET_MINUTES);
    DateRange window{*options.start_date, options.end_date.value_or(today)};

    CrawlSession session(options, store, token);
    RunSummary summary = session.run(courts, window);
    bool closed = session.finish();
    return exit_code_for(token, closed && summary.all_succeeded());
}

int sync_mode(const CliOptions &options, const StoreHandle &store,
              const CancellationToken &token) {
    auto courts = load_courts(options);
    Date today = Date::today(constants::IST_OFFSET_MINUTES);

    std::optional<DateRange> window;
    if (options.start_date) {
        window = DateRange{*options.start_date,
                           std::min(options.end_date.value_or(today), today)};
    } else {
        std::unique_ptr<PartitionCatalog> catalog;
        if (options.local_only || !store.store()) {
            catalog = std::make_unique<LocalPartitionCatalog>(options.local_dir);
        } else {
            catalog = std::make_unique<StorePartitionCatalog>(*store.store(),
                                                              options.prefix);
        }
        std::vector<std::string> states;
        for (const auto &state : CourtCatalog(courts).unique_states()) {
            states.push_back(state.first);
        }
        SyncPlanner planner(*catalog, SyncConfig());
        window = planner.compute_sync_window(states, today, options.end_date);
    }
    if (!window || window->start > window->end) {
        DCARCHIVE_LOG_INFO("Archive is up to date, nothing to sync");
        return EXIT_OK;
    }
    DCARCHIVE_LOG_INFO("Syncing %s", window->to_string().c_str());

    CrawlSession session(options, store, token);
    RunSummary summary = session.run(courts, *window);
    bool closed = session.finish();
    return exit_code_for(token, closed && summary.all_succeeded());
}

int backfill_mode(const CliOptions &options, const StoreHandle &store,
                  const CancellationToken &token) {
    auto courts = load_courts(options);
    Date today = Date::today(constants::IST_OFFSET_MINUTES);

    std::optional<DateRange> explicit_range;
    if (options.start_date || options.end_date) {
        if (!options.start_date || !options.end_date) {
            DCARCHIVE_LOG_ERROR(
                "--start-date and --end-date must be given together for "
                "backfill mode");
            return EXIT_FAILED;
        }
        explicit_range = DateRange{*options.start_date, *options.end_date};
    }

    BackfillCursorStore cursor(options.tracking_file);
    BackfillConfig config;
    config.chunk_years = options.chunk_years;
    BackfillScheduler scheduler(cursor, config, token);

    CrawlSession session(options, store, token);
    BackfillReport report = scheduler.run_chunk(
        today,
        [&](const DateRange &chunk) {
            RunSummary summary = session.run(courts, chunk);
            // Checkpoint only what has reached storage
            session.archive().flush_all();
            return summary.all_succeeded();
        },
        explicit_range);
    bool closed = session.finish();

    DCARCHIVE_LOG_INFO("Backfill %s%s%s",
                       backfill_outcome_name(report.outcome),
                       report.chunk ? " for " : "",
                       report.chunk ? report.chunk->to_string().c_str() : "");
    if (report.outcome == BackfillOutcome::COMMITTED && !explicit_range) {
        if (auto next = scheduler.next_chunk(today)) {
            DCARCHIVE_LOG_INFO("Next run will process: %s",
                               next->to_string().c_str());
        } else {
            DCARCHIVE_LOG_INFO("All historical data has been processed");
        }
    }

    bool succeeded = closed && (report.outcome == BackfillOutcome::COMMITTED ||
                                report.outcome == BackfillOutcome::COMPLETE ||
                                (report.outcome ==
                                     BackfillOutcome::INTERRUPTED &&
                                 token.reason() == CancelReason::TIMEOUT));
    return exit_code_for(token, succeeded);
}

int upload_local_mode(const CliOptions &options, const StoreHandle &store) {
    if (!store.store()) {
        DCARCHIVE_LOG_ERROR(
            "upload-local needs a store (--store-root or --s3-bucket)");
        return EXIT_FAILED;
    }
    UploadLocalOptions upload;
    upload.prefix = options.prefix;
    upload.local_dir = options.local_dir;
    upload.filter = options.filter;
    upload.dry_run = options.dry_run;
    auto report = upload_local_files(*store.store(), upload);
    return report.ok() ? EXIT_OK : EXIT_FAILED;
}

}  // namespace

int main(int argc, char **argv) {
    logger::init_stderr_logger("dcarchive");

    argparse::ArgumentParser program("dcarchive", DCARCHIVE_PACKAGE_VERSION);
    program.add_description(
        "Archive court orders into partitioned containers with incremental "
        "sync and resumable backfill");

    program.add_argument("--mode")
        .help("run, sync, backfill or upload-local")
        .default_value<std::string>("run")
        .choices("run", "sync", "backfill", "upload-local");

    program.add_argument("--prefix")
        .help("Key prefix inside the store (env DCARCHIVE_PREFIX)")
        .default_value<std::string>("");
    program.add_argument("--local-dir")
        .help("Local container directory (env DCARCHIVE_LOCAL_DIR)")
        .default_value<std::string>(constants::archive::DEFAULT_LOCAL_DIR);
    program.add_argument("--store-root")
        .help("Directory used as the object store (env DCARCHIVE_STORE_ROOT)")
        .default_value<std::string>("");
    program.add_argument("--s3-bucket")
        .help("S3 bucket used as the object store")
        .default_value<std::string>("");
    program.add_argument("--s3-region")
        .help("S3 region")
        .default_value<std::string>("");
    program.add_argument("--s3-endpoint")
        .help("S3 endpoint override, e.g. a local MinIO")
        .default_value<std::string>("");

    program.add_argument("--courts-csv")
        .help("Court hierarchy CSV")
        .default_value<std::string>("courts.csv");
    program.add_argument("--spool-dir")
        .help("Directory the fetcher drops search results into")
        .default_value<std::string>("./spool");
    program.add_argument("--ledger-file")
        .help("Completion ledger")
        .default_value<std::string>(constants::ledger::DEFAULT_LEDGER_FILE);
    program.add_argument("--tracking-file")
        .help("Backfill cursor file")
        .default_value<std::string>(
            constants::backfill::DEFAULT_TRACKING_FILE);

    program.add_argument("--state-code").help("Filter by state code");
    program.add_argument("--district-code").help("Filter by district code");
    program.add_argument("--complex-code").help("Filter by complex code");
    program.add_argument("--start-date").help("Start date (YYYY-MM-DD)");
    program.add_argument("--end-date").help("End date (YYYY-MM-DD)");

    program.add_argument("--day-step")
        .help("Days per task")
        .scan<'d', int>()
        .default_value(constants::runner::DEFAULT_DAY_STEP);
    program.add_argument("--max-workers")
        .help("Parallel tasks; keep low to avoid rate limiting")
        .scan<'d', std::size_t>()
        .default_value(constants::runner::DEFAULT_MAX_WORKERS);
    program.add_argument("--timeout-hours")
        .help(
            "Wall-clock budget before a graceful stop; backfill defaults to "
            "5.5, other modes to none (0)")
        .scan<'g', double>()
        .default_value(-1.0);
    program.add_argument("--chunk-years")
        .help("Years per backfill chunk")
        .scan<'d', int>()
        .default_value(constants::backfill::DEFAULT_CHUNK_YEARS);

    program.add_argument("--local-only")
        .help("Never touch the object store")
        .flag();
    program.add_argument("--no-compress")
        .help("Store documents without gzip compression")
        .flag();
    program.add_argument("--dry-run")
        .help("Show what upload-local would upload")
        .flag();
    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error")
        .default_value<std::string>("info");

    CliOptions options;
    try {
        program.parse_args(argc, argv);

        options.mode = program.get<std::string>("--mode");
        options.prefix = flag_or_env(program, "--prefix", "DCARCHIVE_PREFIX");
        options.local_dir =
            flag_or_env(program, "--local-dir", "DCARCHIVE_LOCAL_DIR");
        options.store_root =
            flag_or_env(program, "--store-root", "DCARCHIVE_STORE_ROOT");
        options.s3_bucket = program.get<std::string>("--s3-bucket");
        options.s3_region = program.get<std::string>("--s3-region");
        options.s3_endpoint = program.get<std::string>("--s3-endpoint");
        options.courts_csv = program.get<std::string>("--courts-csv");
        options.spool_dir = program.get<std::string>("--spool-dir");
        options.ledger_file = program.get<std::string>("--ledger-file");
        options.tracking_file = program.get<std::string>("--tracking-file");
        options.filter.state_code = optional_flag(program, "--state-code");
        options.filter.district_code =
            optional_flag(program, "--district-code");
        options.filter.complex_code = optional_flag(program, "--complex-code");
        options.start_date = parse_date_flag(program, "--start-date");
        options.end_date = parse_date_flag(program, "--end-date");
        options.day_step = program.get<int>("--day-step");
        options.max_workers = program.get<std::size_t>("--max-workers");
        options.timeout_hours = program.get<double>("--timeout-hours");
        options.chunk_years = program.get<int>("--chunk-years");
        options.local_only = program.get<bool>("--local-only");
        options.compress = !program.get<bool>("--no-compress");
        options.dry_run = program.get<bool>("--dry-run");
    } catch (const std::exception &err) {
        DCARCHIVE_LOG_ERROR("Error occurred: %s", err.what());
        std::cerr << program << std::endl;
        return EXIT_FAILED;
    }

    if (logger::set_log_level(program.get<std::string>("--log-level")) != 0) {
        DCARCHIVE_LOG_WARN("Unknown log level '%s', keeping %s",
                           program.get<std::string>("--log-level").c_str(),
                           logger::get_log_level_string().c_str());
    }

    if (options.timeout_hours < 0) {
        options.timeout_hours = options.mode == "backfill"
                                    ? constants::backfill::DEFAULT_TIMEOUT_HOURS
                                    : 0.0;
    }
    if (options.day_step < 1 || options.max_workers < 1 ||
        options.chunk_years < 1) {
        DCARCHIVE_LOG_ERROR(
            "--day-step, --max-workers and --chunk-years must be positive");
        return EXIT_FAILED;
    }

    DCARCHIVE_LOG_INFO("Mode: %s", options.mode.c_str());
    DCARCHIVE_LOG_INFO("  Local dir: %s", options.local_dir.string().c_str());
    DCARCHIVE_LOG_INFO("  Local only: %s",
                       options.local_only ? "true" : "false");
    DCARCHIVE_LOG_INFO("  Compress documents: %s",
                       options.compress ? "true" : "false");
    if (options.filter.state_code) {
        DCARCHIVE_LOG_INFO("  State: %s", options.filter.state_code->c_str());
    }
    if (options.filter.district_code) {
        DCARCHIVE_LOG_INFO("  District: %s",
                           options.filter.district_code->c_str());
    }
    if (options.filter.complex_code) {
        DCARCHIVE_LOG_INFO("  Complex: %s",
                           options.filter.complex_code->c_str());
    }

    CancellationToken token;
    try {
        InterruptGuard interrupts(token);
        std::unique_ptr<Watchdog> watchdog;
        if (options.timeout_hours > 0) {
            DCARCHIVE_LOG_INFO("  Timeout: %.2f hours", options.timeout_hours);
            watchdog = std::make_unique<Watchdog>(
                token, std::chrono::milliseconds(static_cast<long long>(
                           options.timeout_hours * 3600.0 * 1000.0)));
        }

        StoreHandle store(options);
        if (store.store()) {
            DCARCHIVE_LOG_INFO("  Store: %s%s", store.store()->describe().c_str(),
                               options.prefix.c_str());
        }

        int code = EXIT_OK;
        if (options.mode == "run") {
            code = run_mode(options, store, token);
        } else if (options.mode == "sync") {
            code = sync_mode(options, store, token);
        } else if (options.mode == "backfill") {
            code = backfill_mode(options, store, token);
        } else {
            code = upload_local_mode(options, store);
        }
        if (token.is_cancelled()) {
            DCARCHIVE_LOG_WARN("Stopped early: %s",
                               cancel_reason_name(token.reason()));
        }
        return code;
    } catch (const std::exception &e) {
        DCARCHIVE_LOG_ERROR("Fatal: %s", e.what());
        return token.reason() == CancelReason::INTERRUPT ? EXIT_INTERRUPTED
                                                         : EXIT_FAILED;
    }
}
