#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/runner/task_runner.h>
#include <dcarchive/runtime/worker_pool.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <future>
#include <set>

namespace dcarchive {

namespace {

// Listing fields that only make sense to the crawler
const std::set<std::string> INTERNAL_FIELDS = {"raw_html", "onclick",
                                               "pdf_href", "cnr"};

void add_touched(std::vector<PartitionKey> &touched, const PartitionKey &key) {
    if (std::find(touched.begin(), touched.end(), key) == touched.end()) {
        touched.push_back(key);
    }
}

}  // namespace

const char *task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::SKIPPED:
            return "skipped";
        case TaskStatus::NO_DATA:
            return "no-data";
        case TaskStatus::COMPLETED:
            return "completed";
        case TaskStatus::FAILED:
            return "failed";
        case TaskStatus::CANCELLED:
            return "cancelled";
    }
    return "unknown";
}

void RunSummary::add(const TaskResult &result) {
    ++total;
    metadata_stored += result.metadata_stored;
    documents_stored += result.documents_stored;
    switch (result.status) {
        case TaskStatus::SKIPPED:
            ++skipped;
            break;
        case TaskStatus::NO_DATA:
            ++no_data;
            break;
        case TaskStatus::COMPLETED:
            ++completed;
            break;
        case TaskStatus::FAILED:
            ++failed;
            failures.push_back(result);
            break;
        case TaskStatus::CANCELLED:
            ++cancelled;
            break;
    }
}

std::string build_metadata_document(const CourtTask &task,
                                    const RecordRef &record,
                                    const Timestamp &scraped_at) {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"cnr", record.record_id},
        {"state_code", task.court.state_code},
        {"state_name", task.court.state_name},
        {"district_code", task.court.district_code},
        {"district_name", task.court.district_name},
        {"complex_code", task.court.complex_code},
        {"complex_name", task.court.complex_name},
        {"raw_html", ""},
        {"scraped_at", scraped_at.to_iso_string()},
    };
    for (const auto &field : record.fields) {
        if (field.first == "raw_html") {
            fields[7].second = field.second;
        }
    }

    std::set<std::string> present;
    for (const auto &field : fields) present.insert(field.first);
    for (const auto &field : record.fields) {
        if (INTERNAL_FIELDS.count(field.first) ||
            !present.insert(field.first).second) {
            continue;
        }
        fields.push_back(field);
    }

    nlohmann::ordered_json doc;
    for (const auto &field : fields) {
        doc[field.first] = field.second;
    }
    // Bytes that are not UTF-8 in scraped fields become U+FFFD
    return doc.dump(2, ' ', false,
                    nlohmann::ordered_json::error_handler_t::replace);
}

void log_change_summary(const ChangeLog &changes) {
    if (changes.empty()) {
        DCARCHIVE_LOG_INFO("No new files were archived");
        return;
    }
    std::size_t total = 0;
    for (const auto &location : changes) {
        for (const auto &archive : location.second) {
            DCARCHIVE_LOG_INFO("  %s [%s]: %zu files",
                               location.first.c_str(), archive.first.c_str(),
                               archive.second.size());
            total += archive.second.size();
        }
    }
    DCARCHIVE_LOG_INFO("Archived %zu new files in %zu locations", total,
                       changes.size());
}

TaskRunner::TaskRunner(RunContext context, Crawler &crawler,
                       std::shared_ptr<Compressor> compressor,
                       TaskRunnerConfig config, Sleeper sleep)
    : context_(context),
      crawler_(crawler),
      compressor_(std::move(compressor)),
      config_(config),
      sleep_(std::move(sleep)) {}

TaskResult TaskRunner::run_task(const CourtTask &task) {
    TaskResult result;
    result.task_key = task.key();

    try {
        if (context_.ledger.is_completed(result.task_key)) {
            DCARCHIVE_LOG_DEBUG("Skipping already completed task: %s",
                                task.to_string().c_str());
            result.status = TaskStatus::SKIPPED;
            return result;
        }

        Listing listing;
        retry_with_backoff(
            config_.retry, [&] { listing = crawler_.list_records(task); },
            sleep_, &context_.token);

        std::vector<PartitionKey> touched;
        if (listing.empty()) {
            DCARCHIVE_LOG_DEBUG("No results for task: %s",
                                task.to_string().c_str());
            result.status = TaskStatus::NO_DATA;
        } else {
            DCARCHIVE_LOG_INFO("Found %zu orders for task: %s",
                               listing.records.size(),
                               task.to_string().c_str());
            result.records = listing.records.size();
            for (const auto &record : listing.records) {
                process_record(task, record, result, touched);
            }
            result.status = TaskStatus::COMPLETED;
        }

        if (config_.flush_before_mark) {
            for (const auto &key : touched) {
                context_.archive.flush(key);
            }
        }
        context_.ledger.mark_completed(result.task_key);

        if (result.status == TaskStatus::COMPLETED) {
            DCARCHIVE_LOG_INFO(
                "Stored %zu metadata and %zu documents out of %zu orders for "
                "task: %s",
                result.metadata_stored, result.documents_stored,
                result.records, task.to_string().c_str());
        }
    } catch (const CrawlError &e) {
        result.status = TaskStatus::FAILED;
        result.error = e.what();
    } catch (const ArchiveError &e) {
        result.status = TaskStatus::FAILED;
        result.error = e.what();
    } catch (const LedgerError &e) {
        result.status = TaskStatus::FAILED;
        result.error = e.what();
    } catch (const std::exception &e) {
        result.status = TaskStatus::FAILED;
        result.error = std::string("Unexpected error: ") + e.what();
    }

    if (result.status == TaskStatus::FAILED) {
        DCARCHIVE_LOG_ERROR("Error processing task %s: %s",
                            task.to_string().c_str(), result.error.c_str());
    }
    return result;
}

void TaskRunner::process_record(const CourtTask &task,
                                const RecordRef &record, TaskResult &result,
                                std::vector<PartitionKey> &touched) {
    if (record.record_id.empty()) {
        throw CrawlError(CrawlError::MALFORMED,
                         "Record without an identifier in " + task.key());
    }

    // Orders without a usable date land in the year the task starts
    int year = record.year > 0 ? record.year : task.range.start.year;
    PartitionKey metadata_key{year, task.court.state_code,
                              task.court.district_code,
                              task.court.complex_code, ArchiveType::METADATA};
    std::string metadata_name = record.record_id + ".json";
    if (!context_.archive.exists(metadata_key, metadata_name)) {
        context_.archive.put(
            metadata_key, metadata_name,
            build_metadata_document(
                task, record, Timestamp::now(context_.utc_offset_minutes)));
        add_touched(touched, metadata_key);
        ++result.metadata_stored;
    }

    PartitionKey document_key = metadata_key;
    document_key.archive_type = ArchiveType::DOCUMENT;
    std::string document_name = record.record_id + ".pdf";
    std::string compressed_name =
        document_name + (compressor_ ? compressor_->extension() : ".gz");
    if (context_.archive.exists(document_key, document_name) ||
        context_.archive.exists(document_key, compressed_name)) {
        return;
    }

    std::optional<std::string> document;
    retry_with_backoff(
        config_.retry,
        [&] { document = crawler_.fetch_document(task, record); }, sleep_,
        &context_.token);
    if (!document) return;

    if (compressor_) {
        if (auto compressed = compressor_->compress(*document)) {
            context_.archive.put(document_key, compressed_name,
                                 std::move(*compressed));
            add_touched(touched, document_key);
            ++result.documents_stored;
            return;
        }
    }
    context_.archive.put(document_key, document_name, std::move(*document));
    add_touched(touched, document_key);
    ++result.documents_stored;
}

RunSummary TaskRunner::run_tasks(const std::vector<CourtTask> &tasks,
                                 std::size_t max_workers) {
    RunSummary summary;
    if (tasks.empty()) return summary;

    DCARCHIVE_LOG_INFO("Processing %zu tasks with %zu workers", tasks.size(),
                       max_workers);
    std::vector<std::future<TaskResult>> futures;
    futures.reserve(tasks.size());
    {
        WorkerPool pool(std::max<std::size_t>(max_workers, 1));
        for (const auto &task : tasks) {
            futures.push_back(pool.submit([this, &task] {
                if (context_.token.is_cancelled()) {
                    TaskResult cancelled;
                    cancelled.task_key = task.key();
                    cancelled.status = TaskStatus::CANCELLED;
                    return cancelled;
                }
                return run_task(task);
            }));
        }

        std::size_t done = 0;
        std::size_t step = std::max<std::size_t>(tasks.size() / 10, 1);
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                summary.add(futures[i].get());
            } catch (const std::exception &e) {
                TaskResult failed;
                failed.task_key = tasks[i].key();
                failed.error = e.what();
                summary.add(failed);
                DCARCHIVE_LOG_ERROR("Task failed: %s", e.what());
            }
            if (++done % step == 0 || done == futures.size()) {
                DCARCHIVE_LOG_INFO("Processed %zu/%zu tasks", done,
                                   futures.size());
            }
        }
    }

    DCARCHIVE_LOG_INFO(
        "Tasks: %zu completed, %zu without data, %zu skipped, %zu failed, "
        "%zu cancelled",
        summary.completed, summary.no_data, summary.skipped, summary.failed,
        summary.cancelled);
    return summary;
}

}  // namespace dcarchive
