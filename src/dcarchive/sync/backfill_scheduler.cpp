#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/sync/backfill_scheduler.h>
#include <dcarchive/utils/file.h>
#include <dcarchive/utils/json.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace dcarchive {

std::optional<DateRange> next_chunk(const std::optional<Date> &cursor,
                                    int chunk_years, const Date &today,
                                    const Date &epoch_start) {
    if (chunk_years < 1) {
        throw std::invalid_argument("chunk_years must be at least 1");
    }
    Date start = cursor ? cursor->add_days(1) : epoch_start;
    if (start > today) {
        return std::nullopt;
    }
    Date end(start.year + chunk_years - 1, 12, 31);
    if (end > today) {
        end = today;
    }
    return DateRange{start, end};
}

BackfillCursorStore::BackfillCursorStore(fs::path path)
    : path_(std::move(path)) {}

std::optional<Date> BackfillCursorStore::load() const {
    std::optional<std::string> text;
    try {
        text = utils::read_file(path_);
    } catch (const std::runtime_error &e) {
        throw CursorError(e.what());
    }
    if (!text) return std::nullopt;

    json::JsonParser parser;
    auto doc = json::parse_json(parser, text->data(), text->size());
    if (!doc || !doc->is_object()) {
        throw CursorError("Tracking file " + path_.string() +
                          " is not a JSON object");
    }
    auto value = json::find_string_field(*doc, "last_chunk_end");
    if (!value) return std::nullopt;

    auto date = Date::parse(*value);
    if (!date) {
        throw CursorError("Tracking file " + path_.string() +
                          " has an invalid last_chunk_end: " + *value);
    }
    return date;
}

void BackfillCursorStore::commit(const Date &chunk_end, const Timestamp &now) {
    auto current = load();
    if (current && chunk_end <= *current) {
        throw CursorError("Cursor must advance: " + chunk_end.to_string() +
                          " is not after " + current->to_string());
    }

    nlohmann::ordered_json doc;
    doc["last_chunk_end"] = chunk_end.to_string();
    doc["last_updated"] = now.to_iso_string();
    try {
        utils::write_file_atomic(path_, doc.dump(2));
    } catch (const std::runtime_error &e) {
        throw CursorError("Cannot write " + path_.string() + ": " + e.what());
    }
    DCARCHIVE_LOG_INFO("Backfill cursor advanced to %s",
                       chunk_end.to_string().c_str());
}

const char *backfill_state_name(BackfillState state) {
    switch (state) {
        case BackfillState::IDLE:
            return "idle";
        case BackfillState::COMPUTING_CHUNK:
            return "computing-chunk";
        case BackfillState::RUNNING_CHUNK:
            return "running-chunk";
        case BackfillState::COMMITTED:
            return "committed";
        case BackfillState::FAILED:
            return "failed";
        case BackfillState::INTERRUPTED:
            return "interrupted";
    }
    return "unknown";
}

const char *backfill_outcome_name(BackfillOutcome outcome) {
    switch (outcome) {
        case BackfillOutcome::COMPLETE:
            return "complete";
        case BackfillOutcome::COMMITTED:
            return "committed";
        case BackfillOutcome::FAILED:
            return "failed";
        case BackfillOutcome::INTERRUPTED:
            return "interrupted";
    }
    return "unknown";
}

BackfillScheduler::BackfillScheduler(BackfillCursorStore &cursor_store,
                                     BackfillConfig config,
                                     const CancellationToken &token)
    : cursor_store_(cursor_store), config_(config), token_(token) {}

std::optional<DateRange> BackfillScheduler::next_chunk(
    const Date &today) const {
    return dcarchive::next_chunk(cursor_store_.load(), config_.chunk_years,
                                 today, config_.epoch_start);
}

BackfillReport BackfillScheduler::run_chunk(
    const Date &today, const ChunkWork &work,
    const std::optional<DateRange> &explicit_range) {
    BackfillReport report;

    state_ = BackfillState::COMPUTING_CHUNK;
    report.chunk = explicit_range ? explicit_range : next_chunk(today);
    if (!report.chunk) {
        DCARCHIVE_LOG_INFO("All historical data has been processed");
        state_ = BackfillState::IDLE;
        report.outcome = BackfillOutcome::COMPLETE;
        return report;
    }
    if (report.chunk->start > report.chunk->end) {
        state_ = BackfillState::FAILED;
        report.outcome = BackfillOutcome::FAILED;
        report.error = "Empty range " + report.chunk->to_string();
        return report;
    }

    if (token_.is_cancelled()) {
        state_ = BackfillState::INTERRUPTED;
        report.outcome = BackfillOutcome::INTERRUPTED;
        return report;
    }

    DCARCHIVE_LOG_INFO("Processing chunk %s",
                       report.chunk->to_string().c_str());
    state_ = BackfillState::RUNNING_CHUNK;
    bool succeeded = false;
    try {
        succeeded = work(*report.chunk);
    } catch (const std::exception &e) {
        report.error = e.what();
    }

    if (token_.is_cancelled()) {
        DCARCHIVE_LOG_WARN("Chunk %s interrupted (%s), cursor not advanced",
                           report.chunk->to_string().c_str(),
                           cancel_reason_name(token_.reason()));
        state_ = BackfillState::INTERRUPTED;
        report.outcome = BackfillOutcome::INTERRUPTED;
        return report;
    }
    if (!succeeded) {
        DCARCHIVE_LOG_ERROR("Chunk %s failed%s%s, cursor not advanced",
                            report.chunk->to_string().c_str(),
                            report.error.empty() ? "" : ": ",
                            report.error.c_str());
        state_ = BackfillState::FAILED;
        report.outcome = BackfillOutcome::FAILED;
        return report;
    }

    state_ = BackfillState::COMMITTED;
    if (!explicit_range) {
        try {
            cursor_store_.commit(report.chunk->end,
                                 Timestamp::now(config_.utc_offset_minutes));
            report.cursor_advanced = true;
        } catch (const CursorError &e) {
            state_ = BackfillState::FAILED;
            report.outcome = BackfillOutcome::FAILED;
            report.error = e.what();
            return report;
        }
    } else {
        DCARCHIVE_LOG_INFO("Explicit range %s done, cursor left unchanged",
                           report.chunk->to_string().c_str());
    }
    report.outcome = BackfillOutcome::COMMITTED;
    state_ = BackfillState::IDLE;
    return report;
}

}  // namespace dcarchive
