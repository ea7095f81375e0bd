#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/ledger/completion_ledger.h>
#include <dcarchive/utils/json.h>

#include <nlohmann/json.hpp>

namespace dcarchive {

CompletionLedger::CompletionLedger(fs::path path) : path_(std::move(path)) {}

CompletionLedger::LoadStatus CompletionLedger::load(
    std::set<std::string> &out, std::string &error) const {
    out.clear();
    std::optional<std::string> text;
    try {
        text = utils::read_file(path_);
    } catch (const std::runtime_error &e) {
        error = e.what();
        return LoadStatus::CORRUPT;
    }
    if (!text) return LoadStatus::MISSING;

    json::JsonParser parser;
    auto doc = json::parse_json(parser, text->data(), text->size());
    if (!doc || !doc->is_object()) {
        error = "not a JSON object";
        return LoadStatus::CORRUPT;
    }
    if (json::has_field(*doc, "completed")) {
        auto completed = doc->get_object().at_key("completed");
        if (completed.error() || !completed.value().is_array()) {
            error = "\"completed\" is not a list";
            return LoadStatus::CORRUPT;
        }
    }
    for (auto &key : json::get_string_array_field(*doc, "completed")) {
        out.insert(std::move(key));
    }
    return LoadStatus::OK;
}

void CompletionLedger::refresh_locked() {
    auto stamp = utils::get_file_stamp(path_);
    if (cache_valid_ && stamp == cache_stamp_) return;

    std::string error;
    std::set<std::string> fresh;
    if (load(fresh, error) == LoadStatus::CORRUPT) {
        DCARCHIVE_LOG_WARN("Ignoring unreadable ledger %s: %s",
                           path_.c_str(), error.c_str());
    }
    cache_.swap(fresh);
    cache_stamp_ = stamp;
    cache_valid_ = true;
}

bool CompletionLedger::is_completed(const std::string &task_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked();
    return cache_.count(task_key) > 0;
}

void CompletionLedger::mark_completed(const std::string &task_key) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> completed;
    std::string error;
    if (load(completed, error) == LoadStatus::CORRUPT) {
        throw LedgerError("Refusing to overwrite corrupt ledger " +
                          path_.string() + ": " + error);
    }
    if (!completed.insert(task_key).second) {
        DCARCHIVE_LOG_DEBUG("Task %s already in ledger", task_key.c_str());
    }

    nlohmann::ordered_json doc;
    doc["completed"] = completed;

    try {
        utils::write_file_atomic(path_, doc.dump(2));
    } catch (const nlohmann::ordered_json::exception &e) {
        throw LedgerError("Cannot serialize ledger " + path_.string() + ": " +
                          e.what());
    } catch (const std::runtime_error &e) {
        throw LedgerError("Cannot write " + path_.string() + ": " + e.what());
    }

    cache_.swap(completed);
    cache_stamp_ = utils::get_file_stamp(path_);
    cache_valid_ = true;
    DCARCHIVE_LOG_DEBUG("Marked task %s completed (%zu total)",
                        task_key.c_str(), cache_.size());
}

std::size_t CompletionLedger::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked();
    return cache_.size();
}

}  // namespace dcarchive
