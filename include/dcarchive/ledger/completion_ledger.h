#ifndef DCARCHIVE_LEDGER_COMPLETION_LEDGER_H
#define DCARCHIVE_LEDGER_COMPLETION_LEDGER_H

#include <dcarchive/utils/file.h>
#include <dcarchive/utils/filesystem.h>

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace dcarchive {

/**
 * Durable, grow-only set of finished task keys stored as
 * {"completed": [...]}.
 *
 * mark_completed() reloads the file, adds the key and rewrites the whole
 * set under one mutex, so separate processes appending at different times
 * do not drop each other's keys. Two processes marking at the same instant
 * can still race; entries are only ever added, so a lost key costs one
 * repeated task and nothing else.
 */
class CompletionLedger {
   public:
    explicit CompletionLedger(fs::path path);

    /**
     * Served from a cache that is refreshed when the file's size or
     * modification time changes. An unreadable or corrupt file reads as
     * empty and is logged.
     */
    bool is_completed(const std::string &task_key);

    /**
     * @throws LedgerError if the file cannot be written, or if it exists
     *         but is corrupt (it is left untouched for inspection)
     */
    void mark_completed(const std::string &task_key);

    std::size_t size();
    const fs::path &path() const { return path_; }

   private:
    enum class LoadStatus { OK, MISSING, CORRUPT };

    LoadStatus load(std::set<std::string> &out, std::string &error) const;
    void refresh_locked();

    fs::path path_;
    std::mutex mutex_;
    std::set<std::string> cache_;
    std::optional<utils::FileStamp> cache_stamp_;
    bool cache_valid_ = false;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_LEDGER_COMPLETION_LEDGER_H
