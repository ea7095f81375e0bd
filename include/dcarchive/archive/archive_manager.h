#ifndef DCARCHIVE_ARCHIVE_ARCHIVE_MANAGER_H
#define DCARCHIVE_ARCHIVE_ARCHIVE_MANAGER_H

#include <dcarchive/archive/partition_index.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/partition.h>
#include <dcarchive/storage/object_store.h>
#include <dcarchive/utils/filesystem.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dcarchive {

struct ArchiveConfig {
    // Prepended to every remote key, e.g. "" or "courts/"
    std::string prefix;
    fs::path local_dir = constants::archive::DEFAULT_LOCAL_DIR;
    // Never touch the remote store; the local Index is the source of truth
    bool local_only = false;
    // Upload each Part and Index at flush time instead of at close
    bool immediate_upload = true;
    int utc_offset_minutes = constants::IST_OFFSET_MINUTES;
};

// location -> archive name -> filenames flushed during this process
using ChangeLog =
    std::map<std::string, std::map<std::string, std::vector<std::string>>>;

/**
 * Façade over the partitioned archive. Blobs are staged per partition and
 * packed into a new immutable Part on flush; the partition Index is written
 * strictly after its Part so a crash can orphan a Part but never produce an
 * Index that references a missing one.
 *
 * Each partition has its own mutex guarding its staging buffer, cached Index
 * and flush; the partition map lock is held only for lookup.
 *
 * close() is called by the destructor, so every staged blob is flushed on
 * every exit path that unwinds the stack.
 */
class ArchiveManager {
   public:
    /**
     * @param store remote object store, may be null when config.local_only
     * @throws ArchiveError(INVALID_ARGUMENT) if a remote store is required
     *         but missing
     */
    ArchiveManager(ArchiveConfig config, std::shared_ptr<ObjectStore> store);
    ~ArchiveManager();

    ArchiveManager(const ArchiveManager &) = delete;
    ArchiveManager &operator=(const ArchiveManager &) = delete;

    /**
     * True iff filename is in the partition's Index (any Part) or staged.
     * The first query for a partition loads and caches its Index; an absent
     * Index is an empty partition.
     * @throws ArchiveError(INDEX_ERROR) if the stored Index is unreadable
     */
    bool exists(const PartitionKey &key, const std::string &filename);

    /**
     * Stage a blob. No I/O. Putting a filename that already exists is a
     * caller error: it is logged and the blob is staged anyway.
     * @throws ArchiveError(INVALID_ARGUMENT) for an empty or non-UTF-8 name
     */
    void put(const PartitionKey &key, const std::string &filename,
             std::string content);

    /**
     * Pack the staging buffer into one new Part and append it to the Index.
     * @return false if nothing was staged
     * @throws ArchiveError on failure; the staging buffer is then unchanged
     */
    bool flush(const PartitionKey &key);

    /**
     * Flush every partition with staged blobs. A failing partition does not
     * stop the others; the failures are rethrown together afterwards.
     * @return number of Parts written
     */
    std::size_t flush_all();

    /**
     * Flush all partitions, then upload Parts and Indexes held back in batch
     * mode, Parts first. Idempotent once it has succeeded.
     */
    void close();
    bool is_closed() const { return closed_.load(); }

    ChangeLog changes() const;

    // Copy of the partition's Index, loading it if needed
    PartitionIndex index_snapshot(const PartitionKey &key);
    std::size_t staged_count(const PartitionKey &key);
    std::vector<PartitionKey> dirty_partitions();

    const ArchiveConfig &config() const { return config_; }

   private:
    struct PartitionState {
        std::mutex mutex;
        std::optional<PartitionIndex> index;
        std::vector<std::pair<std::string, std::string>> staging;
        std::unordered_set<std::string> staged_names;
    };

    struct PendingPart {
        PartitionKey key;
        std::string part_name;
        fs::path local_path;
    };

    PartitionState &state_for(const PartitionKey &key);
    void ensure_loaded(const PartitionKey &key, PartitionState &state);
    PartitionIndex load_index(const PartitionKey &key);
    bool flush_locked(const PartitionKey &key, PartitionState &state);
    void upload_pending();
    std::string make_part_name(ArchiveType type, const Timestamp &now);

    ArchiveConfig config_;
    std::shared_ptr<ObjectStore> store_;

    std::mutex map_mutex_;
    std::map<PartitionKey, std::unique_ptr<PartitionState>> partitions_;

    mutable std::mutex changes_mutex_;
    ChangeLog changes_;

    std::mutex pending_mutex_;
    std::vector<PendingPart> pending_parts_;
    std::set<PartitionKey> pending_indexes_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    std::atomic<bool> closed_{false};
};

}  // namespace dcarchive

#endif  // DCARCHIVE_ARCHIVE_ARCHIVE_MANAGER_H
