#ifndef DCARCHIVE_UPLOAD_UPLOAD_LOCAL_H
#define DCARCHIVE_UPLOAD_UPLOAD_LOCAL_H

#include <dcarchive/archive/partition_index.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/partition.h>
#include <dcarchive/crawl/court_catalog.h>
#include <dcarchive/storage/object_store.h>
#include <dcarchive/utils/filesystem.h>

#include <string>
#include <vector>

namespace dcarchive {

struct UploadLocalOptions {
    std::string prefix;
    fs::path local_dir = constants::archive::DEFAULT_LOCAL_DIR;
    CourtFilter filter;
    // Log what would be uploaded without writing anything
    bool dry_run = false;
    int utc_offset_minutes = constants::IST_OFFSET_MINUTES;
};

struct UploadLocalReport {
    std::size_t found = 0;
    std::size_t uploaded = 0;
    // Already present in the store
    std::size_t skipped = 0;
    std::size_t indexes_uploaded = 0;
    std::size_t failed = 0;
    std::vector<std::string> uploaded_keys;

    bool ok() const { return failed == 0; }
};

/**
 * Classify a container found in a partition directory: names starting
 * with "orders" are documents, "metadata" are metadata, and legacy
 * "part-*" containers follow their siblings (documents if any sibling
 * name contains "orders").
 * @return std::nullopt for containers that match none of these
 */
std::optional<ArchiveType> classify_container(
    const std::string &name, const std::vector<std::string> &siblings);

/**
 * Index for a legacy single-container archive (orders.tar, metadata.tar)
 * that was written without one. Member paths are reduced to basenames.
 */
PartitionIndex build_container_index(const PartitionKey &key,
                                     const fs::path &container,
                                     const Timestamp &now);

/**
 * Publish containers left in {local_dir}/{Y}/{S}/{D}/{C}/*.tar by a
 * local-only run. Containers already in the store are skipped. For each
 * partition, Parts go up before its Index: a local Index is uploaded once
 * every container of that archive is in the store and something new was
 * uploaded (or the store has no Index yet). Legacy orders.tar and
 * metadata.tar get an Index built from their contents, which is also
 * written locally.
 *
 * Per-container failures are logged and counted; the scan continues.
 */
UploadLocalReport upload_local_files(ObjectStore &store,
                                     const UploadLocalOptions &options);

}  // namespace dcarchive

#endif  // DCARCHIVE_UPLOAD_UPLOAD_LOCAL_H
