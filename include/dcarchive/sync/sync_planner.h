#ifndef DCARCHIVE_SYNC_SYNC_PLANNER_H
#define DCARCHIVE_SYNC_SYNC_PLANNER_H

#include <dcarchive/archive/partition_catalog.h>
#include <dcarchive/common/date.h>
#include <dcarchive/common/partition.h>

#include <optional>
#include <string>
#include <vector>

namespace dcarchive {

struct SyncConfig {
    // Archive types whose Indexes define coverage
    std::vector<ArchiveType> archive_types{ArchiveType::METADATA};
    // Scan metadata Parts for "scraped_at" when a partition has no Index
    bool scan_parts_fallback = true;
    // Start of an empty jurisdiction; January 1 of the current year if unset
    std::optional<Date> epoch_start;
};

/**
 * Computes the date range an incremental run still has to fetch. The sync
 * boundary of a jurisdiction is the minimum updated_at over its partitions,
 * so a partition that is behind holds the window open for all of them.
 */
class SyncPlanner {
   public:
    SyncPlanner(PartitionCatalog &catalog, SyncConfig config);

    /**
     * Minimum coverage timestamp of a jurisdiction, or std::nullopt if it
     * has no partitions with known coverage.
     * @throws ArchiveError(INDEX_ERROR) if an Index cannot be parsed
     */
    std::optional<Timestamp> find_boundary(const std::string &state_code);

    /**
     * [boundary + 1 day, min(today, end)], or [epoch, ...] for a
     * jurisdiction without partitions. std::nullopt when already current.
     */
    std::optional<DateRange> compute_sync_window(
        const std::string &state_code, const Date &today,
        const std::optional<Date> &end = std::nullopt);

    // Earliest start over all jurisdictions
    std::optional<DateRange> compute_sync_window(
        const std::vector<std::string> &state_codes, const Date &today,
        const std::optional<Date> &end = std::nullopt);

   private:
    Date window_start(const std::string &state_code, const Date &today);
    std::optional<Timestamp> scan_parts(const PartitionListing &listing);

    PartitionCatalog &catalog_;
    SyncConfig config_;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_SYNC_SYNC_PLANNER_H
