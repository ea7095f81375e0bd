#ifndef DCARCHIVE_CRAWL_CRAWLER_H
#define DCARCHIVE_CRAWL_CRAWLER_H

#include <dcarchive/crawl/task.h>
#include <dcarchive/utils/filesystem.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dcarchive {

// One case record found by a search
struct RecordRef {
    // CNR, or a sanitized case number when the portal shows none
    std::string record_id;
    // Year of the order; selects the partition
    int year = 0;
    // Listing fields in the order the source reported them
    std::vector<std::pair<std::string, std::string>> fields;
    // Crawler-private handle used by fetch_document
    std::string locator;
};

struct Listing {
    std::vector<RecordRef> records;

    // A confirmed "no data" outcome
    bool empty() const { return records.empty(); }
};

/**
 * Produces records for one task unit. Failures are reported as CrawlError:
 * TRANSIENT for timeouts and rate limiting, PERMANENT when the origin
 * refuses, MALFORMED for content that is neither data nor a confirmed
 * "no data". Implementations must be safe to call from several threads.
 */
class Crawler {
   public:
    virtual ~Crawler() = default;

    virtual Listing list_records(const CourtTask &task) = 0;

    // @return std::nullopt if the record has no document
    virtual std::optional<std::string> fetch_document(
        const CourtTask &task, const RecordRef &record) = 0;
};

/**
 * Reads what an external fetcher left in a spool directory:
 *
 *   {spool}/{state}/{district}/{complex}/{YYYY-MM-DD}/
 *       search.json     raw portal response for that day
 *       {cnr}.json      listing fields of one record (JSON object)
 *       {cnr}.pdf       the order document (optional)
 *
 * A day counts as fetched only once its search.json holds a listing or a
 * confirmed "no data". A missing complex directory, day directory or
 * search.json fails the task with CrawlError(INCOMPLETE), so an empty
 * listing is never mistaken for a day without orders.
 */
class DirectoryCrawler : public Crawler {
   public:
    explicit DirectoryCrawler(fs::path spool_dir);

    Listing list_records(const CourtTask &task) override;
    std::optional<std::string> fetch_document(const CourtTask &task,
                                              const RecordRef &record) override;

    const fs::path &spool_dir() const { return spool_dir_; }

   private:
    void confirm_day(const fs::path &day_dir) const;
    RecordRef read_record(const fs::path &path, const Date &day) const;

    fs::path spool_dir_;
};

// Year of a DD-MM-YYYY order date, or std::nullopt if it does not parse
std::optional<int> order_date_year(const std::string &order_date);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_CRAWLER_H
