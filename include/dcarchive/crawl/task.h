#ifndef DCARCHIVE_CRAWL_TASK_H
#define DCARCHIVE_CRAWL_TASK_H

#include <dcarchive/common/date.h>
#include <dcarchive/crawl/court_catalog.h>

#include <string>
#include <vector>

namespace dcarchive {

// One date-range search against one court complex
struct CourtTask {
    CourtComplex court;
    DateRange range;

    // Completion Ledger key: {state}_{district}_{complex}_{from}_{to}
    std::string key() const;
    std::string to_string() const;
};

/**
 * Split [start, end] into consecutive ranges of at most day_step days. The
 * end is capped at today; an empty vector means nothing to do.
 * @throws std::invalid_argument if day_step < 1
 */
std::vector<DateRange> split_date_range(const Date &start, const Date &end,
                                        int day_step, const Date &today);

// One task per (range, court), ranges in the outer loop
std::vector<CourtTask> generate_tasks(const std::vector<CourtComplex> &courts,
                                      const std::vector<DateRange> &ranges);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_TASK_H
