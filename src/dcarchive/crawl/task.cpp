#include <dcarchive/crawl/task.h>

#include <algorithm>
#include <stdexcept>

namespace dcarchive {

std::string CourtTask::key() const {
    return court.state_code + "_" + court.district_code + "_" +
           court.complex_code + "_" + range.start.to_string() + "_" +
           range.end.to_string();
}

std::string CourtTask::to_string() const {
    return "Task(" + court.state_name + "/" + court.district_name + "/" +
           court.complex_name + ", " + range.to_string() + ")";
}

std::vector<DateRange> split_date_range(const Date &start, const Date &end,
                                        int day_step, const Date &today) {
    if (day_step < 1) {
        throw std::invalid_argument("day_step must be at least 1");
    }
    Date last = std::min(end, today);

    std::vector<DateRange> ranges;
    Date current = start;
    while (current <= last) {
        Date range_end = std::min(current.add_days(day_step - 1), last);
        ranges.push_back(DateRange{current, range_end});
        current = range_end.add_days(1);
    }
    return ranges;
}

std::vector<CourtTask> generate_tasks(const std::vector<CourtComplex> &courts,
                                      const std::vector<DateRange> &ranges) {
    std::vector<CourtTask> tasks;
    tasks.reserve(courts.size() * ranges.size());
    for (const auto &range : ranges) {
        for (const auto &court : courts) {
            tasks.push_back(CourtTask{court, range});
        }
    }
    return tasks;
}

}  // namespace dcarchive
