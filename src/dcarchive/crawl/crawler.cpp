#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/crawler.h>
#include <dcarchive/crawl/response_parser.h>
#include <dcarchive/utils/file.h>
#include <dcarchive/utils/json.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace dcarchive {

namespace {
constexpr const char *SEARCH_FILE = "search.json";

std::string read_or_throw(const fs::path &path) {
    std::optional<std::string> text;
    try {
        text = utils::read_file(path);
    } catch (const std::runtime_error &e) {
        throw CrawlError(CrawlError::TRANSIENT, e.what());
    }
    if (!text) {
        throw CrawlError(CrawlError::TRANSIENT,
                         "Vanished from spool: " + path.string());
    }
    return std::move(*text);
}
}  // namespace

std::optional<int> order_date_year(const std::string &order_date) {
    // DD-MM-YYYY
    if (order_date.size() != 10 || order_date[2] != '-' ||
        order_date[5] != '-') {
        return std::nullopt;
    }
    int day = 0, month = 0, year = 0;
    for (std::size_t i : {0, 1, 3, 4, 6, 7, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(order_date[i]))) {
            return std::nullopt;
        }
    }
    day = std::stoi(order_date.substr(0, 2));
    month = std::stoi(order_date.substr(3, 2));
    year = std::stoi(order_date.substr(6, 4));
    if (!is_valid_date(year, month, day)) return std::nullopt;
    return year;
}

DirectoryCrawler::DirectoryCrawler(fs::path spool_dir)
    : spool_dir_(std::move(spool_dir)) {}

Listing DirectoryCrawler::list_records(const CourtTask &task) {
    fs::path complex_dir = spool_dir_ / task.court.state_code /
                           task.court.district_code / task.court.complex_code;
    std::error_code ec;
    if (!fs::is_directory(complex_dir, ec)) {
        throw CrawlError(CrawlError::INCOMPLETE,
                         "No spool for complex: " + complex_dir.string());
    }

    Listing listing;
    for (Date day = task.range.start; day <= task.range.end;
         day = day.add_days(1)) {
        fs::path day_dir = complex_dir / day.to_string();
        confirm_day(day_dir);

        std::vector<fs::path> files;
        for (const auto &entry : fs::directory_iterator(day_dir, ec)) {
            const auto &path = entry.path();
            if (entry.is_regular_file() && path.extension() == ".json" &&
                path.filename() != SEARCH_FILE) {
                files.push_back(path);
            }
        }
        if (ec) {
            throw CrawlError(CrawlError::TRANSIENT,
                             "Cannot list " + day_dir.string() + ": " +
                                 ec.message());
        }
        std::sort(files.begin(), files.end());
        for (const auto &path : files) {
            listing.records.push_back(read_record(path, day));
        }
    }
    DCARCHIVE_LOG_DEBUG("%s: %zu records in spool", task.to_string().c_str(),
                        listing.records.size());
    return listing;
}

void DirectoryCrawler::confirm_day(const fs::path &day_dir) const {
    fs::path search = day_dir / SEARCH_FILE;
    std::error_code ec;
    if (!fs::is_regular_file(search, ec)) {
        throw CrawlError(CrawlError::INCOMPLETE,
                         "Day not fetched yet: " + day_dir.string());
    }

    SearchResponse response = parse_search_response(read_or_throw(search));
    switch (response.status) {
        case SearchStatus::OK:
        case SearchStatus::NO_DATA:
            return;
        case SearchStatus::CHALLENGE_REJECTED:
            throw CrawlError(CrawlError::TRANSIENT,
                             "Challenge rejected for " + day_dir.string() +
                                 ": " + response.error_message);
        case SearchStatus::ERROR:
            throw CrawlError(CrawlError::PERMANENT,
                             "Search failed for " + day_dir.string() + ": " +
                                 response.error_message);
    }
}

RecordRef DirectoryCrawler::read_record(const fs::path &path,
                                        const Date &day) const {
    std::string text = read_or_throw(path);
    json::JsonParser parser;
    auto doc = json::parse_json(parser, text.data(), text.size());
    if (!doc || !doc->is_object()) {
        throw CrawlError(CrawlError::MALFORMED,
                         "Record is not a JSON object: " + path.string());
    }

    RecordRef record;
    record.record_id = path.stem().string();
    record.locator = path.string();
    record.year = day.year;

    for (auto field : doc->get_object().value()) {
        std::string key(field.key);
        if (field.value.is_string()) {
            record.fields.emplace_back(
                key, std::string(field.value.get_string().value()));
        }
    }

    auto order_date = json::find_string_field(*doc, "order_date");
    if (order_date) {
        if (auto year = order_date_year(*order_date)) {
            record.year = *year;
        }
    }
    return record;
}

std::optional<std::string> DirectoryCrawler::fetch_document(
    const CourtTask &task, const RecordRef &record) {
    fs::path pdf = fs::path(record.locator).replace_extension(".pdf");
    auto data = [&]() -> std::optional<std::string> {
        try {
            return utils::read_file(pdf);
        } catch (const std::runtime_error &e) {
            throw CrawlError(CrawlError::TRANSIENT, e.what());
        }
    }();
    if (!data) {
        DCARCHIVE_LOG_DEBUG("%s: no document for %s", task.to_string().c_str(),
                            record.record_id.c_str());
    }
    return data;
}

}  // namespace dcarchive
