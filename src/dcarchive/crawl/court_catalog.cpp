#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/court_catalog.h>
#include <dcarchive/utils/file.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace dcarchive {

namespace {

constexpr std::array<const char *, 8> COLUMNS = {
    "state_code",   "state_name",   "district_code", "district_name",
    "complex_code", "complex_name", "court_numbers", "flag"};

std::string csv_field(const std::string &value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace

std::string CourtComplex::complex_code_full() const {
    return complex_code + "@" + court_numbers + "@" + flag;
}

bool CourtFilter::matches(const CourtComplex &court) const {
    if (state_code && court.state_code != *state_code) return false;
    if (district_code && court.district_code != *district_code) return false;
    if (complex_code && court.complex_code != *complex_code) return false;
    return true;
}

std::vector<std::string> split_csv_line(const std::string &line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

CourtCatalog::CourtCatalog(std::vector<CourtComplex> courts)
    : courts_(std::move(courts)) {}

CourtCatalog CourtCatalog::load(const fs::path &csv_path) {
    std::ifstream in(csv_path);
    if (!in) {
        throw std::runtime_error("Cannot open courts file: " +
                                 csv_path.string());
    }
    CourtCatalog catalog = parse(in);
    DCARCHIVE_LOG_INFO("Loaded %zu court complexes from %s", catalog.size(),
                       csv_path.string().c_str());
    return catalog;
}

CourtCatalog CourtCatalog::parse(std::istream &in) {
    std::string line;
    if (!std::getline(in, line)) {
        return CourtCatalog();
    }
    // Strip a UTF-8 byte order mark
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    std::unordered_map<std::string, std::size_t> positions;
    auto header = split_csv_line(line);
    for (std::size_t i = 0; i < header.size(); ++i) {
        positions[header[i]] = i;
    }
    std::array<std::size_t, COLUMNS.size()> index{};
    for (std::size_t i = 0; i < COLUMNS.size(); ++i) {
        auto it = positions.find(COLUMNS[i]);
        if (it == positions.end()) {
            throw std::runtime_error(std::string("Courts CSV has no '") +
                                     COLUMNS[i] + "' column");
        }
        index[i] = it->second;
    }

    std::vector<CourtComplex> courts;
    std::size_t line_no = 1;
    std::string record;
    while (std::getline(in, line)) {
        ++line_no;
        record = line;
        // A quoted field may span lines
        while (std::count(record.begin(), record.end(), '"') % 2 != 0 &&
               std::getline(in, line)) {
            ++line_no;
            record += "\n" + line;
        }
        if (record.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto fields = split_csv_line(record);
        if (fields.size() < header.size()) {
            DCARCHIVE_LOG_WARN("Skipping short courts CSV row at line %zu",
                               line_no);
            continue;
        }
        CourtComplex court;
        court.state_code = fields[index[0]];
        court.state_name = fields[index[1]];
        court.district_code = fields[index[2]];
        court.district_name = fields[index[3]];
        court.complex_code = fields[index[4]];
        court.complex_name = fields[index[5]];
        court.court_numbers = fields[index[6]];
        court.flag = fields[index[7]];
        courts.push_back(std::move(court));
    }
    return CourtCatalog(std::move(courts));
}

void CourtCatalog::save(const fs::path &csv_path) const {
    std::ostringstream out;
    for (std::size_t i = 0; i < COLUMNS.size(); ++i) {
        out << (i ? "," : "") << COLUMNS[i];
    }
    out << "\r\n";
    for (const auto &c : courts_) {
        out << csv_field(c.state_code) << ',' << csv_field(c.state_name) << ','
            << csv_field(c.district_code) << ','
            << csv_field(c.district_name) << ','
            << csv_field(c.complex_code) << ',' << csv_field(c.complex_name)
            << ',' << csv_field(c.court_numbers) << ',' << csv_field(c.flag)
            << "\r\n";
    }
    utils::write_file_atomic(csv_path, out.str());
}

std::vector<CourtComplex> CourtCatalog::filter(
    const CourtFilter &filter) const {
    std::vector<CourtComplex> result;
    for (const auto &court : courts_) {
        if (filter.matches(court)) {
            result.push_back(court);
        }
    }
    return result;
}

std::optional<CourtComplex> CourtCatalog::find(
    const std::string &state_code, const std::string &district_code,
    const std::string &complex_code) const {
    for (const auto &court : courts_) {
        if (court.state_code == state_code &&
            court.district_code == district_code &&
            court.complex_code == complex_code) {
            return court;
        }
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> CourtCatalog::unique_states()
    const {
    std::unordered_set<std::string> seen;
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto &court : courts_) {
        if (seen.insert(court.state_code).second) {
            result.emplace_back(court.state_code, court.state_name);
        }
    }
    return result;
}

std::vector<std::pair<std::string, std::string>>
CourtCatalog::unique_districts(const std::string &state_code) const {
    std::unordered_set<std::string> seen;
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto &court : courts_) {
        if (court.state_code != state_code) continue;
        if (seen.insert(court.district_code).second) {
            result.emplace_back(court.district_code, court.district_name);
        }
    }
    return result;
}

}  // namespace dcarchive
