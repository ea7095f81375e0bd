#ifndef DCARCHIVE_CRAWL_COURT_CATALOG_H
#define DCARCHIVE_CRAWL_COURT_CATALOG_H

#include <dcarchive/utils/filesystem.h>

#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dcarchive {

struct CourtComplex {
    std::string state_code;
    std::string state_name;
    std::string district_code;
    std::string district_name;
    std::string complex_code;
    std::string complex_name;
    // Comma separated court numbers, e.g. "10,11,12"
    std::string court_numbers;
    std::string flag;

    // {complex_code}@{court_numbers}@{flag}
    std::string complex_code_full() const;
};

struct CourtFilter {
    std::optional<std::string> state_code;
    std::optional<std::string> district_code;
    std::optional<std::string> complex_code;

    bool matches(const CourtComplex &court) const;
};

/**
 * Court hierarchy loaded from a CSV with the header
 * state_code,state_name,district_code,district_name,complex_code,
 * complex_name,court_numbers,flag (columns may appear in any order).
 */
class CourtCatalog {
   public:
    CourtCatalog() = default;
    explicit CourtCatalog(std::vector<CourtComplex> courts);

    // @throws std::runtime_error on I/O failure or a missing column
    static CourtCatalog load(const fs::path &csv_path);
    static CourtCatalog parse(std::istream &in);

    void save(const fs::path &csv_path) const;

    const std::vector<CourtComplex> &courts() const { return courts_; }
    std::size_t size() const { return courts_.size(); }
    bool empty() const { return courts_.empty(); }

    std::vector<CourtComplex> filter(const CourtFilter &filter) const;
    std::optional<CourtComplex> find(const std::string &state_code,
                                     const std::string &district_code,
                                     const std::string &complex_code) const;

    // (code, name) pairs in first-seen order
    std::vector<std::pair<std::string, std::string>> unique_states() const;
    std::vector<std::pair<std::string, std::string>> unique_districts(
        const std::string &state_code) const;

   private:
    std::vector<CourtComplex> courts_;
};

// Split one CSV record, honouring double-quoted fields and "" escapes
std::vector<std::string> split_csv_line(const std::string &line);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_COURT_CATALOG_H
