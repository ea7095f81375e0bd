#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/crawl/court_catalog.h>
#include <dcarchive/crawl/task.h>
#include <doctest/doctest.h>

#include <sstream>
#include <stdexcept>

#include "testing_utilities.h"

using namespace dcarchive;
using namespace dcarchive_test;

namespace {

const char *COURTS_CSV =
    "\xEF\xBB\xBF"
    "state_code,state_name,district_code,district_name,complex_code,"
    "complex_name,court_numbers,flag\r\n"
    "29,Karnataka,9,Bengaluru,1290105,\"City Civil Court, Bengaluru\","
    "\"10,11,12\",N\r\n"
    "29,Karnataka,9,Bengaluru,1290106,Mayo Hall,7,N\r\n"
    "\r\n"
    "29,Karnataka,3,Mysuru,1290301,District Court,\"1,2\",Y\r\n"
    "3,Punjab,1,Amritsar,1030101,\"Judicial \"\"Complex\"\"\",5,N\r\n";

CourtCatalog sample_catalog() {
    std::istringstream in(COURTS_CSV);
    return CourtCatalog::parse(in);
}

}  // namespace

TEST_CASE("split_csv_line - quoting") {
    CHECK(split_csv_line("a,b,c") == std::vector<std::string>{"a", "b", "c"});
    CHECK(split_csv_line("\"a,b\",c") ==
          std::vector<std::string>{"a,b", "c"});
    CHECK(split_csv_line("\"say \"\"hi\"\"\",") ==
          std::vector<std::string>{"say \"hi\"", ""});
    CHECK(split_csv_line("x\r") == std::vector<std::string>{"x"});
}

TEST_CASE("CourtCatalog - parse") {
    auto catalog = sample_catalog();
    REQUIRE(catalog.size() == 4);

    const auto &first = catalog.courts()[0];
    CHECK(first.state_code == "29");
    CHECK(first.complex_name == "City Civil Court, Bengaluru");
    CHECK(first.complex_code_full() == "1290105@10,11,12@N");
    CHECK(catalog.courts()[3].complex_name == "Judicial \"Complex\"");

    auto found = catalog.find("29", "3", "1290301");
    REQUIRE(found.has_value());
    CHECK(found->flag == "Y");
    CHECK_FALSE(catalog.find("29", "3", "9999").has_value());
}

TEST_CASE("CourtCatalog - columns in any order") {
    std::istringstream in(
        "flag,complex_code,court_numbers,complex_name,district_name,"
        "district_code,state_name,state_code\n"
        "N,1290105,10,Civil,Bengaluru,9,Karnataka,29\n");
    auto catalog = CourtCatalog::parse(in);
    REQUIRE(catalog.size() == 1);
    CHECK(catalog.courts()[0].state_code == "29");
    CHECK(catalog.courts()[0].complex_code == "1290105");

    std::istringstream missing("state_code,state_name\n29,Karnataka\n");
    CHECK_THROWS_AS(CourtCatalog::parse(missing), std::runtime_error);
}

TEST_CASE("CourtCatalog - filters and unique lists") {
    auto catalog = sample_catalog();

    CourtFilter by_state;
    by_state.state_code = "29";
    CHECK(catalog.filter(by_state).size() == 3);

    CourtFilter by_district = by_state;
    by_district.district_code = "9";
    CHECK(catalog.filter(by_district).size() == 2);

    CourtFilter by_complex = by_district;
    by_complex.complex_code = "1290106";
    auto one = catalog.filter(by_complex);
    REQUIRE(one.size() == 1);
    CHECK(one[0].complex_name == "Mayo Hall");

    CHECK(catalog.filter(CourtFilter{}).size() == 4);

    auto states = catalog.unique_states();
    REQUIRE(states.size() == 2);
    CHECK(states[0] == std::make_pair(std::string("29"),
                                      std::string("Karnataka")));
    CHECK(states[1].first == "3");

    auto districts = catalog.unique_districts("29");
    REQUIRE(districts.size() == 2);
    CHECK(districts[0].second == "Bengaluru");
    CHECK(districts[1].second == "Mysuru");
}

TEST_CASE("CourtCatalog - save and load") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    auto catalog = sample_catalog();
    catalog.save(env.path("courts.csv"));

    auto loaded = CourtCatalog::load(env.path("courts.csv"));
    REQUIRE(loaded.size() == catalog.size());
    for (std::size_t i = 0; i < loaded.size(); ++i) {
        CHECK(loaded.courts()[i].complex_name ==
              catalog.courts()[i].complex_name);
        CHECK(loaded.courts()[i].court_numbers ==
              catalog.courts()[i].court_numbers);
    }

    CHECK_THROWS_AS(CourtCatalog::load(env.path("missing.csv")),
                    std::runtime_error);
}

TEST_CASE("split_date_range - steps and today cap") {
    Date today(2025, 1, 20);

    auto ranges = split_date_range(Date(2025, 1, 1), Date(2025, 1, 25), 10,
                                   today);
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0] == DateRange{Date(2025, 1, 1), Date(2025, 1, 10)});
    CHECK(ranges[1] == DateRange{Date(2025, 1, 11), Date(2025, 1, 20)});

    auto daily = split_date_range(Date(2024, 12, 30), Date(2025, 1, 1), 1,
                                  today);
    REQUIRE(daily.size() == 3);
    CHECK(daily[2].start == Date(2025, 1, 1));
    CHECK(daily[2].end == Date(2025, 1, 1));

    CHECK(split_date_range(Date(2025, 2, 1), Date(2025, 3, 1), 5, today)
              .empty());
    CHECK_THROWS_AS(split_date_range(Date(2025, 1, 1), Date(2025, 1, 2), 0,
                                     today),
                    std::invalid_argument);
}

TEST_CASE("generate_tasks - ranges in the outer loop") {
    auto catalog = sample_catalog();
    CourtFilter filter;
    filter.district_code = "9";
    auto courts = catalog.filter(filter);

    std::vector<DateRange> ranges{
        DateRange{Date(2025, 1, 1), Date(2025, 1, 10)},
        DateRange{Date(2025, 1, 11), Date(2025, 1, 20)}};
    auto tasks = generate_tasks(courts, ranges);
    REQUIRE(tasks.size() == 4);
    CHECK(tasks[0].key() == "29_9_1290105_2025-01-01_2025-01-10");
    CHECK(tasks[1].key() == "29_9_1290106_2025-01-01_2025-01-10");
    CHECK(tasks[2].key() == "29_9_1290105_2025-01-11_2025-01-20");
    CHECK(tasks[0].to_string().find("Bengaluru") != std::string::npos);
}
