#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/common/error.h>
#include <dcarchive/crawl/compressor.h>
#include <dcarchive/crawl/crawler.h>
#include <doctest/doctest.h>

#include <random>
#include <stdexcept>

#include "testing_utilities.h"

using namespace dcarchive;
using namespace dcarchive_test;

namespace {

CourtTask make_task(const Date &start, const Date &end) {
    CourtComplex court;
    court.state_code = "29";
    court.state_name = "Karnataka";
    court.district_code = "9";
    court.district_name = "Bengaluru";
    court.complex_code = "1290105";
    court.complex_name = "City Civil Court";
    court.court_numbers = "10";
    court.flag = "N";
    return CourtTask{court, DateRange{start, end}};
}

const std::string DAY_DIR = "spool/29/9/1290105/";

const std::string NO_ORDERS = R"({"status": 1, "court_dt_data": ""})";

// Mark every day of [start, end] as fetched with no orders
void confirm_days(const TestEnvironment &env, const Date &start,
                  const Date &end) {
    for (Date day = start; day <= end; day = day.add_days(1)) {
        env.write_file(DAY_DIR + day.to_string() + "/search.json", NO_ORDERS);
    }
}

const std::string *find_field(const RecordRef &record, const std::string &key) {
    for (const auto &field : record.fields) {
        if (field.first == key) return &field.second;
    }
    return nullptr;
}

}  // namespace

TEST_CASE("order_date_year") {
    CHECK(order_date_year("15-03-2019") == 2019);
    CHECK(order_date_year("29-02-2024") == 2024);
    CHECK_FALSE(order_date_year("29-02-2023").has_value());
    CHECK_FALSE(order_date_year("2019-03-15").has_value());
    CHECK_FALSE(order_date_year("1-3-2019").has_value());
    CHECK_FALSE(order_date_year("").has_value());
}

TEST_CASE("DirectoryCrawler - records across the days of a task") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 10));
    env.write_file(DAY_DIR + "2025-01-02/search.json",
                   R"({"status": 1, "court_dt_data": "<tr/>"})");
    env.write_file(DAY_DIR + "2025-01-02/KAHC020001232019.json",
                   R"({"case_no": "OS/123/2019", "order_date": "15-03-2019", "judge": "A", "pages": 3})");
    env.write_file(DAY_DIR + "2025-01-02/KAHC020001232019.pdf", "%PDF-1.4");
    env.write_file(DAY_DIR + "2025-01-02/AAAA000000012025.json",
                   R"({"case_no": "CC/1/2025"})");
    env.write_file(DAY_DIR + "2025-01-05/BBBB000000022025.json",
                   R"({"order_date": "not a date"})");
    // Outside the task range
    env.write_file(DAY_DIR + "2025-01-20/CCCC000000032025.json", "{}");

    DirectoryCrawler crawler(env.path("spool"));
    auto task = make_task(Date(2025, 1, 1), Date(2025, 1, 10));
    auto listing = crawler.list_records(task);

    REQUIRE(listing.records.size() == 3);
    CHECK(listing.records[0].record_id == "AAAA000000012025");
    CHECK(listing.records[0].year == 2025);

    const auto &with_order = listing.records[1];
    CHECK(with_order.record_id == "KAHC020001232019");
    CHECK(with_order.year == 2019);
    REQUIRE(find_field(with_order, "case_no") != nullptr);
    CHECK(*find_field(with_order, "case_no") == "OS/123/2019");
    // Only string fields are carried
    CHECK(find_field(with_order, "pages") == nullptr);

    CHECK(listing.records[2].year == 2025);

    auto document = crawler.fetch_document(task, with_order);
    REQUIRE(document.has_value());
    CHECK(*document == "%PDF-1.4");
    CHECK_FALSE(crawler.fetch_document(task, listing.records[0]).has_value());
}

TEST_CASE("DirectoryCrawler - empty and failing searches") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    DirectoryCrawler crawler(env.path("spool"));
    auto task = make_task(Date(2025, 1, 1), Date(2025, 1, 3));

    auto expect_kind = [&](CrawlError::Kind kind) {
        try {
            crawler.list_records(task);
            FAIL("expected CrawlError");
        } catch (const CrawlError &e) {
            CHECK(e.get_kind() == kind);
        }
    };

    SUBCASE("Unknown complex is not fetched yet") {
        expect_kind(CrawlError::INCOMPLETE);
    }

    SUBCASE("Missing day directories are not fetched yet") {
        env.write_file(DAY_DIR + "2024-12-01/X.json", "{}");
        expect_kind(CrawlError::INCOMPLETE);
    }

    SUBCASE("A day without search.json is not fetched yet") {
        confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 3));
        fs::remove(env.path(DAY_DIR + "2025-01-02/search.json"));
        env.write_file(DAY_DIR + "2025-01-02/X.json", "{}");
        expect_kind(CrawlError::INCOMPLETE);
    }

    SUBCASE("Confirmed empty days are no data") {
        confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 3));
        CHECK(crawler.list_records(task).empty());
    }

    SUBCASE("Rejected challenge is transient") {
        confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 3));
        env.write_file(DAY_DIR + "2025-01-02/search.json",
                       R"({"errormsg": "Invalid Captcha"})");
        expect_kind(CrawlError::TRANSIENT);
    }

    SUBCASE("Portal error is permanent") {
        confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 3));
        env.write_file(DAY_DIR + "2025-01-02/search.json",
                       R"({"status": 0})");
        expect_kind(CrawlError::PERMANENT);
    }

    SUBCASE("Unparseable record is malformed") {
        confirm_days(env, Date(2025, 1, 1), Date(2025, 1, 3));
        env.write_file(DAY_DIR + "2025-01-02/X.json", "[1, 2]");
        expect_kind(CrawlError::MALFORMED);
    }
}

TEST_CASE("GzipCompressor - compresses and inflates") {
    GzipCompressor compressor;
    CHECK(std::string(compressor.extension()) == ".gz");

    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "IN THE COURT OF THE CITY CIVIL JUDGE, BENGALURU. ";
    }
    auto compressed = compressor.compress(text);
    REQUIRE(compressed.has_value());
    CHECK(compressed->size() < text.size());
    // gzip magic
    CHECK(static_cast<unsigned char>((*compressed)[0]) == 0x1f);
    CHECK(static_cast<unsigned char>((*compressed)[1]) == 0x8b);
    CHECK(gunzip(*compressed) == text);
}

TEST_CASE("GzipCompressor - incompressible input is kept") {
    std::mt19937 rng(7);
    std::string noise(4096, '\0');
    for (auto &c : noise) c = static_cast<char>(rng() & 0xff);

    GzipCompressor compressor(9);
    CHECK_FALSE(compressor.compress(noise).has_value());
    CHECK_FALSE(compressor.compress("").has_value());
}

TEST_CASE("gunzip - corrupt streams") {
    GzipCompressor compressor;
    auto compressed = compressor.compress(std::string(2000, 'a'));
    REQUIRE(compressed.has_value());

    CHECK_THROWS_AS(gunzip(compressed->substr(0, compressed->size() / 2)),
                    std::runtime_error);
    CHECK_THROWS_AS(gunzip("definitely not gzip"), std::runtime_error);
}
