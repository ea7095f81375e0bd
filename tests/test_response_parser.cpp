#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/crawl/response_parser.h>
#include <doctest/doctest.h>

using namespace dcarchive;

TEST_CASE("parse_search_response - errormsg wins") {
    auto rejected = parse_search_response(
        R"({"errormsg": "Invalid Captcha", "status": 1, "court_dt_data": "<tr/>", "app_token": "t1"})");
    CHECK(rejected.status == SearchStatus::CHALLENGE_REJECTED);
    CHECK(rejected.error_message == "Invalid Captcha");
    CHECK(rejected.app_token == "t1");

    auto other = parse_search_response(
        R"({"errormsg": "Session expired", "status": 1})");
    CHECK(other.status == SearchStatus::ERROR);
    CHECK(other.error_message == "Session expired");
}

TEST_CASE("parse_search_response - status must be 1") {
    auto failed = parse_search_response(R"({"status": 0, "html": "<p>x</p>"})");
    CHECK(failed.status == SearchStatus::ERROR);
    CHECK(failed.error_message == "status 0");

    auto missing = parse_search_response(R"({"court_dt_data": "<tr/>"})");
    CHECK(missing.status == SearchStatus::ERROR);

    // An empty errormsg does not count
    auto ok = parse_search_response(
        R"({"errormsg": "", "status": 1, "html": "<p>x</p>"})");
    CHECK(ok.status == SearchStatus::OK);
}

TEST_CASE("parse_search_response - listing sources in order") {
    auto dt = parse_search_response(
        R"({"status": 1, "court_dt_data": "<tr>A</tr>", "html": "<p>B</p>"})");
    CHECK(dt.status == SearchStatus::OK);
    CHECK(dt.body == "<tr>A</tr>");

    auto html = parse_search_response(R"({"status": 1, "html": "<p>B</p>"})");
    CHECK(html.body == "<p>B</p>");

    std::string raw = R"({"status": 1, "rows": 3})";
    auto fallback = parse_search_response(raw);
    CHECK(fallback.status == SearchStatus::OK);
    CHECK(fallback.body == raw);
}

TEST_CASE("parse_search_response - empty listings are no data") {
    auto blank = parse_search_response(R"({"status": 1, "court_dt_data": "  \n"})");
    CHECK(blank.status == SearchStatus::NO_DATA);

    CHECK(parse_search_response("").status == SearchStatus::NO_DATA);
    CHECK(parse_search_response("   ").status == SearchStatus::NO_DATA);
}

TEST_CASE("parse_search_response - non-JSON is an HTML listing") {
    auto html = parse_search_response("<table><tr><td>1</td></tr></table>");
    CHECK(html.status == SearchStatus::OK);
    CHECK(html.body == "<table><tr><td>1</td></tr></table>");

    // Valid JSON but not an object
    auto array = parse_search_response("[1, 2]");
    CHECK(array.status == SearchStatus::OK);
    CHECK(array.body == "[1, 2]");
}

TEST_CASE("search_status_name") {
    CHECK(std::string(search_status_name(SearchStatus::CHALLENGE_REJECTED)) ==
          "challenge-rejected");
    CHECK(std::string(search_status_name(SearchStatus::NO_DATA)) == "no-data");
}
