#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/response_parser.h>
#include <dcarchive/utils/json.h>

#include <algorithm>
#include <cctype>

namespace dcarchive {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool mentions_challenge(const std::string &message) {
    std::string lower(message.size(), '\0');
    std::transform(message.begin(), message.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("captcha") != std::string::npos;
}

SearchResponse listing(std::string body) {
    SearchResponse response;
    response.status = is_blank(body) ? SearchStatus::NO_DATA : SearchStatus::OK;
    response.body = std::move(body);
    return response;
}

}  // namespace

const char *search_status_name(SearchStatus status) {
    switch (status) {
        case SearchStatus::OK:
            return "ok";
        case SearchStatus::NO_DATA:
            return "no-data";
        case SearchStatus::CHALLENGE_REJECTED:
            return "challenge-rejected";
        case SearchStatus::ERROR:
            return "error";
    }
    return "unknown";
}

SearchResponse parse_search_response(std::string_view raw) {
    json::JsonParser parser;
    auto doc = json::parse_json(parser, raw.data(), raw.size());
    if (!doc || !doc->is_object()) {
        return listing(std::string(raw));
    }

    std::string token = json::get_string_field(*doc, "app_token");

    auto errormsg = json::find_string_field(*doc, "errormsg");
    if (errormsg && !errormsg->empty()) {
        SearchResponse response;
        response.status = mentions_challenge(*errormsg)
                              ? SearchStatus::CHALLENGE_REJECTED
                              : SearchStatus::ERROR;
        response.error_message = *errormsg;
        response.app_token = std::move(token);
        return response;
    }

    std::int64_t status = json::get_int64_field(*doc, "status", -1);
    if (status != 1) {
        DCARCHIVE_LOG_DEBUG("Search returned non-success status %lld",
                            static_cast<long long>(status));
        SearchResponse response;
        response.status = SearchStatus::ERROR;
        response.error_message =
            "status " + std::to_string(static_cast<long long>(status));
        response.app_token = std::move(token);
        return response;
    }

    SearchResponse response;
    if (json::has_field(*doc, "court_dt_data")) {
        response = listing(json::get_string_field(*doc, "court_dt_data"));
    } else if (json::has_field(*doc, "html")) {
        response = listing(json::get_string_field(*doc, "html"));
    } else {
        response = listing(std::string(raw));
    }
    response.app_token = std::move(token);
    return response;
}

}  // namespace dcarchive
