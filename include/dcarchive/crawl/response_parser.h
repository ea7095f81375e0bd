#ifndef DCARCHIVE_CRAWL_RESPONSE_PARSER_H
#define DCARCHIVE_CRAWL_RESPONSE_PARSER_H

#include <string>
#include <string_view>

namespace dcarchive {

enum class SearchStatus {
    // body holds the result listing
    OK,
    // The portal answered but there is nothing for this query
    NO_DATA,
    // errormsg mentions the challenge; solve a new one and search again
    CHALLENGE_REJECTED,
    ERROR
};

const char *search_status_name(SearchStatus status);

struct SearchResponse {
    SearchStatus status = SearchStatus::ERROR;
    std::string body;
    std::string error_message;
    // Session token rotated by the portal, empty if the response had none
    std::string app_token;
};

/**
 * Classify a raw search response. For JSON objects the first matching rule
 * wins: errormsg, status other than 1, court_dt_data, html, then the raw
 * text. Anything that is not a JSON object is taken as an HTML listing.
 * A listing that is empty after trimming is NO_DATA.
 */
SearchResponse parse_search_response(std::string_view raw);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_RESPONSE_PARSER_H
