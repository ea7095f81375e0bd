#ifndef DCARCHIVE_UTILS_JSON_H
#define DCARCHIVE_UTILS_JSON_H

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcarchive::json {
using JsonParser = simdjson::dom::parser;
using JsonDocument = simdjson::dom::element;

/**
 * Parse a JSON document. The returned element borrows the parser's buffers
 * and stays valid until the parser parses again or is destroyed.
 * @return std::nullopt if the input is not valid JSON
 */
std::optional<JsonDocument> parse_json(JsonParser &parser, const char *data,
                                       std::size_t size);

bool has_field(const JsonDocument &doc, const std::string &key);
std::string get_string_field(const JsonDocument &doc, const std::string &key);
std::optional<std::string> find_string_field(const JsonDocument &doc,
                                             const std::string &key);
std::uint64_t get_uint64_field(const JsonDocument &doc, const std::string &key);
std::int64_t get_int64_field(const JsonDocument &doc, const std::string &key,
                             std::int64_t fallback);
std::vector<std::string> get_string_array_field(const JsonDocument &doc,
                                                const std::string &key);

// True if s is well-formed UTF-8, the only encoding written documents accept
bool is_valid_utf8(std::string_view s);
}  // namespace dcarchive::json

#endif  // DCARCHIVE_UTILS_JSON_H
