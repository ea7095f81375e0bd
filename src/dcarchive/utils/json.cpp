#include <dcarchive/utils/json.h>

#include <cstdlib>

namespace dcarchive::json {

std::optional<JsonDocument> parse_json(JsonParser &parser, const char *data,
                                       std::size_t size) {
    auto doc = parser.parse(data, size);
    if (doc.error()) {
        return std::nullopt;
    }
    return doc.value();
}

bool has_field(const JsonDocument &doc, const std::string &key) {
    if (!doc.is_object()) return false;
    auto field = doc.get_object().at_key(key);
    return !field.error();
}

std::string get_string_field(const JsonDocument &doc, const std::string &key) {
    auto value = find_string_field(doc, key);
    return value ? *value : "";
}

std::optional<std::string> find_string_field(const JsonDocument &doc,
                                             const std::string &key) {
    if (!doc.is_object()) return std::nullopt;

    auto obj_result = doc.get_object();
    if (obj_result.error()) return std::nullopt;

    auto field = obj_result.value().at_key(key);
    if (field.error() || !field.value().is_string()) return std::nullopt;

    auto str_result = field.value().get_string();
    if (str_result.error()) return std::nullopt;
    return std::string(str_result.value());
}

std::uint64_t get_uint64_field(const JsonDocument &doc,
                               const std::string &key) {
    if (!doc.is_object()) return 0;

    auto obj_result = doc.get_object();
    if (obj_result.error()) return 0;

    auto field = obj_result.value().at_key(key);
    if (field.error()) return 0;

    auto value = field.value();
    if (value.is_uint64()) {
        return value.get_uint64().value();
    } else if (value.is_int64()) {
        auto v = value.get_int64().value();
        return v < 0 ? 0 : static_cast<std::uint64_t>(v);
    } else if (value.is_double()) {
        return static_cast<std::uint64_t>(value.get_double().value());
    } else if (value.is_string()) {
        std::string s(value.get_string().value());
        char *end = nullptr;
        auto parsed = std::strtoull(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return parsed;
    }
    return 0;
}

std::int64_t get_int64_field(const JsonDocument &doc, const std::string &key,
                             std::int64_t fallback) {
    if (!doc.is_object()) return fallback;

    auto obj_result = doc.get_object();
    if (obj_result.error()) return fallback;

    auto field = obj_result.value().at_key(key);
    if (field.error()) return fallback;

    auto value = field.value();
    if (value.is_int64()) {
        return value.get_int64().value();
    } else if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.get_uint64().value());
    } else if (value.is_double()) {
        return static_cast<std::int64_t>(value.get_double().value());
    } else if (value.is_string()) {
        std::string s(value.get_string().value());
        char *end = nullptr;
        auto parsed = std::strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return parsed;
    }
    return fallback;
}

std::vector<std::string> get_string_array_field(const JsonDocument &doc,
                                                const std::string &key) {
    std::vector<std::string> out;
    if (!doc.is_object()) return out;

    auto field = doc.get_object().at_key(key);
    if (field.error() || !field.value().is_array()) return out;

    auto arr = field.value().get_array();
    if (arr.error()) return out;
    for (auto item : arr.value()) {
        if (item.is_string()) {
            out.emplace_back(item.get_string().value());
        }
    }
    return out;
}

bool is_valid_utf8(std::string_view s) {
    return simdjson::validate_utf8(s.data(), s.size());
}

}  // namespace dcarchive::json
