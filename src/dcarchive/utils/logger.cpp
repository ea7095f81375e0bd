#include <dcarchive/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace dcarchive::logger {

static std::optional<spdlog::level::level_enum> parse_level(
    const std::string &level_str) {
    std::string lower = level_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "err" || lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

int set_log_level(const std::string &level_str) {
    auto level = parse_level(level_str);
    if (!level) {
        return -1;
    }
    spdlog::set_level(*level);
    return 0;
}

std::string get_log_level_string() {
    auto view = spdlog::level::to_string_view(spdlog::get_level());
    return std::string(view.data(), view.size());
}

void init_stderr_logger(const std::string &name) {
    auto existing = spdlog::get(name);
    auto logger = existing ? existing : spdlog::stderr_color_mt(name);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e - %^%l%$ - %v");
    spdlog::set_default_logger(logger);
}

}  // namespace dcarchive::logger
