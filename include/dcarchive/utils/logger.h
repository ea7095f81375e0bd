#ifndef DCARCHIVE_UTILS_LOGGER_H
#define DCARCHIVE_UTILS_LOGGER_H

#include <string>

namespace dcarchive::logger {
/**
 * Set the global spdlog log level
 * @param level_str String representation of log level (case insensitive)
 *                  Valid values: "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical", "off"
 * @return 0 on success, -1 if level_str is empty or not a known level
 */
int set_log_level(const std::string &level_str);

std::string get_log_level_string();

/**
 * Install a colored stderr logger as the spdlog default so log lines never
 * mix with report output on stdout.
 */
void init_stderr_logger(const std::string &name);
}  // namespace dcarchive::logger

#endif  // DCARCHIVE_UTILS_LOGGER_H
