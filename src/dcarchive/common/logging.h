#ifndef DCARCHIVE_COMMON_LOGGING_H
#define DCARCHIVE_COMMON_LOGGING_H

#include <spdlog/spdlog.h>

#include <string>

namespace dcarchive::logging {
// printf-style formatting used by the DCARCHIVE_LOG_* macros
std::string format(const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;
}  // namespace dcarchive::logging

#define DCARCHIVE_INTERNAL_LOG(file, line, function, logger_level, ...)  \
    do {                                                                 \
        if (spdlog::should_log(logger_level)) {                          \
            spdlog::log(spdlog::source_loc{file, line, function},        \
                        logger_level, "{}",                              \
                        ::dcarchive::logging::format(__VA_ARGS__));      \
        }                                                                \
    } while (0)

#define DCARCHIVE_LOG_TRACE(...)                                       \
    DCARCHIVE_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,           \
                           spdlog::level::trace, __VA_ARGS__)
#define DCARCHIVE_LOG_DEBUG(...)                                       \
    DCARCHIVE_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,           \
                           spdlog::level::debug, __VA_ARGS__)
#define DCARCHIVE_LOG_INFO(...)                                        \
    DCARCHIVE_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,           \
                           spdlog::level::info, __VA_ARGS__)
#define DCARCHIVE_LOG_WARN(...)                                        \
    DCARCHIVE_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,           \
                           spdlog::level::warn, __VA_ARGS__)
#define DCARCHIVE_LOG_ERROR(...)                                       \
    DCARCHIVE_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,           \
                           spdlog::level::err, __VA_ARGS__)

#endif  // DCARCHIVE_COMMON_LOGGING_H
