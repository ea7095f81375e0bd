#include <dcarchive/common/logging.h>

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace dcarchive::logging {

std::string format(const char *fmt, ...) {
    char buffer[512];
    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (needed < 0) {
        va_end(args_copy);
        return fmt;
    }
    if (static_cast<std::size_t>(needed) < sizeof(buffer)) {
        va_end(args_copy);
        return std::string(buffer, static_cast<std::size_t>(needed));
    }

    std::vector<char> large(static_cast<std::size_t>(needed) + 1);
    std::vsnprintf(large.data(), large.size(), fmt, args_copy);
    va_end(args_copy);
    return std::string(large.data(), static_cast<std::size_t>(needed));
}

}  // namespace dcarchive::logging
