#include <dcarchive/common/error.h>

namespace dcarchive {

std::string ArchiveError::format_message(Type type, const std::string &message) {
    std::string prefix;
    switch (type) {
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case PACKER_ERROR:
            prefix = "[PACKER]";
            break;
        case INDEX_ERROR:
            prefix = "[INDEX]";
            break;
        case STORAGE_ERROR:
            prefix = "[STORAGE]";
            break;
        case FLUSH_ERROR:
            prefix = "[FLUSH]";
            break;
        case CLOSED_ERROR:
            prefix = "[CLOSED]";
            break;
    }
    return prefix + " " + message;
}

std::string CrawlError::format_message(Kind kind, const std::string &message) {
    std::string prefix;
    switch (kind) {
        case TRANSIENT:
            prefix = "[TRANSIENT]";
            break;
        case PERMANENT:
            prefix = "[PERMANENT]";
            break;
        case MALFORMED:
            prefix = "[MALFORMED]";
            break;
        case INCOMPLETE:
            prefix = "[INCOMPLETE]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace dcarchive
