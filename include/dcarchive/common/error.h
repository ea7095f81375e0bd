#ifndef DCARCHIVE_COMMON_ERROR_H
#define DCARCHIVE_COMMON_ERROR_H

#include <stdexcept>
#include <string>

namespace dcarchive {

class ArchiveError : public std::runtime_error {
   public:
    enum Type {
        INVALID_ARGUMENT,
        PACKER_ERROR,
        INDEX_ERROR,
        STORAGE_ERROR,
        FLUSH_ERROR,
        CLOSED_ERROR
    };

    ArchiveError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    Type type_;
    static std::string format_message(Type type, const std::string &message);
};

class LedgerError : public std::runtime_error {
   public:
    explicit LedgerError(const std::string &message)
        : std::runtime_error("[LEDGER] " + message) {}
};

class CursorError : public std::runtime_error {
   public:
    explicit CursorError(const std::string &message)
        : std::runtime_error("[CURSOR] " + message) {}
};

class CrawlError : public std::runtime_error {
   public:
    enum Kind {
        // Network timeouts and rate limiting; worth retrying with backoff.
        TRANSIENT,
        // The origin refused the request; the task stays incomplete.
        PERMANENT,
        // Content could not be parsed and is not a confirmed "no data".
        MALFORMED,
        // The source has not covered the request yet. Not retried within
        // the run; the task stays unmarked so a later run picks it up.
        INCOMPLETE
    };

    CrawlError(Kind kind, const std::string &message)
        : std::runtime_error(format_message(kind, message)), kind_(kind) {}

    Kind get_kind() const { return kind_; }
    bool is_transient() const { return kind_ == TRANSIENT; }

   private:
    Kind kind_;
    static std::string format_message(Kind kind, const std::string &message);
};

}  // namespace dcarchive

#endif  // DCARCHIVE_COMMON_ERROR_H
