#ifndef DCARCHIVE_COMMON_DATE_H
#define DCARCHIVE_COMMON_DATE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dcarchive {

/**
 * Proleptic Gregorian calendar date. Arithmetic goes through a day count
 * relative to 1970-01-01.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Parses "YYYY-MM-DD"; rejects anything else, including invalid days.
    static std::optional<Date> parse(std::string_view text);
    static Date from_days(std::int64_t days);
    // Current calendar date at the given UTC offset.
    static Date today(int offset_minutes);

    std::int64_t to_days() const;
    Date add_days(std::int64_t days) const;
    std::string to_string() const;

    bool operator==(const Date &other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date &other) const { return !(*this == other); }
    bool operator<(const Date &other) const {
        return to_days() < other.to_days();
    }
    bool operator<=(const Date &other) const { return !(other < *this); }
    bool operator>(const Date &other) const { return other < *this; }
    bool operator>=(const Date &other) const { return !(*this < other); }
};

bool is_valid_date(int year, int month, int day);

// Closed interval [start, end]
struct DateRange {
    Date start;
    Date end;

    bool operator==(const DateRange &other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const DateRange &other) const { return !(*this == other); }
    std::string to_string() const;
};

/**
 * An instant with the UTC offset it was recorded in. Ordering compares the
 * instant only; the offset is kept so that formatting round-trips.
 */
class Timestamp {
   public:
    Timestamp() = default;
    Timestamp(std::int64_t epoch_micros, int offset_minutes)
        : epoch_micros_(epoch_micros), offset_minutes_(offset_minutes) {}

    /**
     * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.ffffff]]" (a space may
     * replace the T) with an optional "Z", "+HH:MM" or "+HHMM" suffix.
     * Times without an offset are taken as UTC.
     */
    static std::optional<Timestamp> parse(std::string_view text);
    static Timestamp now(int offset_minutes);
    static Timestamp from_date(const Date &date, int offset_minutes);

    std::int64_t epoch_micros() const { return epoch_micros_; }
    int offset_minutes() const { return offset_minutes_; }

    // Calendar date in the timestamp's own offset
    Date local_date() const;
    // "2024-06-01T10:00:00.123456+05:30"; the fraction is omitted when zero
    std::string to_iso_string() const;
    // "20240601T100000" in the timestamp's own offset, used in Part names
    std::string to_compact_string() const;

    bool operator==(const Timestamp &other) const {
        return epoch_micros_ == other.epoch_micros_;
    }
    bool operator!=(const Timestamp &other) const { return !(*this == other); }
    bool operator<(const Timestamp &other) const {
        return epoch_micros_ < other.epoch_micros_;
    }
    bool operator<=(const Timestamp &other) const {
        return epoch_micros_ <= other.epoch_micros_;
    }
    bool operator>(const Timestamp &other) const {
        return epoch_micros_ > other.epoch_micros_;
    }

   private:
    std::int64_t epoch_micros_ = 0;
    int offset_minutes_ = 0;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_COMMON_DATE_H
