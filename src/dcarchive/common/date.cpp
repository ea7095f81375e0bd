#include <dcarchive/common/date.h>

#include <chrono>
#include <cstdio>

namespace dcarchive {

namespace {

constexpr std::int64_t MICROS_PER_SECOND = 1000000;
constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr std::int64_t MICROS_PER_DAY = SECONDS_PER_DAY * MICROS_PER_SECOND;

// Howard Hinnant's days_from_civil / civil_from_days
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Date civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2)), static_cast<int>(m),
                static_cast<int>(d));
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

class Cursor {
   public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }
    void advance() { ++pos_; }

    bool expect(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    bool digits(std::size_t count, int &out) {
        if (pos_ + count > text_.size()) return false;
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (c < '0' || c > '9') return false;
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

   private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

bool parse_date_part(Cursor &cur, Date &date) {
    int y = 0, m = 0, d = 0;
    if (!cur.digits(4, y) || !cur.expect('-') || !cur.digits(2, m) ||
        !cur.expect('-') || !cur.digits(2, d)) {
        return false;
    }
    if (!is_valid_date(y, m, d)) return false;
    date = Date(y, m, d);
    return true;
}

std::string format_offset(int offset_minutes) {
    char sign = offset_minutes < 0 ? '-' : '+';
    int abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", sign,
                  abs_minutes / 60, abs_minutes % 60);
    return buffer;
}

}  // namespace

bool is_valid_date(int year, int month, int day) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30,
                                        31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    int limit = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) limit = 29;
    return day <= limit;
}

std::optional<Date> Date::parse(std::string_view text) {
    Cursor cur(text);
    Date date;
    if (!parse_date_part(cur, date) || !cur.at_end()) {
        return std::nullopt;
    }
    return date;
}

Date Date::from_days(std::int64_t days) { return civil_from_days(days); }

Date Date::today(int offset_minutes) {
    return Timestamp::now(offset_minutes).local_date();
}

std::int64_t Date::to_days() const {
    return days_from_civil(year, static_cast<unsigned>(month),
                           static_cast<unsigned>(day));
}

Date Date::add_days(std::int64_t days) const {
    return from_days(to_days() + days);
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::string DateRange::to_string() const {
    return start.to_string() + " to " + end.to_string();
}

std::optional<Timestamp> Timestamp::parse(std::string_view text) {
    Cursor cur(text);
    Date date;
    if (!parse_date_part(cur, date)) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    std::int64_t micros = 0;
    int offset = 0;

    if (!cur.at_end() && (cur.peek() == 'T' || cur.peek() == ' ')) {
        cur.advance();
        if (!cur.digits(2, hour) || !cur.expect(':') ||
            !cur.digits(2, minute)) {
            return std::nullopt;
        }
        if (cur.peek() == ':') {
            cur.advance();
            if (!cur.digits(2, second)) return std::nullopt;
            if (cur.peek() == '.') {
                cur.advance();
                int scale = 100000;
                int ndigits = 0;
                while (cur.peek() >= '0' && cur.peek() <= '9') {
                    if (ndigits < 6) {
                        micros += (cur.peek() - '0') * scale;
                        scale /= 10;
                    }
                    ++ndigits;
                    cur.advance();
                }
                if (ndigits == 0) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

        if (cur.peek() == 'Z' || cur.peek() == 'z') {
            cur.advance();
        } else if (cur.peek() == '+' || cur.peek() == '-') {
            int sign = cur.peek() == '-' ? -1 : 1;
            cur.advance();
            int oh = 0, om = 0;
            if (!cur.digits(2, oh)) return std::nullopt;
            cur.expect(':');
            if (!cur.digits(2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset = sign * (oh * 60 + om);
        }
    }
    if (!cur.at_end()) return std::nullopt;

    std::int64_t local_seconds = date.to_days() * SECONDS_PER_DAY +
                                 hour * 3600 + minute * 60 + second;
    std::int64_t utc_seconds = local_seconds - offset * 60;
    return Timestamp(utc_seconds * MICROS_PER_SECOND + micros, offset);
}

Timestamp Timestamp::now(int offset_minutes) {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch)
            .count();
    return Timestamp(static_cast<std::int64_t>(micros), offset_minutes);
}

Timestamp Timestamp::from_date(const Date &date, int offset_minutes) {
    std::int64_t local = date.to_days() * MICROS_PER_DAY;
    return Timestamp(local - static_cast<std::int64_t>(offset_minutes) * 60 *
                                 MICROS_PER_SECOND,
                     offset_minutes);
}

Date Timestamp::local_date() const {
    std::int64_t local = epoch_micros_ + static_cast<std::int64_t>(
                                             offset_minutes_) *
                                             60 * MICROS_PER_SECOND;
    return Date::from_days(floor_div(local, MICROS_PER_DAY));
}

std::string Timestamp::to_iso_string() const {
    std::int64_t local = epoch_micros_ + static_cast<std::int64_t>(
                                             offset_minutes_) *
                                             60 * MICROS_PER_SECOND;
    std::int64_t days = floor_div(local, MICROS_PER_DAY);
    std::int64_t in_day = local - days * MICROS_PER_DAY;
    std::int64_t secs = in_day / MICROS_PER_SECOND;
    std::int64_t frac = in_day % MICROS_PER_SECOND;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%sT%02d:%02d:%02d",
                  Date::from_days(days).to_string().c_str(),
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs / 60) % 60),
                  static_cast<int>(secs % 60));
    std::string out = buffer;
    if (frac != 0) {
        std::snprintf(buffer, sizeof(buffer), ".%06lld",
                      static_cast<long long>(frac));
        out += buffer;
    }
    out += format_offset(offset_minutes_);
    return out;
}

std::string Timestamp::to_compact_string() const {
    std::int64_t local = epoch_micros_ + static_cast<std::int64_t>(
                                             offset_minutes_) *
                                             60 * MICROS_PER_SECOND;
    std::int64_t days = floor_div(local, MICROS_PER_DAY);
    std::int64_t secs = (local - days * MICROS_PER_DAY) / MICROS_PER_SECOND;
    Date date = Date::from_days(days);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02dT%02d%02d%02d",
                  date.year, date.month, date.day,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs / 60) % 60),
                  static_cast<int>(secs % 60));
    return buffer;
}

}  // namespace dcarchive
