/**
 * oino/datetime.hpp - ISO-8601 timestamp formatting and parsing
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Timestamps are UTC with millisecond precision. Output always uses the
 * form 2024-01-31T12:00:00.000Z; input accepts a date alone, a date with
 * a time separated by 'T' or a space, fractional seconds, and a 'Z' or
 * +HH:MM offset.
 */

#pragma once

#include "types.hpp"
#include <cstdio>
#include <optional>
#include <string>

namespace oino {

namespace detail {

// Howard Hinnant's civil calendar algorithms.
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

inline unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && y % 4 == 0 && (y % 100 != 0 || y % 400 == 0)) return 29;
    return days[m - 1];
}

inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

class DigitReader {
public:
    explicit DigitReader(const std::string& s) : s_(s) {}

    bool read(size_t count, int& value) {
        if (pos_ + count > s_.size()) return false;
        value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = s_[pos_ + i];
            if (c < '0' || c > '9') return false;
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return true;
    }

    bool accept(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool at_end() const { return pos_ >= s_.size(); }
    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
    void skip() { ++pos_; }

private:
    const std::string& s_;
    size_t pos_ = 0;
};

} // namespace detail

inline Timestamp make_timestamp(int64_t year, unsigned month, unsigned day,
                                int hour = 0, int minute = 0, int second = 0, int millis = 0) {
    int64_t days = detail::days_from_civil(year, month, day);
    int64_t ms = ((days * 24 + hour) * 60 + minute) * 60 * 1000 +
                 static_cast<int64_t>(second) * 1000 + millis;
    return Timestamp(std::chrono::milliseconds(ms));
}

inline std::string format_iso8601(Timestamp ts) {
    int64_t ms = ts.time_since_epoch().count();
    int64_t days = detail::floor_div(ms, 86400000);
    int64_t rem = ms - days * 86400000;
    int64_t year;
    unsigned month, day;
    detail::civil_from_days(days, year, month, day);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(rem / 3600000),
                  static_cast<int>(rem / 60000 % 60),
                  static_cast<int>(rem / 1000 % 60),
                  static_cast<int>(rem % 1000));
    return buf;
}

/**
 * Parse an ISO-8601 style date or date-time. Returns nullopt when the
 * text is not a recognizable timestamp.
 */
inline std::optional<Timestamp> parse_datetime(const std::string& text) {
    detail::DigitReader r(text);
    int year, month, day;
    if (!r.read(4, year) || !r.accept('-') || !r.read(2, month) ||
        !r.accept('-') || !r.read(2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > detail::days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0, millis = 0;
    int offset_minutes = 0;
    if (!r.at_end()) {
        if (!r.accept('T') && !r.accept(' ')) return std::nullopt;
        if (!r.read(2, hour) || !r.accept(':') || !r.read(2, minute)) return std::nullopt;
        if (r.accept(':')) {
            if (!r.read(2, second)) return std::nullopt;
            if (r.accept('.')) {
                // Keep milliseconds, drop any finer digits
                int scale = 100;
                int digits = 0;
                while (r.peek() >= '0' && r.peek() <= '9') {
                    if (digits < 3) millis += (r.peek() - '0') * scale;
                    scale /= 10;
                    ++digits;
                    r.skip();
                }
                if (digits == 0) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        if (r.accept('Z')) {
            // UTC
        } else if (r.peek() == '+' || r.peek() == '-') {
            int sign = r.peek() == '-' ? -1 : 1;
            r.skip();
            int oh = 0, om = 0;
            if (!r.read(2, oh)) return std::nullopt;
            r.accept(':');
            if (!r.at_end() && !r.read(2, om)) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        }
        if (!r.at_end()) return std::nullopt;
    }

    Timestamp ts = make_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day),
                                  hour, minute, second, millis);
    return ts - std::chrono::minutes(offset_minutes);
}

} // namespace oino
