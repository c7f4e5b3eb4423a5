// timestamp.hpp
// UTC timestamp parsing and formatting
// Timestamps are nanoseconds since the Unix epoch, as in the rest of the engine

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <cctype>
#include "exceptions.hpp"

namespace pairs_arb {

using Timestamp = std::chrono::nanoseconds;

namespace timestamp_detail {

inline bool allDigits(const std::string& s, size_t begin, size_t end) {
    if (begin >= end || end > s.size()) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

inline int toInt(const std::string& s, size_t begin, size_t len) {
    return std::stoi(s.substr(begin, len));
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

inline void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

} // namespace timestamp_detail

// Parse "YYYY-MM-DD[( |T)HH:MM[:SS[.fffffffff]]][Z|+HH:MM|-HH:MM]" or an integer
// count of nanoseconds since the epoch. Offsets are normalized to UTC.
inline Timestamp parseTimestamp(const std::string& text) {
    using namespace timestamp_detail;
    const std::string s = text;
    if (s.empty()) {
        throw DataException("Empty timestamp");
    }

    // Bare integer: nanoseconds since epoch
    size_t first = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (allDigits(s, first, s.size())) {
        try {
            return Timestamp(std::stoll(s));
        } catch (const std::out_of_range&) {
            throw DataException("Timestamp out of range: " + s);
        }
    }

    if (s.size() < 10 || !allDigits(s, 0, 4) || s[4] != '-' || !allDigits(s, 5, 7) ||
        s[7] != '-' || !allDigits(s, 8, 10)) {
        throw DataException("Malformed timestamp: '" + s + "'");
    }

    int year = toInt(s, 0, 4);
    int month = toInt(s, 5, 2);
    int day = toInt(s, 8, 2);
    int hour = 0, minute = 0, second = 0;
    int64_t fraction_ns = 0;
    int64_t offset_seconds = 0;

    size_t pos = 10;
    if (pos < s.size() && (s[pos] == ' ' || s[pos] == 'T')) {
        ++pos;
        if (!allDigits(s, pos, pos + 2) || pos + 5 > s.size() || s[pos + 2] != ':' ||
            !allDigits(s, pos + 3, pos + 5)) {
            throw DataException("Malformed time of day in timestamp: '" + s + "'");
        }
        hour = toInt(s, pos, 2);
        minute = toInt(s, pos + 3, 2);
        pos += 5;
        if (pos < s.size() && s[pos] == ':') {
            if (!allDigits(s, pos + 1, pos + 3)) {
                throw DataException("Malformed seconds in timestamp: '" + s + "'");
            }
            second = toInt(s, pos + 1, 2);
            pos += 3;
        }
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                if (digits < 9) {
                    fraction_ns = fraction_ns * 10 + (s[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                throw DataException("Malformed fractional seconds in timestamp: '" + s + "'");
            }
            for (size_t i = digits; i < 9; ++i) fraction_ns *= 10;
        }
    }

    if (pos < s.size()) {
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            pos = s.size();
        } else if ((s[pos] == '+' || s[pos] == '-') && pos + 6 == s.size() &&
                   allDigits(s, pos + 1, pos + 3) && s[pos + 3] == ':' &&
                   allDigits(s, pos + 4, pos + 6)) {
            int sign = (s[pos] == '-') ? -1 : 1;
            offset_seconds = sign * (toInt(s, pos + 1, 2) * 3600 + toInt(s, pos + 4, 2) * 60);
            pos = s.size();
        } else {
            throw DataException("Unrecognized timestamp suffix: '" + s + "'");
        }
    }

    if (month < 1 || month > 12 || day < 1 || hour > 23 || minute > 59 || second > 60) {
        throw DataException("Timestamp field out of range: '" + s + "'");
    }
    if (day > daysInMonth(year, month)) {
        throw DataException("Day out of range for month in timestamp: '" + s + "'");
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    // Nanosecond count must fit int64_t (about 1677-09-21 .. 2262-04-11)
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (seconds > (kMax - fraction_ns) / 1000000000LL || seconds < kMin / 1000000000LL + 1) {
        throw DataException("Timestamp out of range: '" + s + "'");
    }
    return Timestamp(seconds * 1000000000LL + fraction_ns);
}

// ISO-8601 UTC, fractional part trimmed of trailing zeros
inline std::string formatTimestamp(Timestamp ts) {
    using namespace timestamp_detail;
    int64_t total_ns = ts.count();
    int64_t seconds = total_ns / 1000000000LL;
    int64_t nanos = total_ns % 1000000000LL;
    if (nanos < 0) {
        nanos += 1000000000LL;
        seconds -= 1;
    }
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    int64_t year;
    unsigned month, day;
    civilFromDays(days, year, month, day);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u %02d:%02d:%02d",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    std::string out(buffer);

    if (nanos != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), "%09lld", static_cast<long long>(nanos));
        std::string fraction(frac);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        out += "." + fraction;
    }
    return out;
}

} // namespace pairs_arb
