/**
 * @file DateStamp.cpp
 * @brief Implementation of ISO-8601 parsing
 */

#include "unclobber/DateStamp.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Util.hpp"

#include <regex>

namespace unclobber {

namespace {

// Groups: 1 year, 2 month, 3 day, 4 hour, 5 minute, 6 second, 7 fraction,
// 8 offset (Z or signed), 9 sign, 10 offset hours, 11 offset minutes
const std::regex& timestamp_pattern() {
    static const std::regex re(
        "^([0-9]{4})-([0-9]{2})-([0-9]{2})"
        "(?:[T ]([0-9]{2}):([0-9]{2})(?::([0-9]{2})(?:\\.([0-9]{1,9}))?)?"
        "(Z|([+-])([0-9]{2})(?::?([0-9]{2}))?)?)?$");
    return re;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(std::int64_t y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

int to_int(const std::ssub_match& m) {
    return m.matched ? std::stoi(m.str()) : 0;
}

} // anonymous namespace

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    std::smatch m;
    if (!std::regex_match(text, m, timestamp_pattern())) {
        return std::nullopt;
    }

    const std::int64_t year = std::stoll(m[1].str());
    const int month = to_int(m[2]);
    const int day = to_int(m[3]);
    const int hour = to_int(m[4]);
    const int minute = to_int(m[5]);
    const int second = to_int(m[6]);

    if (year < 1 || month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::int32_t nanos = 0;
    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.append(9 - frac.size(), '0');
        nanos = static_cast<std::int32_t>(std::stol(frac));
    }

    std::int64_t offset_seconds = 0;
    if (m[9].matched) {
        const int off_h = to_int(m[10]);
        const int off_m = to_int(m[11]);
        if (off_h > 23 || off_m > 59) return std::nullopt;
        offset_seconds = (off_h * 60 + off_m) * 60;
        if (m[9].str() == "-") offset_seconds = -offset_seconds;
    }

    Timestamp ts;
    ts.seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
               + hour * 3600 + minute * 60 + second
               - offset_seconds;
    ts.nanos = nanos;
    return ts;
}

bool is_datestamp(const Value& value) {
    if (!value.is_string()) return false;
    return parse_timestamp(value.get<std::string>()).has_value();
}

DatePolicy parse_date_policy(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "latest") return DatePolicy::Latest;
    if (lower == "earliest") return DatePolicy::Earliest;
    throw ConfigError("Unknown date policy '" + name + "' (expected latest or earliest)");
}

std::string to_string(DatePolicy policy) {
    return policy == DatePolicy::Earliest ? "earliest" : "latest";
}

} // namespace unclobber
