/**
 * @file DateStamp.hpp
 * @brief ISO-8601 date-like value detection and ordering
 *
 * Accepted forms (extended ISO-8601):
 * - YYYY-MM-DD
 * - YYYY-MM-DD(T| )HH:MM[:SS[.fraction]][offset]
 *
 * where offset is `Z`, `±HH`, `±HHMM` or `±HH:MM`. A trailing `Z` means
 * UTC. Date-only and offset-less timestamps are read as UTC so every
 * date-like value lands on one timeline.
 */

#ifndef UNCLOBBER_DATESTAMP_HPP
#define UNCLOBBER_DATESTAMP_HPP

#include "unclobber/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace unclobber {

/**
 * @brief A point in time, UTC, with nanosecond resolution
 */
struct Timestamp {
    std::int64_t seconds = 0; ///< Seconds since 1970-01-01T00:00:00Z
    std::int32_t nanos = 0;   ///< Sub-second part, [0, 1e9)

    friend bool operator<(const Timestamp& a, const Timestamp& b) {
        return a.seconds < b.seconds || (a.seconds == b.seconds && a.nanos < b.nanos);
    }
    friend bool operator==(const Timestamp& a, const Timestamp& b) {
        return a.seconds == b.seconds && a.nanos == b.nanos;
    }
};

/**
 * @brief Which endpoint wins when two date-like values meet on one key
 */
enum class DatePolicy {
    Latest,   ///< Keep the most recent timestamp (default)
    Earliest  ///< Keep the oldest timestamp
};

/**
 * @brief Parse an ISO-8601 date or timestamp
 * @param text Candidate text
 * @return The instant, or std::nullopt if text is not date-like
 */
std::optional<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Check if a value is a string holding an ISO-8601 date or timestamp
 */
bool is_datestamp(const Value& value);

/**
 * @brief Parse a policy name ("latest" or "earliest", case-insensitive)
 * @throws ConfigError for any other name
 */
DatePolicy parse_date_policy(const std::string& name);

/**
 * @brief Lowercase name of a policy
 */
std::string to_string(DatePolicy policy);

} // namespace unclobber

#endif // UNCLOBBER_DATESTAMP_HPP
