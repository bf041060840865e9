/**
 * @file time_util.hpp
 * @brief ISO-8601 timestamp parsing and formatting
 */

#ifndef LSQUOTA_TIME_UTIL_HPP
#define LSQUOTA_TIME_UTIL_HPP

#include <chrono>
#include <optional>
#include <string>

namespace lsquota {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)"
 *
 * A space is accepted in place of 'T'. Fractions beyond microseconds are
 * truncated. Timestamps without a zone designator are rejected because
 * they do not name an instant.
 */
std::optional<TimePoint> parse_iso8601(const std::string& text);

/**
 * @brief UTC timestamp such as "2026-10-19T08:15:00.250000+00:00"
 *
 * The fraction is omitted when it is zero.
 */
std::string format_iso8601(TimePoint tp);

/**
 * @brief (@p later - @p now) in milliseconds, truncated toward zero
 */
long long millis_between(TimePoint now, TimePoint later);

} // namespace lsquota

#endif // LSQUOTA_TIME_UTIL_HPP
