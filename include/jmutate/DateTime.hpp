/**
 * @file DateTime.hpp
 * @brief Calendar date-time parsing, formatting and offsets
 *
 * Patterns use strftime/strptime conversion specifiers (%Y, %m, %d, %H,
 * %M, %S, %b, %y, ...). All date-times are naive: no time zone
 * conversion happens, a trailing 'Z' is treated as literal text.
 */

#ifndef JMUTATE_DATETIME_HPP
#define JMUTATE_DATETIME_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace jmutate {

/**
 * @brief Broken-down proleptic Gregorian date-time
 */
struct DateTime {
    int year = 1970;
    int month = 1;   ///< 1-12
    int day = 1;     ///< 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const DateTime& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second;
    }
};

/**
 * @brief Unit for offset_datetime()
 */
enum class DateUnit {
    Seconds,
    Minutes,
    Hours,
    Days,
    Weeks,
    Months,
    Years
};

/**
 * @brief Parse a unit name ("days", "day", "hours", ...)
 * @return The unit, or nullopt for unknown names
 */
std::optional<DateUnit> parse_date_unit(const std::string& name);

/**
 * @brief Parse text with a strptime-style pattern
 *
 * The whole input must be consumed and the resulting calendar date must
 * exist (no February 30th).
 *
 * @return Parsed date-time, or nullopt on any mismatch
 */
std::optional<DateTime> parse_datetime(const std::string& text, const std::string& pattern);

/**
 * @brief Format a date-time with a strftime-style pattern
 */
std::string format_datetime(const DateTime& dt, const std::string& pattern);

/**
 * @brief Shift a date-time by a signed amount
 *
 * Month and year shifts keep the day of month, clamped to the length of
 * the target month (Jan 31 + 1 month = Feb 28/29).
 *
 * @return The shifted value, or nullopt if the input or the result lies
 *         outside years 1-9999
 */
std::optional<DateTime> offset_datetime(const DateTime& dt, std::int64_t amount, DateUnit unit);

/**
 * @brief A date-time together with the ISO-8601 layout it was read from
 */
struct IsoDateTime {
    DateTime value;
    std::string pattern;
};

/**
 * @brief Recognize an ISO-8601 date or date-time string
 *
 * Accepted layouts, tried in order:
 * - `%Y-%m-%dT%H:%M:%SZ`
 * - `%Y-%m-%dT%H:%M:%S`
 * - `%Y-%m-%d %H:%M:%S`
 * - `%Y-%m-%d`
 *
 * @return The parsed value and its layout, or nullopt
 */
std::optional<IsoDateTime> parse_iso_datetime(const std::string& text);

/**
 * @brief Days since 1970-01-01 for a civil date
 */
std::int64_t days_from_civil(int year, int month, int day);

/**
 * @brief Number of days in a month (1-12) of a year
 */
int days_in_month(int year, int month);

} // namespace jmutate

#endif // JMUTATE_DATETIME_HPP
