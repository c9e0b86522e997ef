/**
 * @file DateTime.cpp
 * @brief Implementation of calendar helpers
 *
 * Civil date <-> day count conversions follow the well-known
 * era-based algorithms and are valid for the whole proleptic
 * Gregorian calendar.
 */

#include "jmutate/DateTime.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace jmutate {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// Years representable by the four-digit %Y layouts
constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

// Appended to text and pattern in parse_datetime()
constexpr char kSentinel = '\x1f';

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/**
 * @brief Inverse of days_from_civil()
 */
void civil_from_days(std::int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = yoe + era * 400;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(month <= 2 ? y + 1 : y);
}

std::int64_t to_seconds(const DateTime& dt) {
    return days_from_civil(dt.year, dt.month, dt.day) * kSecondsPerDay +
           dt.hour * 3600 + dt.minute * 60 + dt.second;
}

DateTime from_seconds(std::int64_t seconds) {
    std::int64_t days = seconds / kSecondsPerDay;
    std::int64_t rem = seconds % kSecondsPerDay;
    if (rem < 0) {
        rem += kSecondsPerDay;
        --days;
    }
    DateTime dt;
    civil_from_days(days, dt.year, dt.month, dt.day);
    dt.hour = static_cast<int>(rem / 3600);
    dt.minute = static_cast<int>((rem % 3600) / 60);
    dt.second = static_cast<int>(rem % 60);
    return dt;
}

/**
 * @brief Seconds between the first and last instant of the year range
 */
std::int64_t max_span_seconds() {
    return (days_from_civil(kMaxYear + 1, 1, 1) - days_from_civil(kMinYear, 1, 1)) *
           kSecondsPerDay;
}

std::tm to_tm(const DateTime& dt) {
    std::tm tm{};
    tm.tm_year = dt.year - 1900;
    tm.tm_mon = dt.month - 1;
    tm.tm_mday = dt.day;
    tm.tm_hour = dt.hour;
    tm.tm_min = dt.minute;
    tm.tm_sec = dt.second;

    std::int64_t days = days_from_civil(dt.year, dt.month, dt.day);
    // 1970-01-01 was a Thursday
    std::int64_t wday = (days + 4) % 7;
    tm.tm_wday = static_cast<int>(wday < 0 ? wday + 7 : wday);
    tm.tm_yday = static_cast<int>(days - days_from_civil(dt.year, 1, 1));
    return tm;
}

} // anonymous namespace

std::int64_t days_from_civil(int year, int month, int day) {
    const std::int64_t y = month <= 2 ? year - 1 : year;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = month > 2 ? month - 3 : month + 9;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return kDays[month - 1];
}

std::optional<DateUnit> parse_date_unit(const std::string& name) {
    if (name == "seconds" || name == "second" || name == "s") return DateUnit::Seconds;
    if (name == "minutes" || name == "minute" || name == "min") return DateUnit::Minutes;
    if (name == "hours" || name == "hour" || name == "h") return DateUnit::Hours;
    if (name == "days" || name == "day" || name == "d") return DateUnit::Days;
    if (name == "weeks" || name == "week" || name == "w") return DateUnit::Weeks;
    if (name == "months" || name == "month") return DateUnit::Months;
    if (name == "years" || name == "year" || name == "y") return DateUnit::Years;
    return std::nullopt;
}

std::optional<DateTime> parse_datetime(const std::string& text, const std::string& pattern) {
    if (text.empty() || pattern.empty()) return std::nullopt;

    // get_time may stop early when the input runs out before the pattern
    // does; a trailing sentinel on both sides makes the whole pattern required.
    const std::string framed_text = text + kSentinel;
    const std::string framed_pattern = pattern + kSentinel;

    std::tm tm{};
    tm.tm_mday = 1;
    std::istringstream in(framed_text);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, framed_pattern.c_str());
    if (in.fail()) return std::nullopt;
    if (in.peek() != std::char_traits<char>::eof()) return std::nullopt;

    DateTime dt;
    dt.year = tm.tm_year + 1900;
    dt.month = tm.tm_mon + 1;
    dt.day = tm.tm_mday;
    dt.hour = tm.tm_hour;
    dt.minute = tm.tm_min;
    dt.second = tm.tm_sec;

    if (dt.month < 1 || dt.month > 12) return std::nullopt;
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) return std::nullopt;
    if (dt.hour < 0 || dt.hour > 23 || dt.minute < 0 || dt.minute > 59 ||
        dt.second < 0 || dt.second > 59) {
        return std::nullopt;
    }
    return dt;
}

std::string format_datetime(const DateTime& dt, const std::string& pattern) {
    std::tm tm = to_tm(dt);
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm, pattern.c_str());
    return out.str();
}

std::optional<DateTime> offset_datetime(const DateTime& dt, std::int64_t amount, DateUnit unit) {
    if (dt.year < kMinYear || dt.year > kMaxYear) return std::nullopt;

    if (unit == DateUnit::Months || unit == DateUnit::Years) {
        // Any shift this large leaves the year range, so bail out before scaling
        constexpr std::int64_t kMaxMonths = static_cast<std::int64_t>(kMaxYear - kMinYear + 1) * 12;
        const std::int64_t limit = unit == DateUnit::Years ? kMaxMonths / 12 : kMaxMonths;
        if (amount > limit || amount < -limit) return std::nullopt;

        std::int64_t months = unit == DateUnit::Years ? amount * 12 : amount;
        std::int64_t total = static_cast<std::int64_t>(dt.year) * 12 + (dt.month - 1) + months;
        std::int64_t year = total >= 0 ? total / 12 : (total - 11) / 12;
        if (year < kMinYear || year > kMaxYear) return std::nullopt;

        DateTime out = dt;
        out.year = static_cast<int>(year);
        out.month = static_cast<int>(total - year * 12) + 1;
        out.day = std::min(dt.day, days_in_month(out.year, out.month));
        return out;
    }

    std::int64_t unit_seconds = 1;
    switch (unit) {
        case DateUnit::Seconds: unit_seconds = 1; break;
        case DateUnit::Minutes: unit_seconds = 60; break;
        case DateUnit::Hours: unit_seconds = 3600; break;
        case DateUnit::Days: unit_seconds = kSecondsPerDay; break;
        case DateUnit::Weeks: unit_seconds = 7 * kSecondsPerDay; break;
        default: return std::nullopt;
    }

    const std::int64_t span = max_span_seconds();
    if (amount > span / unit_seconds || amount < -(span / unit_seconds)) return std::nullopt;

    DateTime out = from_seconds(to_seconds(dt) + amount * unit_seconds);
    if (out.year < kMinYear || out.year > kMaxYear) return std::nullopt;
    return out;
}

std::optional<IsoDateTime> parse_iso_datetime(const std::string& text) {
    static const char* const kLayouts[] = {
        "%Y-%m-%dT%H:%M:%SZ",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d",
    };
    for (const char* layout : kLayouts) {
        if (auto dt = parse_datetime(text, layout)) {
            return IsoDateTime{*dt, layout};
        }
    }
    return std::nullopt;
}

} // namespace jmutate
