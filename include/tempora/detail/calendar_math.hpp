#pragma once

#include <cstdint>

namespace tempora::detail {

/**
 * Proleptic Gregorian calendar arithmetic shared by descriptor validation,
 * the date-string parser and Instant rendering.
 *
 * All functions work on plain integers in UTC. Years may be zero or
 * negative (astronomical numbering).
 */

inline constexpr int64_t SECONDS_PER_DAY = 86'400;
inline constexpr int64_t MILLISECONDS_PER_DAY = SECONDS_PER_DAY * 1'000;

/// Host dates span 1e8 days either side of the epoch
inline constexpr double MAX_DATE_MILLISECONDS = 8.64e15;

/// Year of the last representable host date (275760-09-13)
inline constexpr int64_t MAX_YEAR = 275'760;

constexpr bool is_leap_year(int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/**
 * Days in `month` (1-12) of `year`, leap-year aware.
 *
 * @return 0 for a month outside 1-12
 */
constexpr int days_in_month(int64_t year, int month) noexcept {
    constexpr int lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

/**
 * Days since 1970-01-01 for a civil date.
 *
 * Days past the end of the month roll forward (e.g. Feb 30 -> Mar 1/2),
 * which the date parser relies on.
 *
 * @param year Civil year
 * @param month Month 1-12
 * @param day Day of month, 1-31
 * @return Signed day count, negative before the epoch
 */
constexpr int64_t days_from_civil(int64_t year, int month, int day) noexcept {
    // Shift so the year starts in March; leap day is then the last day of the year
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;                                 // [0, 399]
    const int64_t mp = (month + 9) % 12;                                  // March = 0
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;                     // [0, 365]
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;            // [0, 146096]
    return era * 146'097 + doe - 719'468;
}

/// Broken-down civil date, result of civil_from_days()
struct CivilDate {
    int64_t year;
    int month; // 1-12
    int day;   // 1-31
};

/// Inverse of days_from_civil()
constexpr CivilDate civil_from_days(int64_t days) noexcept {
    days += 719'468;
    const int64_t era = (days >= 0 ? days : days - 146'096) / 146'097;
    const int64_t doe = days - era * 146'097;                                     // [0, 146096]
    const int64_t yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365; // [0, 399]
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);                  // [0, 365]
    const int64_t mp = (5 * doy + 2) / 153;                                       // [0, 11]
    const int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    return CivilDate{yoe + era * 400 + (month <= 2 ? 1 : 0), month, day};
}

/**
 * Floor division for negative dividends.
 *
 * Used to split an epoch millisecond count into (day, millisecond-of-day)
 * with the millisecond part always in [0, MILLISECONDS_PER_DAY).
 */
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace tempora::detail
