#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace tempora {

/**
 * Units a Duration can be expressed in.
 *
 * Every unit maps to a fixed number of milliseconds (see divisor()).
 * Enumerator order is declaration order only; decomposition always uses
 * significance order (largest divisor first), which places microfortnights
 * between minutes and seconds.
 */
enum class TimeUnit : uint8_t {
    milliseconds,
    seconds,
    minutes,
    hours,
    days,
    weeks,
    microfortnights
};

/// Number of TimeUnit enumerators
inline constexpr std::size_t time_unit_count = 7;

namespace detail {

// Indexed by TimeUnit. Read-only for the lifetime of the process.
inline constexpr std::array<double, time_unit_count> UNIT_DIVISORS = {
    1.0,             // milliseconds
    1'000.0,         // seconds
    60'000.0,        // minutes
    3'600'000.0,     // hours
    86'400'000.0,    // days
    604'800'000.0,   // weeks
    1'209.6,         // microfortnights (one fortnight / 10^6)
};

inline constexpr std::array<std::string_view, time_unit_count> UNIT_NAMES = {
    "milliseconds", "seconds", "minutes", "hours", "days", "weeks", "microfortnights",
};

} // namespace detail

/// Milliseconds per one of `unit`
[[nodiscard]] constexpr double divisor(TimeUnit unit) noexcept {
    return detail::UNIT_DIVISORS[static_cast<std::size_t>(unit)];
}

/// Canonical lower-case name ("milliseconds", "seconds", ...)
[[nodiscard]] constexpr std::string_view unit_name(TimeUnit unit) noexcept {
    return detail::UNIT_NAMES[static_cast<std::size_t>(unit)];
}

/// Inverse of unit_name(); exact, case-sensitive match
[[nodiscard]] constexpr std::optional<TimeUnit> parse_unit(std::string_view name) noexcept {
    for (std::size_t i = 0; i < time_unit_count; ++i) {
        if (detail::UNIT_NAMES[i] == name) {
            return static_cast<TimeUnit>(i);
        }
    }
    return std::nullopt;
}

/// True if `a` is a larger unit than `b` (comes first in significance order)
[[nodiscard]] constexpr bool more_significant(TimeUnit a, TimeUnit b) noexcept {
    return divisor(a) > divisor(b);
}

/**
 * Sort units into significance order and drop duplicates.
 *
 * Decomposition must always proceed from the largest unit to the smallest,
 * independent of the order in which the caller listed them.
 */
[[nodiscard]] inline std::vector<TimeUnit> significance_order(std::vector<TimeUnit> units) {
    std::sort(units.begin(), units.end(), more_significant);
    units.erase(std::unique(units.begin(), units.end()), units.end());
    return units;
}

/// Units used when breakdown() is called without a unit list
inline const std::vector<TimeUnit>& default_breakdown_units() {
    static const std::vector<TimeUnit> units = {TimeUnit::days, TimeUnit::hours,
                                                TimeUnit::minutes, TimeUnit::seconds,
                                                TimeUnit::milliseconds};
    return units;
}

} // namespace tempora
