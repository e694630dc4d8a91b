#pragma once

#include "tempora/breakdown.hpp"
#include "tempora/time_unit.hpp"

#include <compare>
#include <concepts>
#include <ostream>
#include <vector>

#include <cmath>
#include <cstdio>

namespace tempora {

/**
 * Signed time interval held as a single millisecond count.
 *
 * ## Storage
 * One `double` of milliseconds. Every other view (seconds, minutes, hours,
 * days, weeks, microfortnights) is computed on access by dividing through
 * the fixed unit divisor, never stored.
 *
 * ## Arithmetic
 * Values are immutable; add(), subtract(), multiply(), divide() and abs()
 * return new Durations. Results follow IEEE-754: dividing by zero yields an
 * infinite or NaN magnitude instead of an error.
 *
 * ## Equality
 * equals() and operator== compare the millisecond value exactly, with no
 * tolerance. A Duration built as 1h + 30min equals one built as 1.5h only
 * because both sums are exactly representable.
 *
 * ## Decomposition
 * breakdown() splits the value into whole units from the most significant
 * down. Negative values use floor semantics at every step:
 * - `-90 min` as {hours, minutes} = {hours: -2, minutes: 30}
 *
 * This is a core library type: noexcept, no allocation except in breakdown().
 */
class Duration {
public:
    static constexpr double MILLISECONDS_PER_SECOND = 1'000.0;
    static constexpr double MILLISECONDS_PER_MINUTE = 60'000.0;
    static constexpr double MILLISECONDS_PER_HOUR = 3'600'000.0;
    static constexpr double MILLISECONDS_PER_DAY = 86'400'000.0;
    static constexpr double MILLISECONDS_PER_WEEK = 604'800'000.0;

    static constexpr Duration zero() noexcept { return Duration(0.0); }

    // Default construction - zero duration
    constexpr Duration() noexcept = default;

    constexpr explicit Duration(double milliseconds) noexcept : milliseconds_(milliseconds) {}

    /// Sum of amount * divisor(unit) over the breakdown's entries
    Duration(const Breakdown& breakdown) noexcept
        : milliseconds_(breakdown.total_milliseconds()) {}

    // Per-unit factories
    static Duration from_weeks(double n) { return Duration(Breakdown{{TimeUnit::weeks, n}}); }
    static Duration from_days(double n) { return Duration(Breakdown{{TimeUnit::days, n}}); }
    static Duration from_hours(double n) { return Duration(Breakdown{{TimeUnit::hours, n}}); }
    static Duration from_minutes(double n) {
        return Duration(Breakdown{{TimeUnit::minutes, n}});
    }
    static Duration from_seconds(double n) {
        return Duration(Breakdown{{TimeUnit::seconds, n}});
    }
    static constexpr Duration from_milliseconds(double n) noexcept { return Duration(n); }

    // Accessors - milliseconds is the canonical value
    constexpr double as_milliseconds() const noexcept { return milliseconds_; }
    constexpr double as_seconds() const noexcept { return milliseconds_ / MILLISECONDS_PER_SECOND; }
    constexpr double as_minutes() const noexcept { return milliseconds_ / MILLISECONDS_PER_MINUTE; }
    constexpr double as_hours() const noexcept { return milliseconds_ / MILLISECONDS_PER_HOUR; }
    constexpr double as_days() const noexcept { return milliseconds_ / MILLISECONDS_PER_DAY; }
    constexpr double as_weeks() const noexcept { return milliseconds_ / MILLISECONDS_PER_WEEK; }

    /// Value expressed in any unit, including microfortnights
    constexpr double as(TimeUnit unit) const noexcept { return milliseconds_ / divisor(unit); }

    // Predicates
    constexpr bool is_zero() const noexcept { return milliseconds_ == 0.0; }
    constexpr bool is_negative() const noexcept { return milliseconds_ < 0.0; }
    constexpr bool is_positive() const noexcept { return milliseconds_ > 0.0; }

    /**
     * Sum of this and every argument.
     *
     * Each argument may be a Duration or a Breakdown:
     * @code
     *   auto d = Duration::from_hours(1).add(Duration::from_minutes(5),
     *                                        Breakdown{{TimeUnit::seconds, 30}});
     * @endcode
     */
    template <typename... Ts>
        requires(std::convertible_to<const Ts&, Duration> && ...)
    Duration add(const Ts&... others) const noexcept {
        double sum = milliseconds_;
        ((sum += Duration(others).milliseconds_), ...);
        return Duration(sum);
    }

    /// this - other; may be negative
    Duration subtract(const Duration& other) const noexcept {
        return Duration(milliseconds_ - other.milliseconds_);
    }

    constexpr Duration multiply(double factor) const noexcept {
        return Duration(milliseconds_ * factor);
    }

    Duration divide(double divisor) const noexcept {
#ifndef NDEBUG
        if (divisor == 0.0) {
            std::fprintf(stderr,
                         "WARNING: Duration of %g ms divided by zero. "
                         "Result is infinite or NaN.\n",
                         milliseconds_);
        }
#endif
        return Duration(milliseconds_ / divisor);
    }

    constexpr Duration abs() const noexcept {
        if (is_negative()) {
            return Duration(-milliseconds_);
        }
        return *this;
    }

    constexpr bool equals(const Duration& other) const noexcept {
        return milliseconds_ == other.milliseconds_;
    }

    /**
     * Split into the default units: days, hours, minutes, seconds, milliseconds.
     *
     * Defaults: float_last = true, include_zero = false. With those defaults
     * no information is lost and units that contribute nothing are omitted.
     */
    Breakdown breakdown(BreakdownOptions options = {}) const {
        return decompose(default_breakdown_units(), options.float_last.value_or(true),
                         options.include_zero.value_or(false));
    }

    /**
     * Split into the requested units.
     *
     * Units are processed in significance order whatever order they are
     * passed in, and the result lists them in that order. Defaults:
     * float_last = false, include_zero = true, so the result always has one
     * entry per unit and the sub-unit remainder is dropped.
     *
     * @code
     *   Duration::from_hours(26).breakdown({TimeUnit::days, TimeUnit::hours, TimeUnit::minutes},
     *                                      {.include_zero = false});
     *   // {days: 1, hours: 2}
     * @endcode
     */
    Breakdown breakdown(const std::vector<TimeUnit>& units, BreakdownOptions options = {}) const {
        return decompose(significance_order(units), options.float_last.value_or(false),
                         options.include_zero.value_or(true));
    }

    /// Plain-data form: {milliseconds: <value>}
    Breakdown serialize() const { return Breakdown{{TimeUnit::milliseconds, milliseconds_}}; }

    // Operator forms of the named arithmetic
    constexpr Duration operator-() const noexcept { return Duration(-milliseconds_); }

    friend Duration operator+(const Duration& lhs, const Duration& rhs) noexcept {
        return lhs.add(rhs);
    }

    friend Duration operator-(const Duration& lhs, const Duration& rhs) noexcept {
        return lhs.subtract(rhs);
    }

    friend constexpr Duration operator*(const Duration& d, double factor) noexcept {
        return d.multiply(factor);
    }

    friend constexpr Duration operator*(double factor, const Duration& d) noexcept {
        return d.multiply(factor);
    }

    friend Duration operator/(const Duration& d, double divisor) noexcept {
        return d.divide(divisor);
    }

    // Ratio of two durations
    friend constexpr double operator/(const Duration& lhs, const Duration& rhs) noexcept {
        return lhs.milliseconds_ / rhs.milliseconds_;
    }

    // Comparison
    constexpr std::partial_ordering operator<=>(const Duration& other) const noexcept {
        return milliseconds_ <=> other.milliseconds_;
    }

    constexpr bool operator==(const Duration& other) const noexcept { return equals(other); }

private:
    // `units` must already be in significance order without duplicates
    Breakdown decompose(const std::vector<TimeUnit>& units, bool float_last,
                        bool include_zero) const {
        Breakdown result;
        double remaining = milliseconds_;

        for (std::size_t i = 0; i < units.size(); ++i) {
            const TimeUnit unit = units[i];
            const double div = divisor(unit);
            const bool last = (i + 1 == units.size());

            double amount;
            if (last && float_last) {
                amount = remaining / div;
            } else {
                // Floor, not truncation: negative values borrow from the next unit
                amount = std::floor(remaining / div);
                remaining -= amount * div;
            }

            if (include_zero || amount != 0.0) {
                result.set(unit, amount);
            }
        }
        return result;
    }

    double milliseconds_{0.0};
};

inline std::ostream& operator<<(std::ostream& os, const Duration& d) {
    return os << "Duration(" << d.as_milliseconds() << " ms)";
}

} // namespace tempora
