#pragma once

#include "tempora/breakdown.hpp"
#include "tempora/calendar.hpp"
#include "tempora/detail/calendar_math.hpp"
#include "tempora/detail/date_parser.hpp"
#include "tempora/duration.hpp"
#include "tempora/instant_error.hpp"

#include <algorithm>
#include <chrono>
#include <compare>
#include <concepts>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace tempora {

/**
 * @brief Serialized form of an Instant: `{ unixEpoch: <breakdown> }`
 *
 * Produced by Instant::serialize() and accepted back by the Instant
 * constructor. The breakdown may use any units.
 */
struct EpochBreakdown {
    Breakdown unix_epoch;

    friend bool operator==(const EpochBreakdown&, const EpochBreakdown&) = default;
};

class Instant;

/**
 * @brief Every shape an Instant can be built from
 *
 * Resolved by Instant::from_input() in alternative order:
 * string, host date, raw milliseconds, Duration, epoch breakdown,
 * calendar descriptor.
 */
using InstantInput = std::variant<std::string, std::chrono::system_clock::time_point, double,
                                  Duration, EpochBreakdown, CalendarDescriptor>;

/**
 * Point in time as a Duration offset from 1970-01-01T00:00:00Z.
 *
 * ## Storage
 * Exactly one Duration. Calendar fields (year, month, ...) only exist while
 * a descriptor or date string is being converted; they are never kept.
 *
 * ## Construction
 * Infallible shapes have explicit constructors:
 * - Duration (offset from the epoch)
 * - double (milliseconds since the epoch)
 * - std::chrono::system_clock::time_point (the host date type)
 * - EpochBreakdown (serialized form)
 *
 * Fallible shapes return InstantResult<Instant>:
 * - parse(string) uses the date-string parser
 * - from_calendar(descriptor) validates, then parses the rendered descriptor
 * - from_input(variant) dispatches over all six shapes
 *
 * ## Comparison and arithmetic
 * Everything is defined on the millisecond value of the offset. Comparisons
 * accept either an Instant or a system_clock::time_point.
 *
 * Immutable; arithmetic returns new Instants.
 */
class Instant {
public:
    using clock = std::chrono::system_clock;
    using time_point = clock::time_point;

    // Default construction - the epoch
    Instant() noexcept = default;

    explicit Instant(Duration unix_epoch) noexcept : unix_epoch_(unix_epoch) {}

    explicit Instant(double unix_milliseconds) noexcept : unix_epoch_(unix_milliseconds) {}

    explicit Instant(time_point date) noexcept : unix_epoch_(milliseconds_of(date)) {}

    explicit Instant(const EpochBreakdown& epoch) noexcept : unix_epoch_(epoch.unix_epoch) {}

    // === Fallible factories ===

    /**
     * Parse a date string, e.g. "2020-10-31 19:30 GMT".
     *
     * @return Instant, or InstantError::Code::unparseable_date
     */
    static InstantResult<Instant> parse(std::string_view text) noexcept {
        auto ms = detail::parse_date_string(text);
        if (!ms) {
            return make_instant_error(InstantError::Code::unparseable_date);
        }
        return Instant(*ms);
    }

    /**
     * Build from calendar and clock fields.
     *
     * The descriptor is validated first (see validate()), then rendered as
     * `Y-MM-DD hh:mm:ss TZ` and handed to the same parser as parse().
     */
    static InstantResult<Instant> from_calendar(const CalendarDescriptor& descriptor) {
        return validate(descriptor).and_then([&descriptor]() {
            return parse(format_descriptor(descriptor));
        });
    }

    /// Build from any supported input shape
    static InstantResult<Instant> from_input(const InstantInput& input) {
        return std::visit(
            [](const auto& value) -> InstantResult<Instant> {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return parse(value);
                } else if constexpr (std::is_same_v<T, CalendarDescriptor>) {
                    return from_calendar(value);
                } else {
                    return Instant(value);
                }
            },
            input);
    }

    static Instant epoch_start() noexcept { return Instant(); }

    static Instant now() noexcept { return Instant(clock::now()); }

    // === Accessors ===

    /// Offset from 1970-01-01T00:00:00Z
    Duration unix_epoch() const noexcept { return unix_epoch_; }

    /// Host date for interop; offsets past ±8.64e15 ms saturate, NaN maps to the epoch
    time_point as_date() const noexcept {
        double value = unix_epoch_.as_milliseconds();
        if (std::isnan(value)) {
            value = 0.0;
        }
        value = std::clamp(value, -detail::MAX_DATE_MILLISECONDS, detail::MAX_DATE_MILLISECONDS);
        const std::chrono::duration<double, std::milli> ms(value);
        return time_point(std::chrono::round<clock::duration>(ms));
    }

    // === Comparison ===

    bool is_before(const Instant& other) const noexcept { return millis() < other.millis(); }
    bool is_before(time_point date) const noexcept { return is_before(Instant(date)); }

    bool is_after(const Instant& other) const noexcept { return millis() > other.millis(); }
    bool is_after(time_point date) const noexcept { return is_after(Instant(date)); }

    bool equals(const Instant& other) const noexcept { return millis() == other.millis(); }
    bool equals(time_point date) const noexcept { return equals(Instant(date)); }

    /// -1 if before, 1 if after, 0 otherwise
    int compare(const Instant& other) const noexcept {
        if (is_before(other)) {
            return -1;
        }
        if (is_after(other)) {
            return 1;
        }
        return 0;
    }
    int compare(time_point date) const noexcept { return compare(Instant(date)); }

    std::partial_ordering operator<=>(const Instant& other) const noexcept {
        return unix_epoch_ <=> other.unix_epoch_;
    }

    bool operator==(const Instant& other) const noexcept { return equals(other); }

    // === Arithmetic ===

    /// Later instant; arguments are Durations or Breakdowns
    template <typename... Ts>
        requires(std::convertible_to<const Ts&, Duration> && ...)
    Instant add(const Ts&... periods) const noexcept {
        return Instant(unix_epoch_.add(periods...));
    }

    Instant subtract(const Duration& period) const noexcept {
        return Instant(unix_epoch_.subtract(period));
    }

    /// other - this: positive when `other` is later
    Duration difference(const Instant& other) const noexcept {
        return other.unix_epoch_.subtract(unix_epoch_);
    }
    Duration difference(time_point date) const noexcept { return difference(Instant(date)); }

    friend Instant operator+(const Instant& t, const Duration& d) noexcept { return t.add(d); }

    friend Instant operator-(const Instant& t, const Duration& d) noexcept {
        return t.subtract(d);
    }

    friend Duration operator-(const Instant& lhs, const Instant& rhs) noexcept {
        return rhs.difference(lhs);
    }

    // === Serialization ===

    /// Plain-data form: {unixEpoch: <default breakdown of the offset>}
    EpochBreakdown serialize() const { return EpochBreakdown{unix_epoch_.breakdown()}; }

    /**
     * Text rendering, matching how std::chrono prints the host date at
     * millisecond precision: `YYYY-MM-DD hh:mm:ss.mmm` in UTC. Offsets that
     * are not finite or lie beyond ±8.64e15 ms render as `Invalid Date`.
     */
    std::string to_string() const {
        const double ms = unix_epoch_.as_milliseconds();
        // Negated so NaN falls through to the invalid case
        if (!(std::abs(ms) <= detail::MAX_DATE_MILLISECONDS)) {
            return "Invalid Date";
        }
        const auto total = static_cast<int64_t>(std::floor(ms));
        const int64_t days = detail::floor_div(total, detail::MILLISECONDS_PER_DAY);
        const int64_t ms_of_day = total - days * detail::MILLISECONDS_PER_DAY;
        const auto date = detail::civil_from_days(days);

        char buf[48];
        std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02d %02lld:%02lld:%02lld.%03lld",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<long long>(ms_of_day / 3'600'000),
                      static_cast<long long>(ms_of_day / 60'000 % 60),
                      static_cast<long long>(ms_of_day / 1'000 % 60),
                      static_cast<long long>(ms_of_day % 1'000));
        return std::string(buf);
    }

private:
    double millis() const noexcept { return unix_epoch_.as_milliseconds(); }

    // Host dates carry whole milliseconds; finer clock ticks are floored away
    static double milliseconds_of(time_point date) noexcept {
        const auto ms = std::chrono::floor<std::chrono::milliseconds>(date.time_since_epoch());
        return static_cast<double>(ms.count());
    }

    Duration unix_epoch_{};
};

inline std::ostream& operator<<(std::ostream& os, const Instant& t) {
    return os << t.to_string();
}

} // namespace tempora
