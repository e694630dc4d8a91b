#pragma once

#include "tempora/detail/calendar_math.hpp"
#include "tempora/instant_error.hpp"

#include <charconv>
#include <initializer_list>
#include <string>
#include <string_view>

#include <cmath>
#include <cstdint>

namespace tempora {

/**
 * @brief Calendar and clock fields describing an instant
 *
 * Fields are as shown on a calendar and clock: `{.month = 2, .day = 1}` is
 * the 1st of February. Only `second` may be fractional; the other numeric
 * fields are doubles so that non-integral input can be rejected rather than
 * silently truncated.
 *
 * The timezone is passed through verbatim to the date-string parser
 * ("GMT", "UTC", "+05:30", "EST", or empty for host local time).
 *
 * Construction-time input only; an Instant never stores these fields.
 */
struct CalendarDescriptor {
    double year{1970};
    double month{1};
    double day{1};
    double hour{0};
    double minute{0};
    double second{0};
    std::string timezone{};
};

namespace detail {

inline bool is_whole_number(double v) noexcept {
    return std::isfinite(v) && std::trunc(v) == v;
}

// Append `value` rendered with at least two integer digits
inline void append_padded(std::string& out, double value) {
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    std::string_view text(buf, ec == std::errc{} ? static_cast<std::size_t>(end - buf) : 0);
    const std::size_t int_digits = text.find('.') == std::string_view::npos
                                       ? text.size()
                                       : text.find('.');
    if (int_digits < 2) {
        out.push_back('0');
    }
    out.append(text);
}

} // namespace detail

/**
 * @brief Check a descriptor against calendar bounds
 *
 * Checks run in this order and stop at the first failure:
 * 1. year, month, day, hour, minute must be whole finite numbers
 * 2. year within ±275760, the span of host dates
 * 3. month in 1-12
 * 4. day in 1..days_in_month(year, month), so February honours leap years
 * 5. hour in [0, 24), minute in [0, 60), second in [0, 60)
 *
 * @return Empty on success, otherwise the first violated rule
 */
inline expected<void, InstantError> validate(const CalendarDescriptor& d) noexcept {
    using Code = InstantError::Code;

    for (double field : {d.year, d.month, d.day, d.hour, d.minute}) {
        if (!detail::is_whole_number(field)) {
            return make_instant_error(Code::invalid_descriptor);
        }
    }
    if (std::abs(d.year) > static_cast<double>(detail::MAX_YEAR)) {
        return make_instant_error(Code::invalid_year);
    }
    if (d.month < 1 || d.month > 12) {
        return make_instant_error(Code::invalid_month);
    }
    const int max_day =
        detail::days_in_month(static_cast<int64_t>(d.year), static_cast<int>(d.month));
    if (d.day < 1 || d.day > max_day) {
        return make_instant_error(Code::invalid_day);
    }
    if (d.hour < 0 || d.hour >= 24) {
        return make_instant_error(Code::invalid_hour);
    }
    if (d.minute < 0 || d.minute >= 60) {
        return make_instant_error(Code::invalid_minute);
    }
    // Written as a negated range test so NaN is rejected too
    if (!(d.second >= 0 && d.second < 60)) {
        return make_instant_error(Code::invalid_second);
    }
    return {};
}

/**
 * @brief Render a descriptor as text for the date-string parser
 *
 * Produces `Y-MM-DD hh:mm:ss TZ`. Month, day, hour, minute and second are
 * zero-padded to two digits; the year is not padded. A fractional second
 * keeps its fraction (`05.25`). The descriptor is not validated here.
 */
inline std::string format_descriptor(const CalendarDescriptor& d) {
    std::string out;
    out.reserve(32 + d.timezone.size());

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d.year, std::chars_format::fixed);
    if (ec == std::errc{}) {
        out.append(buf, end);
    }
    out.push_back('-');
    detail::append_padded(out, d.month);
    out.push_back('-');
    detail::append_padded(out, d.day);
    out.push_back(' ');
    detail::append_padded(out, d.hour);
    out.push_back(':');
    detail::append_padded(out, d.minute);
    out.push_back(':');
    detail::append_padded(out, d.second);
    if (!d.timezone.empty()) {
        out.push_back(' ');
        out.append(d.timezone);
    }
    return out;
}

} // namespace tempora
