#pragma once

#include "tempora/detail/calendar_math.hpp"

#include <array>
#include <optional>
#include <string_view>

#include <cctype>
#include <cstdint>
#include <ctime>

namespace tempora::detail {

/**
 * Date-string parser used for Instant::parse() and calendar descriptors.
 *
 * Accepted forms (whitespace-separated pieces, case-insensitive letters):
 *
 *   Y-M-D
 *   Y-M-D[T| ]h:mm[:ss[.fff]]
 *   ...followed by an optional zone designator:
 *     Z | GMT | UTC | UT       optionally followed by an offset (GMT+2, UTC-05:30)
 *     +hh | +hhmm | +hh:mm     numeric offset (or '-')
 *     EST EDT CST CDT MST MDT PST PDT
 *
 * Zone rules:
 * - a designator fixes the offset
 * - date-only text without a designator is UTC
 * - date-time text without a designator is host local time
 *
 * Day numbers 1-31 are accepted for every month and roll over
 * (2021-02-30 is March 2nd). Fractions beyond milliseconds are truncated.
 */

namespace parser_detail {

class Cursor {
public:
    explicit constexpr Cursor(std::string_view text) noexcept : text_(text) {}

    constexpr bool done() const noexcept { return pos_ >= text_.size(); }
    constexpr char peek() const noexcept { return done() ? '\0' : text_[pos_]; }
    constexpr std::size_t pos() const noexcept { return pos_; }
    constexpr void reset(std::size_t pos) noexcept { pos_ = pos; }

    constexpr bool accept(char c) noexcept {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    constexpr bool at_digit() const noexcept { return peek() >= '0' && peek() <= '9'; }

    constexpr bool at_space() const noexcept { return peek() == ' ' || peek() == '\t'; }

    /// Skip blanks, return number skipped
    constexpr std::size_t skip_space() noexcept {
        std::size_t n = 0;
        while (at_space()) {
            ++pos_;
            ++n;
        }
        return n;
    }

    /// Read between min and max digits; nullopt if fewer than min
    constexpr std::optional<int64_t> digits(std::size_t min, std::size_t max) noexcept {
        int64_t value = 0;
        std::size_t count = 0;
        while (count < max && at_digit()) {
            value = value * 10 + (text_[pos_] - '0');
            ++pos_;
            ++count;
        }
        if (count < min) {
            return std::nullopt;
        }
        return value;
    }

    /// Case-insensitive keyword match at the cursor, not followed by a letter
    bool keyword(std::string_view word) noexcept {
        if (text_.size() - pos_ < word.size()) {
            return false;
        }
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(text_[pos_ + i])) != word[i]) {
                return false;
            }
        }
        const std::size_t end = pos_ + word.size();
        if (end < text_.size() && std::isalpha(static_cast<unsigned char>(text_[end]))) {
            return false;
        }
        pos_ = end;
        return true;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

struct ZoneAbbreviation {
    std::string_view name;
    int offset_minutes;
};

inline constexpr std::array<ZoneAbbreviation, 8> NORTH_AMERICAN_ZONES = {{
    {"EST", -5 * 60},
    {"EDT", -4 * 60},
    {"CST", -6 * 60},
    {"CDT", -5 * 60},
    {"MST", -7 * 60},
    {"MDT", -6 * 60},
    {"PST", -8 * 60},
    {"PDT", -7 * 60},
}};

// [+-]hh[[:]mm] -> signed minutes
inline std::optional<int> parse_numeric_offset(Cursor& cur) noexcept {
    int sign;
    if (cur.accept('+')) {
        sign = 1;
    } else if (cur.accept('-')) {
        sign = -1;
    } else {
        return std::nullopt;
    }

    auto hours = cur.digits(1, 2);
    if (!hours || *hours > 23) {
        return std::nullopt;
    }
    int64_t minutes = 0;
    const bool colon = cur.accept(':');
    if (colon || cur.at_digit()) {
        auto mm = cur.digits(2, 2);
        if (!mm || *mm > 59) {
            return std::nullopt;
        }
        minutes = *mm;
    }
    return sign * static_cast<int>(*hours * 60 + minutes);
}

// Zone designator -> signed minutes east of UTC
inline std::optional<int> parse_zone(Cursor& cur) noexcept {
    if (cur.keyword("GMT") || cur.keyword("UTC") || cur.keyword("UT") || cur.keyword("Z")) {
        if (cur.peek() == '+' || cur.peek() == '-') {
            return parse_numeric_offset(cur);
        }
        return 0;
    }
    for (const auto& zone : NORTH_AMERICAN_ZONES) {
        if (cur.keyword(zone.name)) {
            return zone.offset_minutes;
        }
    }
    return parse_numeric_offset(cur);
}

// Offset of host local time from UTC at the given instant, in seconds
inline int64_t local_offset_seconds(int64_t epoch_seconds) noexcept {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return 0;
    }
    return static_cast<int64_t>(local.tm_gmtoff);
}

} // namespace parser_detail

/**
 * Parse a date string into milliseconds since 1970-01-01T00:00:00Z.
 *
 * @return Epoch milliseconds, or nullopt if the text is not understood
 */
inline std::optional<double> parse_date_string(std::string_view text) noexcept {
    using parser_detail::Cursor;
    Cursor cur(text);
    cur.skip_space();

    // --- date ---
    int64_t year_sign = 1;
    if (cur.accept('-')) {
        year_sign = -1;
    } else {
        cur.accept('+');
    }
    auto year = cur.digits(1, 6);
    if (!year || !cur.accept('-')) {
        return std::nullopt;
    }
    auto month = cur.digits(1, 2);
    if (!month || !cur.accept('-')) {
        return std::nullopt;
    }
    auto day = cur.digits(1, 2);
    if (!day || *month < 1 || *month > 12 || *day < 1 || *day > 31) {
        return std::nullopt;
    }

    // --- time ---
    bool has_time = false;
    int64_t hour = 0;
    int64_t minute = 0;
    int64_t second = 0;
    int64_t millis = 0;

    const std::size_t after_date = cur.pos();
    const bool t_separator = cur.peek() == 'T' || cur.peek() == 't';
    if (t_separator) {
        cur.reset(cur.pos() + 1);
    } else {
        cur.skip_space();
    }
    if (cur.at_digit()) {
        auto hh = cur.digits(1, 2);
        if (!hh || !cur.accept(':')) {
            return std::nullopt;
        }
        auto mm = cur.digits(2, 2);
        if (!mm) {
            return std::nullopt;
        }
        hour = *hh;
        minute = *mm;
        if (cur.accept(':')) {
            auto ss = cur.digits(1, 2);
            if (!ss) {
                return std::nullopt;
            }
            second = *ss;
            if (cur.accept('.')) {
                // First three fraction digits are milliseconds, the rest is dropped
                int64_t scale = 100;
                if (!cur.at_digit()) {
                    return std::nullopt;
                }
                while (cur.at_digit()) {
                    millis += (cur.peek() - '0') * scale;
                    scale /= 10;
                    cur.reset(cur.pos() + 1);
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }
        has_time = true;
    } else if (t_separator) {
        return std::nullopt;
    } else {
        cur.reset(after_date);
    }

    // --- zone ---
    std::optional<int> zone_minutes;
    cur.skip_space();
    if (!cur.done()) {
        zone_minutes = parser_detail::parse_zone(cur);
        if (!zone_minutes) {
            return std::nullopt;
        }
        cur.skip_space();
        if (!cur.done()) {
            return std::nullopt;
        }
    }

    const int64_t days = days_from_civil(year_sign * *year, static_cast<int>(*month),
                                         static_cast<int>(*day));
    int64_t epoch_seconds = days * SECONDS_PER_DAY + hour * 3'600 + minute * 60 + second;

    if (zone_minutes) {
        epoch_seconds -= static_cast<int64_t>(*zone_minutes) * 60;
    } else if (has_time) {
        // Local wall time: resolve the offset at the guess, then once more at the
        // corrected instant so DST transitions pick the right side.
        int64_t offset = parser_detail::local_offset_seconds(epoch_seconds);
        offset = parser_detail::local_offset_seconds(epoch_seconds - offset);
        epoch_seconds -= offset;
    }

    return static_cast<double>(epoch_seconds) * 1'000.0 + static_cast<double>(millis);
}

} // namespace tempora::detail
