#pragma once

#include "tempora/expected.hpp"

#include <cstdint>

namespace tempora {

/**
 * @brief Broad classification of an InstantError
 */
enum class ErrorKind : uint8_t {
    invalid_descriptor, ///< A field that must be integral is not
    range,              ///< A field is outside its calendar bounds
    parse               ///< The date string was not understood
};

/**
 * @brief Error from fallible Instant construction
 *
 * Returned by Instant::parse(), Instant::from_calendar() and
 * Instant::from_input(). Construction either succeeds or returns one of
 * these; no partially built Instant is ever observable.
 */
struct InstantError {
    enum class Code : uint8_t {
        invalid_descriptor, ///< year/month/day/hour/minute not a whole number
        invalid_year,       ///< year outside ±275760
        invalid_month,      ///< month outside 1-12
        invalid_day,        ///< day outside 1..days_in_month(year, month)
        invalid_hour,       ///< hour outside [0, 24)
        invalid_minute,     ///< minute outside [0, 60)
        invalid_second,     ///< second outside [0, 60)
        unparseable_date    ///< date-string parser rejected the text
    };

    Code code;

    [[nodiscard]] constexpr ErrorKind kind() const noexcept {
        switch (code) {
            case Code::invalid_descriptor:
                return ErrorKind::invalid_descriptor;
            case Code::invalid_year:
            case Code::invalid_month:
            case Code::invalid_day:
            case Code::invalid_hour:
            case Code::invalid_minute:
            case Code::invalid_second:
                return ErrorKind::range;
            case Code::unparseable_date:
                return ErrorKind::parse;
        }
        return ErrorKind::range;
    }

    /**
     * @brief Get human-readable error message
     */
    [[nodiscard]] constexpr const char* message() const noexcept {
        switch (code) {
            case Code::invalid_descriptor:
                return "Invalid time descriptor (non-integral values are only allowed for "
                       "'second')";
            case Code::invalid_year:
                return "Invalid year";
            case Code::invalid_month:
                return "Invalid month";
            case Code::invalid_day:
                return "Invalid day";
            case Code::invalid_hour:
                return "Invalid hour";
            case Code::invalid_minute:
                return "Invalid minute";
            case Code::invalid_second:
                return "Invalid second";
            case Code::unparseable_date:
                return "Unparseable date string";
        }
        return "Unknown instant error";
    }

    constexpr bool operator==(const InstantError&) const noexcept = default;
};

/**
 * @brief Result type for fallible Instant construction
 */
template <typename T>
using InstantResult = expected<T, InstantError>;

/**
 * @brief Shorthand for returning an InstantError from a factory
 */
inline auto make_instant_error(InstantError::Code code) noexcept {
    return unexpected(InstantError{code});
}

[[nodiscard]] constexpr const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::invalid_descriptor:
            return "invalid_descriptor";
        case ErrorKind::range:
            return "range";
        case ErrorKind::parse:
            return "parse";
    }
    return "unknown";
}

} // namespace tempora
