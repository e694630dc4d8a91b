#pragma once

#include "tempora/breakdown.hpp"
#include "tempora/duration.hpp"
#include "tempora/expected.hpp"
#include "tempora/instant.hpp"
#include "tempora/time_unit.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tempora::json {

/**
 * @brief Error from decoding a JSON document
 *
 * `offset` is the byte position RapidJSON stopped at for malformed text,
 * and 0 for structural errors found after parsing.
 */
struct JsonError {
    enum class Code : uint8_t {
        malformed,     ///< Not valid JSON
        not_an_object, ///< Expected a JSON object
        missing_field, ///< Required member absent ("unixEpoch")
        unknown_unit,  ///< Member name is not a TimeUnit name
        not_a_number   ///< Unit amount is not a number
    };

    Code code;
    std::size_t offset{0};

    [[nodiscard]] constexpr const char* message() const noexcept {
        switch (code) {
            case Code::malformed:
                return "Malformed JSON";
            case Code::not_an_object:
                return "Expected a JSON object";
            case Code::missing_field:
                return "Missing required field";
            case Code::unknown_unit:
                return "Unknown time unit";
            case Code::not_a_number:
                return "Unit amount is not a number";
        }
        return "Unknown JSON error";
    }
};

template <typename T>
using JsonResult = expected<T, JsonError>;

/// Member name used for the serialized Instant offset
inline constexpr std::string_view UNIX_EPOCH_KEY = "unixEpoch";

namespace detail {

// NaN and infinity are written as bare tokens so they survive a round trip
using Writer = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                 rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

inline constexpr unsigned PARSE_FLAGS =
    rapidjson::kParseNanAndInfFlag | rapidjson::kParseFullPrecisionFlag;

inline void write_breakdown(Writer& writer, const Breakdown& breakdown) {
    writer.StartObject();
    for (const auto& [unit, amount] : breakdown) {
        const std::string_view name = unit_name(unit);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Double(amount);
    }
    writer.EndObject();
}

inline JsonResult<Breakdown> read_breakdown(const rapidjson::Value& value) {
    if (!value.IsObject()) {
        return unexpected(JsonError{JsonError::Code::not_an_object});
    }
    Breakdown out;
    for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
        const std::string_view name(it->name.GetString(), it->name.GetStringLength());
        auto unit = parse_unit(name);
        if (!unit) {
            return unexpected(JsonError{JsonError::Code::unknown_unit});
        }
        if (!it->value.IsNumber()) {
            return unexpected(JsonError{JsonError::Code::not_a_number});
        }
        out.set(*unit, it->value.GetDouble());
    }
    return out;
}

inline expected<void, JsonError> parse_document(rapidjson::Document& doc, std::string_view text) {
    doc.Parse<PARSE_FLAGS>(text.data(), text.size());
    if (doc.HasParseError()) {
        return unexpected(JsonError{JsonError::Code::malformed, doc.GetErrorOffset()});
    }
    return {};
}

} // namespace detail

/// Encode a Breakdown as a flat object of unit name to amount
inline std::string to_json(const Breakdown& breakdown) {
    rapidjson::StringBuffer buffer;
    detail::Writer writer(buffer);
    detail::write_breakdown(writer, breakdown);
    return std::string(buffer.GetString(), buffer.GetSize());
}

/// `{"milliseconds": <value>}`
inline std::string to_json(const Duration& duration) {
    return to_json(duration.serialize());
}

/// `{"unixEpoch": {"days": ..., "hours": ..., ...}}`
inline std::string to_json(const Instant& instant) {
    rapidjson::StringBuffer buffer;
    detail::Writer writer(buffer);
    writer.StartObject();
    writer.Key(UNIX_EPOCH_KEY.data(), static_cast<rapidjson::SizeType>(UNIX_EPOCH_KEY.size()));
    detail::write_breakdown(writer, instant.serialize().unix_epoch);
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

/**
 * Decode a Duration from any unit breakdown object.
 *
 * `{"milliseconds": 5400000}` and `{"hours": 1, "minutes": 30}` decode to
 * the same Duration.
 */
inline JsonResult<Duration> duration_from_json(std::string_view text) {
    rapidjson::Document doc;
    if (auto parsed = detail::parse_document(doc, text); !parsed) {
        return unexpected(parsed.error());
    }
    return detail::read_breakdown(doc).map([](const Breakdown& b) { return Duration(b); });
}

/// Decode an Instant from `{"unixEpoch": {...}}`
inline JsonResult<Instant> instant_from_json(std::string_view text) {
    rapidjson::Document doc;
    if (auto parsed = detail::parse_document(doc, text); !parsed) {
        return unexpected(parsed.error());
    }
    if (!doc.IsObject()) {
        return unexpected(JsonError{JsonError::Code::not_an_object});
    }
    auto member = doc.FindMember(UNIX_EPOCH_KEY.data());
    if (member == doc.MemberEnd()) {
        return unexpected(JsonError{JsonError::Code::missing_field});
    }
    return detail::read_breakdown(member->value).map([](const Breakdown& b) {
        return Instant(EpochBreakdown{b});
    });
}

} // namespace tempora::json
