#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <string>
#include <string_view>

namespace Recode {

/**
 * @brief A UTC point in time with microsecond resolution.
 */
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

namespace detail {

/**
 * @brief Reads a fixed-width unsigned decimal field.
 */
[[nodiscard]] constexpr std::optional<int> ReadDigits(std::string_view text,
                                                      std::size_t pos,
                                                      std::size_t width) {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace detail

/**
 * @brief Formats a timestamp as ISO-8601 with a `+00:00` offset.
 *
 * The fraction is written with six digits and omitted when zero, e.g.
 * `2024-02-29T13:45:00.250000+00:00` or `2024-02-29T13:45:00+00:00`.
 */
[[nodiscard]] inline std::string ToIsoString(Timestamp ts) {
    using namespace std::chrono;
    const auto day = floor<days>(ts);
    const year_month_day ymd{day};
    const hh_mm_ss<microseconds> hms{ts - day};

    std::string out = std::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    if (const auto micros = hms.subseconds().count(); micros != 0) {
        out += std::format(".{:06}", micros);
    }
    out += "+00:00";
    return out;
}

/**
 * @brief Parses an ISO-8601 timestamp.
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS`, an optional fraction of 1 to 6 digits, and
 * an optional offset (`Z` or `+HH:MM`/`-HH:MM`). A missing offset means
 * UTC. The result is normalised to UTC.
 *
 * @return The timestamp, or std::nullopt if the text is malformed or names
 * an invalid date.
 */
[[nodiscard]] inline std::optional<Timestamp> FromIsoString(
    std::string_view text) {
    using namespace std::chrono;

    const auto year = detail::ReadDigits(text, 0, 4);
    const auto month = detail::ReadDigits(text, 5, 2);
    const auto mday = detail::ReadDigits(text, 8, 2);
    const auto hour = detail::ReadDigits(text, 11, 2);
    const auto minute = detail::ReadDigits(text, 14, 2);
    const auto second = detail::ReadDigits(text, 17, 2);
    if (!year || !month || !mday || !hour || !minute || !second ||
        text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    if (*hour > 23 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }

    const year_month_day ymd{std::chrono::year{*year},
                             std::chrono::month{static_cast<unsigned>(*month)},
                             std::chrono::day{static_cast<unsigned>(*mday)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (++digits > 6) {
                return std::nullopt;
            }
            micros = micros * 10 + (text[pos] - '0');
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }

    minutes offset{0};
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' && pos + 1 == text.size()) {
            pos += 1;
        } else if (sign == '+' || sign == '-') {
            const auto off_h = detail::ReadDigits(text, pos + 1, 2);
            const auto off_m = detail::ReadDigits(text, pos + 4, 2);
            if (!off_h || !off_m || text[pos + 3] != ':' ||
                pos + 6 != text.size() || *off_h > 23 || *off_m > 59) {
                return std::nullopt;
            }
            offset = hours{*off_h} + minutes{*off_m};
            if (sign == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }

    const Timestamp local = sys_days{ymd} + hours{*hour} + minutes{*minute} +
                            seconds{*second} + microseconds{micros};
    return local - offset;
}

namespace transcodings {

/**
 * @brief Encodes a Timestamp as an ISO-8601 string.
 */
class DatetimeAsIso final : public TypedTranscoding<Timestamp> {
   public:
    DatetimeAsIso() : TypedTranscoding<Timestamp>("datetime_iso") {}

   protected:
    [[nodiscard]] Value Encode(const Timestamp& value) const override {
        return Value(ToIsoString(value));
    }

    [[nodiscard]] std::expected<Timestamp, Error> Decode(
        const Value& data) const override {
        const auto* text = data.get_if<std::string>();
        if (text == nullptr) {
            return Reject("expected a string");
        }
        const auto ts = FromIsoString(*text);
        if (!ts) {
            return Reject("'" + *text + "' is not an ISO-8601 timestamp");
        }
        return *ts;
    }
};

}  // namespace transcodings

}  // namespace Recode
