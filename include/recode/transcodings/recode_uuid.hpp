#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <string>
#include <string_view>

namespace Recode {

/**
 * @brief A 128-bit universally unique identifier.
 */
class Uuid {
   public:
    using ByteArray = std::array<std::uint8_t, 16>;

    constexpr Uuid() noexcept = default;
    constexpr explicit Uuid(const ByteArray& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Parses a UUID from hex.
     *
     * Accepts 32 hex digits in either case, with optional hyphens, optional
     * surrounding braces, and an optional `urn:uuid:` prefix.
     *
     * @return The UUID, or std::nullopt if the text is not a UUID.
     */
    [[nodiscard]] static constexpr std::optional<Uuid> FromHex(
        std::string_view text) noexcept {
        constexpr std::string_view urn = "urn:uuid:";
        if (text.starts_with(urn)) {
            text.remove_prefix(urn.size());
        }
        if (text.starts_with('{') && text.ends_with('}')) {
            text = text.substr(1, text.size() - 2);
        }

        ByteArray bytes{};
        std::size_t nibbles = 0;
        for (const char c : text) {
            if (c == '-') {
                continue;
            }
            const int v = HexValue(c);
            if (v < 0 || nibbles == 32) {
                return std::nullopt;
            }
            auto& byte = bytes[nibbles / 2];
            byte = static_cast<std::uint8_t>((byte << 4) | v);
            ++nibbles;
        }
        if (nibbles != 32) {
            return std::nullopt;
        }
        return Uuid{bytes};
    }

    /**
     * @brief 32 lowercase hex digits, no hyphens.
     */
    [[nodiscard]] std::string ToHex() const {
        std::string out;
        out.reserve(32);
        for (const std::uint8_t b : bytes_) {
            out.push_back(kDigits[b >> 4]);
            out.push_back(kDigits[b & 0x0F]);
        }
        return out;
    }

    /**
     * @brief Canonical 8-4-4-4-12 form.
     */
    [[nodiscard]] std::string ToString() const {
        std::string hex = ToHex();
        for (const std::size_t pos : {20U, 16U, 12U, 8U}) {
            hex.insert(pos, 1, '-');
        }
        return hex;
    }

    [[nodiscard]] constexpr const ByteArray& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        return bytes_ == ByteArray{};
    }

    constexpr auto operator<=>(const Uuid&) const noexcept = default;

   private:
    static constexpr std::string_view kDigits = "0123456789abcdef";

    [[nodiscard]] static constexpr int HexValue(char c) noexcept {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    ByteArray bytes_{};
};

namespace transcodings {

/**
 * @brief Encodes a Uuid as 32 lowercase hex digits.
 */
class UuidAsHex final : public TypedTranscoding<Uuid> {
   public:
    UuidAsHex() : TypedTranscoding<Uuid>("uuid_hex") {}

   protected:
    [[nodiscard]] Value Encode(const Uuid& value) const override {
        return Value(value.ToHex());
    }

    [[nodiscard]] std::expected<Uuid, Error> Decode(
        const Value& data) const override {
        const auto* hex = data.get_if<std::string>();
        if (hex == nullptr) {
            return Reject("expected a string");
        }
        const auto uuid = Uuid::FromHex(*hex);
        if (!uuid) {
            return Reject("'" + *hex + "' is not a UUID");
        }
        return *uuid;
    }
};

}  // namespace transcodings

}  // namespace Recode
