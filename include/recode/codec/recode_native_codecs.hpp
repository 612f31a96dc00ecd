#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <nlohmann/json.hpp>
#include <recode/codec/recode_codec.hpp>
#include <recode/core/recode_types.hpp>
#include <span>
#include <string>
#include <vector>

/**
 * @brief Native codec policies backed by nlohmann/json.
 */
namespace Recode::codec {

namespace detail {

template <typename Container>
[[nodiscard]] Bytes ToBytes(const Container& src) {
    Bytes out(src.size());
    if (!src.empty()) {
        std::memcpy(out.data(), src.data(), src.size());
    }
    return out;
}

[[nodiscard]] inline const std::uint8_t* Begin(
    std::span<const std::byte> input) noexcept {
    return reinterpret_cast<const std::uint8_t*>(input.data());
}

[[nodiscard]] inline const std::uint8_t* End(
    std::span<const std::byte> input) noexcept {
    return Begin(input) + input.size();
}

}  // namespace detail

/**
 * @brief UTF-8 JSON text.
 *
 * Strings must be valid UTF-8. Non-finite floats are written as `null`, the
 * way nlohmann/json writes them.
 */
struct Json {
    [[nodiscard]] static constexpr Format GetFormat() noexcept {
        return Format::Json;
    }

    [[nodiscard]] static std::expected<Bytes, Error> Serialize(
        const NativeValue& tree) {
        try {
            return detail::ToBytes(tree.dump());
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }

    [[nodiscard]] static std::expected<NativeValue, Error> Deserialize(
        std::span<const std::byte> input) {
        try {
            return NativeValue::parse(detail::Begin(input),
                                      detail::End(input));
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }
};

/**
 * @brief MessagePack.
 */
struct MsgPack {
    [[nodiscard]] static constexpr Format GetFormat() noexcept {
        return Format::MsgPack;
    }

    [[nodiscard]] static std::expected<Bytes, Error> Serialize(
        const NativeValue& tree) {
        try {
            return detail::ToBytes(NativeValue::to_msgpack(tree));
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }

    [[nodiscard]] static std::expected<NativeValue, Error> Deserialize(
        std::span<const std::byte> input) {
        try {
            return NativeValue::from_msgpack(detail::Begin(input),
                                             detail::End(input));
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }
};

/**
 * @brief CBOR (RFC 8949).
 */
struct Cbor {
    [[nodiscard]] static constexpr Format GetFormat() noexcept {
        return Format::Cbor;
    }

    [[nodiscard]] static std::expected<Bytes, Error> Serialize(
        const NativeValue& tree) {
        try {
            return detail::ToBytes(NativeValue::to_cbor(tree));
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }

    [[nodiscard]] static std::expected<NativeValue, Error> Deserialize(
        std::span<const std::byte> input) {
        try {
            return NativeValue::from_cbor(detail::Begin(input),
                                          detail::End(input));
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(Error::codec(e.what()));
        }
    }
};

static_assert(NativeCodec<Json>);
static_assert(NativeCodec<MsgPack>);
static_assert(NativeCodec<Cbor>);

}  // namespace Recode::codec
