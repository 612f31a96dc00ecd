#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <recode/core/recode_types.hpp>
#include <span>
#include <type_traits>

namespace Recode {

/**
 * @brief The restricted value tree a native codec reads and writes: null,
 * boolean, integer, floating point, string, array, and string-keyed object.
 */
using NativeValue = nlohmann::json;

/**
 * @brief Concept defining a native codec policy.
 *
 * A NativeCodec converts a NativeValue tree to bytes and back. It must
 * provide:
 * - `GetFormat()`: Returns the byte format. Must be constexpr.
 * - `Serialize(tree)`: Encodes the tree, or returns a CodecError.
 * - `Deserialize(input)`: Parses bytes into a tree, or returns a CodecError
 *   carrying the parser's message.
 *
 * Policies never throw; failures from the underlying library are reported
 * as Errors.
 */
template <typename Codec>
concept NativeCodec = requires(const NativeValue& tree,
                               std::span<const std::byte> input) {
    {
        std::bool_constant<(Codec::GetFormat(), true)>()
    } -> std::same_as<std::true_type>;
    { Codec::GetFormat() } -> std::same_as<Format>;
    { Codec::Serialize(tree) } -> std::same_as<std::expected<Bytes, Error>>;
    {
        Codec::Deserialize(input)
    } -> std::same_as<std::expected<NativeValue, Error>>;
};

}  // namespace Recode
