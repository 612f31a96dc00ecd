#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <recode/codec/recode_codec.hpp>
#include <recode/codec/recode_native_codecs.hpp>
#include <recode/core/recode_options.hpp>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <recode/recode_detail.hpp>
#include <recode/registry/recode_registry.hpp>
#include <recode/transcodings/recode_builtins.hpp>
#include <recode/transcodings/recode_datetime.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <recode/transcodings/recode_tuple.hpp>
#include <recode/transcodings/recode_uuid.hpp>
#include <span>
#include <utility>

/**
 * @brief The public API for Recode.
 *
 * Recode converts Value trees, including custom objects, into bytes and back.
 * Custom types are handled by transcodings registered on each transcoder;
 * everything else is passed to a native codec.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Transcoder::Register: Adds a transcoding for a custom type.
 * - @b Transcoder::Encode: Reduces a Value to a native tree and serializes
 *   it with the codec policy.
 * - @b Transcoder::Decode: Parses bytes and rebuilds the Value, resolving
 *   every tagged envelope through the registry.
 */

namespace Recode {

/**
 * @brief Encodes and decodes Values with one registry and one native codec.
 *
 * Lifecycle: construct, register every transcoding, then encode/decode.
 * Encode, Decode, EncodeTree and DecodeTree are const, reentrant and safe
 * to call from many threads at once provided no Register call runs
 * concurrently with them.
 *
 * @tparam Codec The NativeCodec policy (codec::Json, codec::MsgPack,
 * codec::Cbor).
 */
template <NativeCodec Codec>
class Transcoder {
   public:
    using CodecType = Codec;

    /**
     * @brief Creates a transcoder with the default envelope keys
     * (`"_type_"`, `"_data_"`) and no depth limit.
     */
    Transcoder() = default;

    /**
     * @brief Creates a transcoder with custom options.
     *
     * @param options The options to use.
     * @return The transcoder, or an InvalidOptions Error.
     */
    [[nodiscard]] static std::expected<Transcoder, Error> Create(
        TranscoderOptions options) {
        if (auto err = Validate(options); err) {
            return std::unexpected(std::move(*err));
        }
        return Transcoder{std::move(options)};
    }

    /**
     * @brief Adds a transcoding. Must be called before the first
     * encode/decode.
     *
     * @return std::nullopt on success, or the Registry's Error.
     */
    [[nodiscard]] std::optional<Error> Register(
        std::shared_ptr<const Transcoding> rule) {
        return registry_.Register(std::move(rule));
    }

    template <typename Rule, typename... Args>
        requires std::derived_from<Rule, Transcoding>
    [[nodiscard]] std::optional<Error> Register(Args&&... args) {
        return registry_.Register<Rule>(std::forward<Args>(args)...);
    }

    [[nodiscard]] const Registry& registry() const noexcept {
        return registry_;
    }

    /**
     * @brief Mutable registry access for bulk registration helpers.
     */
    [[nodiscard]] Registry& registry() noexcept { return registry_; }

    [[nodiscard]] const TranscoderOptions& options() const noexcept {
        return options_;
    }

    [[nodiscard]] static constexpr Format GetFormat() noexcept {
        return Codec::GetFormat();
    }

    /**
     * @brief Reduces a Value to the native tree the codec will serialize.
     *
     * @return The native tree, or an Error (UnsupportedType, DepthExceeded,
     * or an Error returned by a transcoding).
     */
    [[nodiscard]] std::expected<NativeValue, Error> EncodeTree(
        const Value& value) const {
        return detail::Encoder{registry_, options_}(value);
    }

    /**
     * @brief Rebuilds a Value from a native tree.
     *
     * @return The value, or an Error (UnknownWireName, InvalidPayload,
     * DepthExceeded, CodecError for non-native nodes).
     */
    [[nodiscard]] std::expected<Value, Error> DecodeTree(
        const NativeValue& tree) const {
        return detail::Decoder{registry_, options_}(tree);
    }

    /**
     * @brief Encodes a Value to bytes.
     *
     * Fails without producing any output if any reachable object has no
     * transcoding.
     */
    [[nodiscard]] std::expected<Bytes, Error> Encode(const Value& value) const {
        auto tree = EncodeTree(value);
        if (!tree) {
            return std::unexpected(std::move(tree.error()));
        }
        return Codec::Serialize(*tree);
    }

    /**
     * @brief Decodes bytes produced by Encode.
     *
     * Codec parse errors are returned as CodecError carrying the codec's
     * message.
     */
    [[nodiscard]] std::expected<Value, Error> Decode(
        std::span<const std::byte> bytes) const {
        auto tree = Codec::Deserialize(bytes);
        if (!tree) {
            return std::unexpected(std::move(tree.error()));
        }
        return DecodeTree(*tree);
    }

   private:
    explicit Transcoder(TranscoderOptions options)
        : options_(std::move(options)) {}

    Registry registry_;
    TranscoderOptions options_;
};

using JsonTranscoder = Transcoder<codec::Json>;
using MsgPackTranscoder = Transcoder<codec::MsgPack>;
using CborTranscoder = Transcoder<codec::Cbor>;

}  // namespace Recode
