#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <recode/codec/recode_codec.hpp>
#include <recode/core/recode_log.hpp>
#include <recode/core/recode_options.hpp>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <recode/registry/recode_registry.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <string>
#include <utility>

/**
 * @brief Internal implementation details for Recode's public API.
 */
namespace Recode::detail {

/**
 * @brief Logs a failure at the point it is created and hands it back for
 * propagation.
 */
[[nodiscard]] inline std::unexpected<Error> Fail(Error err) {
    log::Logger().debug("recode: {}: {}", ToString(err.code), err.message);
    return std::unexpected(std::move(err));
}

/**
 * @brief Reduces a Value tree to a native tree.
 *
 * Depth-first, pre-order. Native scalars are copied, containers are rebuilt
 * element by element, and every Object is replaced by the envelope
 * `{type_key: rule.name(), data_key: <reduced rule.encode(obj)>}`. The rule
 * output is itself reduced, so objects whose representation contains other
 * objects need no special handling.
 */
class Encoder {
   public:
    Encoder(const Registry& registry, const TranscoderOptions& options) noexcept
        : registry_(registry), options_(options) {}

    [[nodiscard]] std::expected<NativeValue, Error> operator()(
        const Value& value) const {
        return Encode(value, 0);
    }

   private:
    [[nodiscard]] std::expected<NativeValue, Error> Encode(
        const Value& value, std::size_t depth) const {
        if (options_.max_depth != 0 && depth > options_.max_depth) {
            return Fail(Error::depth_exceeded(options_.max_depth));
        }

        switch (value.kind()) {
            case Value::Kind::Null:
                return NativeValue(nullptr);
            case Value::Kind::Bool:
                return NativeValue(*value.get_if<bool>());
            case Value::Kind::Integer:
                return NativeValue(*value.get_if<std::int64_t>());
            case Value::Kind::Float:
                return NativeValue(*value.get_if<double>());
            case Value::Kind::String:
                return NativeValue(*value.get_if<std::string>());
            case Value::Kind::Sequence:
                return EncodeSequence(*value.get_if<Value::Sequence>(), depth);
            case Value::Kind::Mapping:
                return EncodeMapping(*value.get_if<Value::Mapping>(), depth);
            case Value::Kind::Object:
                return EncodeObject(*value.get_if<Object>(), depth);
        }
        return Fail(Error::codec("value has an unknown kind"));
    }

    [[nodiscard]] std::expected<NativeValue, Error> EncodeSequence(
        const Value::Sequence& seq, std::size_t depth) const {
        NativeValue out = NativeValue::array();
        auto& items = out.get_ref<NativeValue::array_t&>();
        items.reserve(seq.size());
        for (const Value& item : seq) {
            auto encoded = Encode(item, depth + 1);
            if (!encoded) {
                return encoded;
            }
            items.push_back(std::move(*encoded));
        }
        return out;
    }

    [[nodiscard]] std::expected<NativeValue, Error> EncodeMapping(
        const Value::Mapping& map, std::size_t depth) const {
        NativeValue out = NativeValue::object();
        auto& members = out.get_ref<NativeValue::object_t&>();
        for (const auto& [key, item] : map) {
            auto encoded = Encode(item, depth + 1);
            if (!encoded) {
                return encoded;
            }
            // Both maps order keys the same way.
            members.emplace_hint(members.end(), key, std::move(*encoded));
        }
        return out;
    }

    [[nodiscard]] std::expected<NativeValue, Error> EncodeObject(
        const Object& obj, std::size_t depth) const {
        const Transcoding* rule = registry_.FindByType(obj.type());
        if (rule == nullptr) {
            return Fail(Error::unsupported_type(obj.type_name()));
        }

        auto payload = rule->encode(obj);
        if (!payload) {
            return Fail(std::move(payload.error()));
        }

        // Re-enter with the rule output, not the original object.
        auto data = Encode(*payload, depth + 1);
        if (!data) {
            return data;
        }

        NativeValue envelope = NativeValue::object();
        envelope.emplace(options_.keys.type_key, std::string(rule->name()));
        envelope.emplace(options_.keys.data_key, std::move(*data));
        return envelope;
    }

    const Registry& registry_;
    const TranscoderOptions& options_;
};

/**
 * @brief Rebuilds a Value tree from a native tree.
 *
 * A single recursive pass producing new containers bottom-up; the native
 * tree is never modified. At each mapping the members are decoded first,
 * then a mapping whose key set is exactly {type_key, data_key} is replaced
 * by the owning rule's decode of its payload.
 *
 * @note A user mapping that happens to carry exactly the two reserved keys
 * is indistinguishable from an envelope and is decoded as one.
 */
class Decoder {
   public:
    Decoder(const Registry& registry, const TranscoderOptions& options) noexcept
        : registry_(registry), options_(options) {}

    [[nodiscard]] std::expected<Value, Error> operator()(
        const NativeValue& node) const {
        return Decode(node, 0);
    }

   private:
    [[nodiscard]] std::expected<Value, Error> Decode(const NativeValue& node,
                                                     std::size_t depth) const {
        if (options_.max_depth != 0 && depth > options_.max_depth) {
            return Fail(Error::depth_exceeded(options_.max_depth));
        }

        using Type = NativeValue::value_t;
        switch (node.type()) {
            case Type::null:
                return Value{};
            case Type::boolean:
                return Value(node.get<bool>());
            case Type::number_integer:
                return Value(node.get<std::int64_t>());
            case Type::number_unsigned: {
                // Binary codecs report every non-negative integer as
                // unsigned.
                const auto u = node.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(
                            std::numeric_limits<std::int64_t>::max())) {
                    return Fail(Error::codec(
                        "integer " + std::to_string(u) +
                        " does not fit in a signed 64-bit integer"));
                }
                return Value(static_cast<std::int64_t>(u));
            }
            case Type::number_float:
                return Value(node.get<double>());
            case Type::string:
                return Value(node.get_ref<const std::string&>());
            case Type::array:
                return DecodeSequence(node, depth);
            case Type::object:
                return DecodeMapping(node, depth);
            case Type::binary:
                return Fail(Error::codec("binary data is not a native value"));
            case Type::discarded:
                break;
        }
        return Fail(Error::codec("discarded value in native tree"));
    }

    [[nodiscard]] std::expected<Value, Error> DecodeSequence(
        const NativeValue& node, std::size_t depth) const {
        Value::Sequence seq;
        seq.reserve(node.size());
        for (const NativeValue& item : node) {
            auto decoded = Decode(item, depth + 1);
            if (!decoded) {
                return decoded;
            }
            seq.push_back(std::move(*decoded));
        }
        return Value(std::move(seq));
    }

    [[nodiscard]] std::expected<Value, Error> DecodeMapping(
        const NativeValue& node, std::size_t depth) const {
        Value::Mapping map;
        for (const auto& [key, item] :
             node.get_ref<const NativeValue::object_t&>()) {
            auto decoded = Decode(item, depth + 1);
            if (!decoded) {
                return decoded;
            }
            map.emplace_hint(map.end(), key, std::move(*decoded));
        }

        if (map.size() != 2) {
            return Value(std::move(map));
        }
        const auto tag = map.find(options_.keys.type_key);
        const auto data = map.find(options_.keys.data_key);
        if (tag == map.end() || data == map.end()) {
            return Value(std::move(map));
        }

        const auto* name = tag->second.get_if<std::string>();
        if (name == nullptr) {
            return Fail({ErrorCode::UnknownWireName,
                         "envelope type tag must be a string, got " +
                             std::string(ToString(tag->second.kind()))});
        }
        const Transcoding* rule = registry_.FindByName(*name);
        if (rule == nullptr) {
            return Fail(Error::unknown_wire_name(*name));
        }

        auto decoded = rule->decode(data->second);
        if (!decoded) {
            return Fail(std::move(decoded.error()));
        }
        return decoded;
    }

    const Registry& registry_;
    const TranscoderOptions& options_;
};

}  // namespace Recode::detail
