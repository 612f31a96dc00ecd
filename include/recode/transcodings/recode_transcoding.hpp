#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <recode/core/recode_type_name.hpp>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace Recode {

/**
 * @brief A named, bidirectional conversion between one custom type and a
 * native-representable Value.
 *
 * Rules are immutable once constructed and may be shared by several
 * registries. Implementations must honour the round-trip law:
 * `decode(*encode(x)) == x` for every object x of type().
 *
 * Most rules derive from TypedTranscoding<T> or are built with
 * MakeTranscoding<T>() rather than implementing this interface directly.
 */
class Transcoding {
   public:
    virtual ~Transcoding() = default;

    /**
     * @brief The wire name written into envelopes. Must stay stable across
     * versions for previously written bytes to remain decodable.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief The C++ type this rule converts.
     */
    [[nodiscard]] virtual std::type_index type() const noexcept = 0;

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    /**
     * @brief Converts an object of type() into a Value. The result may
     * contain further objects; the transcoder reduces them recursively.
     */
    [[nodiscard]] virtual auto encode(const Object& obj) const
        -> std::expected<Value, Error> = 0;

    /**
     * @brief Rebuilds an object of type() from a payload whose nested
     * envelopes have already been decoded.
     */
    [[nodiscard]] virtual auto decode(const Value& data) const
        -> std::expected<Value, Error> = 0;
};

/**
 * @brief Base class for a rule converting values of type T.
 *
 * Derived classes implement Encode and Decode on T directly; the Object
 * wrapping and unwrapping is done here.
 *
 * @tparam T The custom type. Must be copyable and equality-comparable.
 */
template <typename T>
    requires std::copy_constructible<T> && std::equality_comparable<T>
class TypedTranscoding : public Transcoding {
   public:
    using SourceType = T;

    explicit TypedTranscoding(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::string_view name() const noexcept final {
        return name_;
    }

    [[nodiscard]] std::type_index type() const noexcept final {
        return std::type_index(typeid(T));
    }

    [[nodiscard]] std::string_view type_name() const noexcept final {
        return detail::TypeName<T>();
    }

    [[nodiscard]] auto encode(const Object& obj) const
        -> std::expected<Value, Error> final {
        const T* value = obj.get_if<T>();
        if (value == nullptr) {
            return std::unexpected(
                Error::type_mismatch(name_, obj.type_name()));
        }
        return Encode(*value);
    }

    [[nodiscard]] auto decode(const Value& data) const
        -> std::expected<Value, Error> final {
        auto result = Decode(data);
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return Value::Of(std::move(*result));
    }

   protected:
    [[nodiscard]] virtual Value Encode(const T& value) const = 0;
    [[nodiscard]] virtual std::expected<T, Error> Decode(
        const Value& data) const = 0;

    /**
     * @brief Convenience for Decode implementations rejecting a payload.
     */
    [[nodiscard]] std::unexpected<Error> Reject(std::string_view msg) const {
        return std::unexpected(Error::invalid_payload(name_, msg));
    }

   private:
    std::string name_;
};

namespace detail {

/**
 * @brief TypedTranscoding backed by two callables.
 */
template <typename T, typename EncodeFn, typename DecodeFn>
class CallableTranscoding final : public TypedTranscoding<T> {
   public:
    CallableTranscoding(std::string name, EncodeFn encode_fn,
                        DecodeFn decode_fn)
        : TypedTranscoding<T>(std::move(name)),
          encode_fn_(std::move(encode_fn)),
          decode_fn_(std::move(decode_fn)) {}

   protected:
    [[nodiscard]] Value Encode(const T& value) const override {
        return std::invoke(encode_fn_, value);
    }

    [[nodiscard]] std::expected<T, Error> Decode(
        const Value& data) const override {
        return std::invoke(decode_fn_, data);
    }

   private:
    EncodeFn encode_fn_;
    DecodeFn decode_fn_;
};

}  // namespace detail

/**
 * @brief Builds a rule for T from an encode and a decode callable.
 *
 * @tparam T The custom type.
 * @param name The wire name.
 * @param encode_fn Callable `(const T&) -> Value`.
 * @param decode_fn Callable `(const Value&) -> std::expected<T, Error>`.
 * @return The rule, ready for Registry::Register.
 */
template <typename T, typename EncodeFn, typename DecodeFn>
    requires std::is_invocable_r_v<Value, const EncodeFn&, const T&> &&
             std::is_invocable_r_v<std::expected<T, Error>, const DecodeFn&,
                                   const Value&>
[[nodiscard]] std::shared_ptr<const Transcoding> MakeTranscoding(
    std::string name, EncodeFn encode_fn, DecodeFn decode_fn) {
    return std::make_shared<
        detail::CallableTranscoding<T, EncodeFn, DecodeFn>>(
        std::move(name), std::move(encode_fn), std::move(decode_fn));
}

}  // namespace Recode
