#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <recode/core/recode_type_name.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace Recode {

class Value;

/**
 * @brief A type-erased, immutable custom value.
 *
 * Holds one instance of any copyable, equality-comparable type behind a
 * shared holder, so copying a Value tree never deep-copies custom objects.
 * Objects are what transcodings convert to and from native values.
 */
class Object {
   public:
    template <typename T>
        requires std::copy_constructible<std::remove_cvref_t<T>> &&
                 std::equality_comparable<std::remove_cvref_t<T>>
    [[nodiscard]] static Object Make(T&& value) {
        using Stored = std::remove_cvref_t<T>;
        return Object{
            std::make_shared<Model<Stored>>(std::forward<T>(value))};
    }

    /**
     * @brief Runtime type of the held value, the key used for registry
     * dispatch.
     */
    [[nodiscard]] std::type_index type() const noexcept {
        return holder_->type();
    }

    [[nodiscard]] std::string_view type_name() const noexcept {
        return holder_->type_name();
    }

    template <typename T>
    [[nodiscard]] bool holds() const noexcept {
        return holder_->type() == std::type_index(typeid(T));
    }

    /**
     * @brief Returns a pointer to the held value, or nullptr when the object
     * holds another type.
     */
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        if (!holds<T>()) {
            return nullptr;
        }
        return static_cast<const T*>(holder_->address());
    }

    [[nodiscard]] bool operator==(const Object& other) const {
        if (holder_ == other.holder_) {
            return true;
        }
        return holder_->type() == other.holder_->type() &&
               holder_->equals(*other.holder_);
    }

   private:
    struct Holder {
        virtual ~Holder() = default;
        [[nodiscard]] virtual std::type_index type() const noexcept = 0;
        [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;
        [[nodiscard]] virtual const void* address() const noexcept = 0;
        // Only called when type() matches.
        [[nodiscard]] virtual bool equals(const Holder& other) const = 0;
    };

    template <typename T>
    struct Model final : Holder {
        template <typename U>
        explicit Model(U&& v) : value(std::forward<U>(v)) {}

        [[nodiscard]] std::type_index type() const noexcept override {
            return std::type_index(typeid(T));
        }
        [[nodiscard]] std::string_view type_name() const noexcept override {
            return detail::TypeName<T>();
        }
        [[nodiscard]] const void* address() const noexcept override {
            return &value;
        }
        [[nodiscard]] bool equals(const Holder& other) const override {
            return value == static_cast<const Model&>(other).value;
        }

        T value;
    };

    explicit Object(std::shared_ptr<const Holder> holder)
        : holder_(std::move(holder)) {}

    std::shared_ptr<const Holder> holder_;
};

/**
 * @brief The in-memory value space handed to a transcoder.
 *
 * A closed sum of the native kinds plus Object for custom types. Every
 * integral type widens to int64_t and every floating point type to double.
 */
class Value {
   public:
    using Sequence = std::vector<Value>;
    using Mapping = std::map<std::string, Value, std::less<>>;

    /**
     * @brief True for the types stored directly in a Value rather than
     * wrapped in an Object.
     */
    template <typename T>
    static constexpr bool is_alternative =
        std::same_as<T, std::nullptr_t> || std::same_as<T, bool> ||
        std::same_as<T, std::int64_t> || std::same_as<T, double> ||
        std::same_as<T, std::string> || std::same_as<T, Sequence> ||
        std::same_as<T, Mapping> || std::same_as<T, Object>;

    /**
     * @brief Kind tag, in the order of the underlying variant alternatives.
     */
    enum class Kind : uint8_t {
        Null = 0,
        Bool,
        Integer,
        Float,
        String,
        Sequence,
        Mapping,
        Object,
    };

    Value() noexcept = default;
    // cppcheck-suppress noExplicitConstructor
    Value(std::nullptr_t) noexcept {}
    // cppcheck-suppress noExplicitConstructor
    Value(bool b) noexcept : storage_(b) {}

    /**
     * @brief Integers that always fit in int64_t: every signed type and
     * unsigned types narrower than 64 bits.
     */
    template <std::integral I>
        requires(!std::same_as<I, bool> &&
                 (std::is_signed_v<I> || sizeof(I) < sizeof(std::int64_t)))
    // cppcheck-suppress noExplicitConstructor
    Value(I i) noexcept : storage_(static_cast<std::int64_t>(i)) {}

    // 64-bit unsigned values may not fit; use FromUnsigned.
    template <std::unsigned_integral U>
        requires(!std::same_as<U, bool> &&
                 sizeof(U) >= sizeof(std::int64_t))
    Value(U) = delete;

    template <std::floating_point F>
    // cppcheck-suppress noExplicitConstructor
    Value(F f) noexcept : storage_(static_cast<double>(f)) {}

    // cppcheck-suppress noExplicitConstructor
    Value(const char* s) : storage_(std::string(s)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(std::string_view s) : storage_(std::string(s)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(std::string s) noexcept : storage_(std::move(s)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Sequence seq) noexcept : storage_(std::move(seq)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Mapping map) noexcept : storage_(std::move(map)) {}
    // cppcheck-suppress noExplicitConstructor
    Value(Object obj) noexcept : storage_(std::move(obj)) {}

    /**
     * @brief Wraps a custom value as an Object.
     *
     * @tparam T Any copyable, equality-comparable type other than the native
     * ones (arithmetic, string-like, the Value alternatives), which are
     * stored directly. Encoding it requires a transcoding registered for T.
     */
    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, Value> &&
                 !is_alternative<std::remove_cvref_t<T>> &&
                 !std::is_arithmetic_v<std::remove_cvref_t<T>> &&
                 !std::is_convertible_v<T, std::string_view>)
    [[nodiscard]] static Value Of(T&& value) {
        return Value{Object::Make(std::forward<T>(value))};
    }

    /**
     * @brief Checked conversion of a 64-bit unsigned integer.
     *
     * @return The integer value, or std::nullopt if it exceeds INT64_MAX.
     */
    [[nodiscard]] static std::optional<Value> FromUnsigned(
        std::uint64_t u) noexcept {
        if (u > static_cast<std::uint64_t>(
                    std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return Value(static_cast<std::int64_t>(u));
    }

    [[nodiscard]] Kind kind() const noexcept {
        return static_cast<Kind>(storage_.index());
    }

    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == Kind::Bool; }
    [[nodiscard]] bool is_integer() const noexcept {
        return kind() == Kind::Integer;
    }
    [[nodiscard]] bool is_float() const noexcept {
        return kind() == Kind::Float;
    }
    [[nodiscard]] bool is_string() const noexcept {
        return kind() == Kind::String;
    }
    [[nodiscard]] bool is_sequence() const noexcept {
        return kind() == Kind::Sequence;
    }
    [[nodiscard]] bool is_mapping() const noexcept {
        return kind() == Kind::Mapping;
    }
    [[nodiscard]] bool is_object() const noexcept {
        return kind() == Kind::Object;
    }

    /**
     * @brief Checks whether the value holds T.
     *
     * T is either one of the native alternatives (bool, std::int64_t, double,
     * std::string, Sequence, Mapping, Object, std::nullptr_t) or a custom
     * type wrapped in an Object.
     */
    template <typename T>
    [[nodiscard]] bool holds() const noexcept {
        return get_if<T>() != nullptr;
    }

    /**
     * @brief Returns a pointer to the held T, or nullptr on a kind or type
     * mismatch. Looks through Object for custom types.
     */
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        if constexpr (is_alternative<T>) {
            return std::get_if<T>(&storage_);
        } else {
            const auto* obj = std::get_if<Object>(&storage_);
            return obj != nullptr ? obj->get_if<T>() : nullptr;
        }
    }

    template <typename T>
        requires is_alternative<T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&storage_);
    }

    /**
     * @brief Structural equality. Mapping comparison ignores insertion order
     * and objects compare by type and value.
     */
    [[nodiscard]] bool operator==(const Value& other) const = default;

   private:
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double,
                                 std::string, Sequence, Mapping, Object>;

    Storage storage_{nullptr};
};

/**
 * @brief Readable name of a value kind.
 */
[[nodiscard]] constexpr std::string_view ToString(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::Null:
            return "null";
        case Value::Kind::Bool:
            return "bool";
        case Value::Kind::Integer:
            return "integer";
        case Value::Kind::Float:
            return "float";
        case Value::Kind::String:
            return "string";
        case Value::Kind::Sequence:
            return "sequence";
        case Value::Kind::Mapping:
            return "mapping";
        case Value::Kind::Object:
            return "object";
    }
    return "unknown";
}

}  // namespace Recode
