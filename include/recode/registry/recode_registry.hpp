#pragma once

#include <algorithm>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <recode/core/recode_log.hpp>
#include <recode/core/recode_types.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Recode {

/**
 * @brief Owns the transcodings known to one transcoder, indexed both by
 * source type and by wire name.
 *
 * Both indexes always agree: a rule reachable by type is reachable by name
 * and vice versa. The registry is append-only.
 *
 * @note Register is not thread-safe. Populate the registry before any
 * encode/decode starts; afterwards concurrent lookups need no locking.
 */
class Registry {
   public:
    Registry() = default;

    /**
     * @brief Adds a rule.
     *
     * Rejects a null rule or an empty wire name, a rule for an already
     * registered type, and a rule whose wire name is taken. On rejection the
     * registry is unchanged.
     *
     * @param rule The rule to add.
     * @return std::nullopt on success, or an Error (DuplicateType,
     * DuplicateName, InvalidTranscoding).
     */
    [[nodiscard]] std::optional<Error> Register(
        std::shared_ptr<const Transcoding> rule) {
        if (!rule) {
            return Reject(Error::invalid_transcoding("transcoding is null"));
        }
        if (rule->name().empty()) {
            return Reject(Error::invalid_transcoding(
                "transcoding for type '" + std::string(rule->type_name()) +
                "' has an empty name"));
        }
        if (by_type_.contains(rule->type())) {
            return Reject(Error::duplicate_type(rule->type_name()));
        }
        if (by_name_.contains(rule->name())) {
            return Reject(Error::duplicate_name(rule->name()));
        }

        const Transcoding* raw = rule.get();
        const auto it = by_type_.emplace(raw->type(), std::move(rule)).first;
        try {
            by_name_.emplace(std::string(raw->name()), raw);
        } catch (...) {
            by_type_.erase(it);
            throw;
        }

        log::Logger().debug(
            "recode: registered transcoding '{}' for type '{}'", raw->name(),
            raw->type_name());
        return std::nullopt;
    }

    /**
     * @brief Constructs a rule in place and registers it.
     *
     * @tparam Rule A Transcoding implementation.
     * @param args Constructor arguments for Rule.
     */
    template <typename Rule, typename... Args>
        requires std::derived_from<Rule, Transcoding>
    [[nodiscard]] std::optional<Error> Register(Args&&... args) {
        return Register(
            std::make_shared<Rule>(std::forward<Args>(args)...));
    }

    /**
     * @brief Finds the rule converting objects of the given type.
     *
     * @return The rule, or an UnregisteredType Error. With only a
     * std::type_index at hand the message carries the implementation-defined
     * `type_info::name()`, which is mangled on GCC and Clang. Prefer
     * LookupByType<T>() for a readable name.
     */
    [[nodiscard]] auto LookupByType(std::type_index type) const
        -> std::expected<const Transcoding*, Error> {
        const Transcoding* rule = FindByType(type);
        if (rule == nullptr) {
            return std::unexpected(Error::unregistered_type(type.name()));
        }
        return rule;
    }

    template <typename T>
    [[nodiscard]] auto LookupByType() const
        -> std::expected<const Transcoding*, Error> {
        const Transcoding* rule = FindByType(std::type_index(typeid(T)));
        if (rule == nullptr) {
            return std::unexpected(
                Error::unregistered_type(detail::TypeName<T>()));
        }
        return rule;
    }

    /**
     * @brief Finds the rule registered under a wire name.
     *
     * @return The rule, or an UnregisteredName Error.
     */
    [[nodiscard]] auto LookupByName(std::string_view name) const
        -> std::expected<const Transcoding*, Error> {
        const Transcoding* rule = FindByName(name);
        if (rule == nullptr) {
            return std::unexpected(Error::unregistered_name(name));
        }
        return rule;
    }

    /**
     * @brief Non-failing lookups used on the encode/decode hot path.
     * @return The rule, or nullptr.
     */
    [[nodiscard]] const Transcoding* FindByType(
        std::type_index type) const noexcept {
        const auto it = by_type_.find(type);
        return it != by_type_.end() ? it->second.get() : nullptr;
    }

    [[nodiscard]] const Transcoding* FindByName(
        std::string_view name) const noexcept {
        const auto it = by_name_.find(name);
        return it != by_name_.end() ? it->second : nullptr;
    }

    [[nodiscard]] bool Contains(std::type_index type) const noexcept {
        return by_type_.contains(type);
    }

    [[nodiscard]] bool Contains(std::string_view name) const noexcept {
        return by_name_.contains(name);
    }

    [[nodiscard]] std::size_t size() const noexcept { return by_type_.size(); }

    [[nodiscard]] bool empty() const noexcept { return by_type_.empty(); }

    /**
     * @brief The registered wire names, sorted.
     */
    [[nodiscard]] std::vector<std::string_view> names() const {
        std::vector<std::string_view> result;
        result.reserve(by_name_.size());
        for (const auto& [name, rule] : by_name_) {
            result.emplace_back(rule->name());
        }
        std::ranges::sort(result);
        return result;
    }

   private:
    struct NameHash {
        using is_transparent = void;
        [[nodiscard]] std::size_t operator()(
            std::string_view name) const noexcept {
            return std::hash<std::string_view>{}(name);
        }
    };

    static std::optional<Error> Reject(Error err) {
        log::Logger().warn("recode: registration rejected: {}", err.message);
        return err;
    }

    std::unordered_map<std::type_index, std::shared_ptr<const Transcoding>>
        by_type_;
    // Points into by_type_, which owns the rules.
    std::unordered_map<std::string, const Transcoding*, NameHash,
                       std::equal_to<>>
        by_name_;
};

}  // namespace Recode
