#pragma once

#include <cstddef>
#include <expected>
#include <initializer_list>
#include <recode/core/recode_types.hpp>
#include <recode/core/recode_value.hpp>
#include <recode/transcodings/recode_transcoding.hpp>
#include <utility>

namespace Recode {

/**
 * @brief A fixed, heterogeneous sequence of values.
 *
 * Distinct from Value::Sequence so that a tuple survives a round trip as a
 * tuple rather than decaying into a list.
 */
struct Tuple {
    Value::Sequence items;

    Tuple() = default;
    explicit Tuple(Value::Sequence values) : items(std::move(values)) {}
    Tuple(std::initializer_list<Value> values) : items(values) {}

    [[nodiscard]] std::size_t size() const noexcept { return items.size(); }

    bool operator==(const Tuple&) const = default;
};

namespace transcodings {

/**
 * @brief Encodes a Tuple as the sequence of its items.
 *
 * Items may themselves be objects; they are transcoded recursively.
 */
class TupleAsList final : public TypedTranscoding<Tuple> {
   public:
    TupleAsList() : TypedTranscoding<Tuple>("tuple_as_list") {}

   protected:
    [[nodiscard]] Value Encode(const Tuple& value) const override {
        return Value(value.items);
    }

    [[nodiscard]] std::expected<Tuple, Error> Decode(
        const Value& data) const override {
        const auto* items = data.get_if<Value::Sequence>();
        if (items == nullptr) {
            return Reject("expected a sequence");
        }
        return Tuple(*items);
    }
};

}  // namespace transcodings

}  // namespace Recode
