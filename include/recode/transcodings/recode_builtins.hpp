#pragma once

#include <optional>
#include <recode/core/recode_types.hpp>
#include <recode/registry/recode_registry.hpp>
#include <recode/transcodings/recode_datetime.hpp>
#include <recode/transcodings/recode_tuple.hpp>
#include <recode/transcodings/recode_uuid.hpp>

namespace Recode::transcodings {

/**
 * @brief Registers the built-in transcodings: TupleAsList (`tuple_as_list`),
 * DatetimeAsIso (`datetime_iso`) and UuidAsHex (`uuid_hex`).
 *
 * @return std::nullopt on success, or the first registration Error.
 */
[[nodiscard]] inline std::optional<Error> RegisterBuiltins(
    Registry& registry) {
    if (auto err = registry.Register<TupleAsList>(); err) {
        return err;
    }
    if (auto err = registry.Register<DatetimeAsIso>(); err) {
        return err;
    }
    return registry.Register<UuidAsHex>();
}

}  // namespace Recode::transcodings
