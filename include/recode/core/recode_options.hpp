#pragma once

#include <cstddef>
#include <optional>
#include <recode/core/recode_types.hpp>
#include <string>

namespace Recode {

/**
 * @brief The two reserved keys marking a tagged envelope on the wire.
 *
 * Any decoded mapping whose key set is exactly {type_key, data_key} is read
 * as an envelope. Changing the keys changes the wire format, so bytes
 * written with one pair are not decodable with another.
 */
struct EnvelopeKeys {
    std::string type_key{"_type_"};
    std::string data_key{"_data_"};

    bool operator==(const EnvelopeKeys&) const = default;
};

/**
 * @brief Per-transcoder configuration.
 */
struct TranscoderOptions {
    EnvelopeKeys keys{};
    // Maximum number of containers/envelopes enclosing a value. 0 means
    // unlimited (bounded by the call stack only).
    std::size_t max_depth{0};

    bool operator==(const TranscoderOptions&) const = default;
};

/**
 * @brief Validates transcoder options.
 *
 * @return std::nullopt if the envelope keys are non-empty and distinct, or
 * an InvalidOptions Error.
 */
[[nodiscard]] inline std::optional<Error> Validate(
    const TranscoderOptions& options) {
    if (options.keys.type_key.empty() || options.keys.data_key.empty()) {
        return Error::invalid_options("envelope keys must not be empty");
    }
    if (options.keys.type_key == options.keys.data_key) {
        return Error::invalid_options("envelope keys must be distinct");
    }
    return std::nullopt;
}

}  // namespace Recode
