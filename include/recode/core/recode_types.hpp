#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Recode {

/**
 * @brief Encoded bytes produced by a native codec.
 */
using Bytes = std::vector<std::byte>;

/**
 * @brief Byte format produced by a native codec policy.
 */
enum class Format : uint8_t {
    Json = 0x01,     ///< UTF-8 JSON text.
    MsgPack = 0x02,  ///< MessagePack.
    Cbor = 0x03,     ///< CBOR (RFC 8949).
};

/**
 * @brief Error codes representing various failure conditions in Recode.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,         ///< Unknown error.
    DuplicateType,       ///< A transcoding for this type is already
                         ///< registered.
    DuplicateName,       ///< A transcoding with this wire name is already
                         ///< registered.
    InvalidTranscoding,  ///< Null rule or empty wire name.
    UnregisteredType,    ///< Registry lookup by type found nothing.
    UnregisteredName,    ///< Registry lookup by wire name found nothing.
    UnsupportedType,     ///< Encode met an object with no transcoding.
    UnknownWireName,     ///< Decode met an envelope with an unknown tag.
    InvalidPayload,      ///< A transcoding rejected its payload on decode.
    TypeMismatch,        ///< A transcoding was handed the wrong object type.
    CodecError,          ///< The native codec failed to read or write bytes.
    DepthExceeded,       ///< Nesting deeper than the configured limit.
    InvalidOptions,      ///< Transcoder options failed validation.
};

/**
 * @brief Returns a stable, human readable name for an error code.
 */
[[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DuplicateType:
            return "duplicate type";
        case ErrorCode::DuplicateName:
            return "duplicate name";
        case ErrorCode::InvalidTranscoding:
            return "invalid transcoding";
        case ErrorCode::UnregisteredType:
            return "unregistered type";
        case ErrorCode::UnregisteredName:
            return "unregistered name";
        case ErrorCode::UnsupportedType:
            return "unsupported type";
        case ErrorCode::UnknownWireName:
            return "unknown wire name";
        case ErrorCode::InvalidPayload:
            return "invalid payload";
        case ErrorCode::TypeMismatch:
            return "type mismatch";
        case ErrorCode::CodecError:
            return "codec error";
        case ErrorCode::DepthExceeded:
            return "depth exceeded";
        case ErrorCode::InvalidOptions:
            return "invalid options";
        case ErrorCode::UNKNOWN:
            break;
    }
    return "unknown";
}

/**
 * @brief Represents an error occurred during Recode operations.
 *
 * Contains an error code and a descriptive message. Messages carry the
 * offending type or wire name, so unlike a static string table they are
 * owned strings.
 */
struct Error {
    ErrorCode code;         ///< The error code.
    std::string message{};  ///< Description of the failure.

    [[nodiscard]] static Error duplicate_type(std::string_view type_name) {
        return {ErrorCode::DuplicateType,
                "a transcoding for type '" + std::string(type_name) +
                    "' is already registered"};
    }

    [[nodiscard]] static Error duplicate_name(std::string_view name) {
        return {ErrorCode::DuplicateName,
                "a transcoding named '" + std::string(name) +
                    "' is already registered"};
    }

    [[nodiscard]] static Error invalid_transcoding(std::string_view msg) {
        return {ErrorCode::InvalidTranscoding, std::string(msg)};
    }

    [[nodiscard]] static Error unregistered_type(std::string_view type_name) {
        return {ErrorCode::UnregisteredType,
                "no transcoding registered for type '" +
                    std::string(type_name) + "'"};
    }

    [[nodiscard]] static Error unregistered_name(std::string_view name) {
        return {ErrorCode::UnregisteredName,
                "no transcoding registered with name '" + std::string(name) +
                    "'"};
    }

    /**
     * @brief Encode-time failure: the object's type has no path to a native
     * representation.
     * @param type_name Readable name of the offending type.
     */
    [[nodiscard]] static Error unsupported_type(std::string_view type_name) {
        return {ErrorCode::UnsupportedType,
                "object of type '" + std::string(type_name) +
                    "' is not serializable, register a transcoding for "
                    "this type"};
    }

    /**
     * @brief Decode-time failure: an envelope names a rule this transcoder
     * does not know.
     * @param name The wire name found in the envelope.
     */
    [[nodiscard]] static Error unknown_wire_name(std::string_view name) {
        return {ErrorCode::UnknownWireName,
                "data serialized with name '" + std::string(name) +
                    "' is not deserializable, register a transcoding for "
                    "this type"};
    }

    [[nodiscard]] static Error invalid_payload(std::string_view name,
                                               std::string_view msg) {
        return {ErrorCode::InvalidPayload,
                std::string(name) + ": " + std::string(msg)};
    }

    [[nodiscard]] static Error type_mismatch(std::string_view name,
                                             std::string_view type_name) {
        return {ErrorCode::TypeMismatch,
                "transcoding '" + std::string(name) +
                    "' cannot encode an object of type '" +
                    std::string(type_name) + "'"};
    }

    [[nodiscard]] static Error codec(std::string_view msg) {
        return {ErrorCode::CodecError, std::string(msg)};
    }

    [[nodiscard]] static Error depth_exceeded(std::size_t max_depth) {
        return {ErrorCode::DepthExceeded,
                "nesting exceeds the maximum depth of " +
                    std::to_string(max_depth)};
    }

    [[nodiscard]] static Error invalid_options(std::string_view msg) {
        return {ErrorCode::InvalidOptions, std::string(msg)};
    }

    [[nodiscard]] bool operator==(const Error& other) const noexcept =
        default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

}  // namespace Recode
