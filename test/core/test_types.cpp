#include <catch2/catch_test_macros.hpp>
#include <recode/core/recode_options.hpp>
#include <recode/core/recode_types.hpp>
#include <string>

using namespace Recode;

TEST_CASE("Error: equality with error code", "[types]") {
    Error err = Error::codec("bad bytes");
    REQUIRE(err == ErrorCode::CodecError);
    REQUIRE_FALSE(err == ErrorCode::InvalidPayload);
    REQUIRE(err.message == "bad bytes");
}

TEST_CASE("Error: messages name the offender", "[types]") {
    SECTION("Unsupported type") {
        Error err = Error::unsupported_type("Widget");
        REQUIRE(err.code == ErrorCode::UnsupportedType);
        REQUIRE(err.message ==
                "object of type 'Widget' is not serializable, register a "
                "transcoding for this type");
    }

    SECTION("Unknown wire name") {
        Error err = Error::unknown_wire_name("widget_v1");
        REQUIRE(err.code == ErrorCode::UnknownWireName);
        REQUIRE(err.message ==
                "data serialized with name 'widget_v1' is not "
                "deserializable, register a transcoding for this type");
    }

    SECTION("Invalid payload is prefixed with the rule name") {
        Error err = Error::invalid_payload("uuid_hex", "expected a string");
        REQUIRE(err.code == ErrorCode::InvalidPayload);
        REQUIRE(err.message == "uuid_hex: expected a string");
    }

    SECTION("Depth exceeded carries the limit") {
        Error err = Error::depth_exceeded(16);
        REQUIRE(err.code == ErrorCode::DepthExceeded);
        REQUIRE(err.message.find("16") != std::string::npos);
    }

    SECTION("Duplicates") {
        REQUIRE(Error::duplicate_name("a").message.find("'a'") !=
                std::string::npos);
        REQUIRE(Error::duplicate_type("T").message.find("'T'") !=
                std::string::npos);
    }
}

TEST_CASE("ErrorCode: names", "[types]") {
    REQUIRE(ToString(ErrorCode::DuplicateType) == "duplicate type");
    REQUIRE(ToString(ErrorCode::UnknownWireName) == "unknown wire name");
    REQUIRE(ToString(ErrorCode::DepthExceeded) == "depth exceeded");
    REQUIRE(ToString(ErrorCode::UNKNOWN) == "unknown");
    static_assert(ToString(ErrorCode::CodecError) == "codec error");
}

TEST_CASE("TranscoderOptions: defaults", "[types]") {
    TranscoderOptions options;
    REQUIRE(options.keys.type_key == "_type_");
    REQUIRE(options.keys.data_key == "_data_");
    REQUIRE(options.max_depth == 0);
    REQUIRE_FALSE(Validate(options).has_value());
}

TEST_CASE("TranscoderOptions: validation", "[types]") {
    TranscoderOptions options;

    SECTION("Empty type key") {
        options.keys.type_key.clear();
        auto err = Validate(options);
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::InvalidOptions);
    }

    SECTION("Empty data key") {
        options.keys.data_key.clear();
        REQUIRE(Validate(options).has_value());
    }

    SECTION("Identical keys") {
        options.keys = {"k", "k"};
        auto err = Validate(options);
        REQUIRE(err.has_value());
        REQUIRE(err->message == "envelope keys must be distinct");
    }

    SECTION("Custom distinct keys") {
        options.keys = {"$t", "$d"};
        options.max_depth = 8;
        REQUIRE_FALSE(Validate(options).has_value());
    }
}
