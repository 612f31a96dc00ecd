#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <recode/registry/recode_registry.hpp>
#include <recode/transcodings/recode_builtins.hpp>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "../test_types.hpp"

using namespace Recode;

TEST_CASE("Registry: lookup by type and by name", "[registry]") {
    Registry registry;
    REQUIRE(registry.empty());
    REQUIRE_FALSE(registry.Register(MyIntAsInt()).has_value());
    REQUIRE(registry.size() == 1);

    auto by_type = registry.LookupByType<MyInt>();
    REQUIRE(by_type.has_value());
    REQUIRE((*by_type)->name() == "myint_as_int");

    auto by_name = registry.LookupByName("myint_as_int");
    REQUIRE(by_name.has_value());
    REQUIRE(*by_name == *by_type);

    REQUIRE(registry.LookupByType(std::type_index(typeid(MyInt))).value() ==
            *by_type);
    REQUIRE(registry.Contains(std::type_index(typeid(MyInt))));
    REQUIRE(registry.Contains("myint_as_int"));
}

TEST_CASE("Registry: missing entries", "[registry]") {
    Registry registry;

    auto by_type = registry.LookupByType<MyInt>();
    REQUIRE_FALSE(by_type.has_value());
    REQUIRE(by_type.error().code == ErrorCode::UnregisteredType);

    auto by_name = registry.LookupByName("nope");
    REQUIRE_FALSE(by_name.has_value());
    REQUIRE(by_name.error().code == ErrorCode::UnregisteredName);
    REQUIRE(by_name.error().message.find("'nope'") != std::string::npos);

    REQUIRE(registry.FindByName("nope") == nullptr);
    REQUIRE(registry.FindByType(std::type_index(typeid(MyInt))) == nullptr);
}

TEST_CASE("Registry: rejected registrations leave it unchanged",
          "[registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.Register(MyIntAsInt()).has_value());
    const Transcoding* original = registry.FindByName("myint_as_int");

    SECTION("Same type under another name") {
        auto err = registry.Register(MakeTranscoding<MyInt>(
            "myint_v2", [](const MyInt& v) { return Value(v.value); },
            [](const Value&) -> std::expected<MyInt, Error> {
                return MyInt{0};
            }));
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::DuplicateType);
        REQUIRE_FALSE(registry.Contains("myint_v2"));
    }

    SECTION("Another type under the same name") {
        auto err = registry.Register(MakeTranscoding<MyStr>(
            "myint_as_int", [](const MyStr& v) { return Value(v.value); },
            [](const Value&) -> std::expected<MyStr, Error> {
                return MyStr{};
            }));
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::DuplicateName);
        REQUIRE_FALSE(registry.Contains(std::type_index(typeid(MyStr))));
    }

    SECTION("Null rule") {
        auto err = registry.Register(nullptr);
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::InvalidTranscoding);
    }

    SECTION("Empty name") {
        auto err = registry.Register(MakeTranscoding<MyStr>(
            "", [](const MyStr& v) { return Value(v.value); },
            [](const Value&) -> std::expected<MyStr, Error> {
                return MyStr{};
            }));
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::InvalidTranscoding);
    }

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.FindByName("myint_as_int") == original);
    REQUIRE(registry.FindByType(std::type_index(typeid(MyInt))) == original);
}

TEST_CASE("Registry: names are sorted", "[registry]") {
    Registry registry;
    REQUIRE_FALSE(transcodings::RegisterBuiltins(registry).has_value());
    REQUIRE_FALSE(registry.Register(MyStrAsStr()).has_value());

    const std::vector<std::string_view> expected{
        "datetime_iso", "mystr_as_str", "tuple_as_list", "uuid_hex"};
    REQUIRE(registry.names() == expected);
}

TEST_CASE("Registry: builtins register once", "[registry]") {
    Registry registry;
    REQUIRE_FALSE(transcodings::RegisterBuiltins(registry).has_value());
    REQUIRE(registry.size() == 3);

    auto err = transcodings::RegisterBuiltins(registry);
    REQUIRE(err.has_value());
    REQUIRE(err->code == ErrorCode::DuplicateType);
    REQUIRE(registry.size() == 3);
}

TEST_CASE("Registry: one rule shared by two registries", "[registry]") {
    auto rule = MyDictAsDict();
    Registry a;
    Registry b;
    REQUIRE_FALSE(a.Register(rule).has_value());
    REQUIRE_FALSE(b.Register(rule).has_value());
    REQUIRE(a.FindByName("mydict_as_dict") == rule.get());
    REQUIRE(b.FindByName("mydict_as_dict") == rule.get());
}

TEST_CASE("Registry: in-place construction", "[registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.Register<CustomType1AsDict>().has_value());
    REQUIRE(registry.Contains("custom_type1_as_dict"));
    auto err = registry.Register<CustomType1AsDict>();
    REQUIRE(err.has_value());
    REQUIRE(err->code == ErrorCode::DuplicateType);
}

TEST_CASE("Registry: lookup by type_index reports the raw type name",
          "[registry]") {
    Registry registry;
    const std::type_index type(typeid(MyInt));
    auto result = registry.LookupByType(type);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::UnregisteredType);
    REQUIRE(result.error().message ==
            "no transcoding registered for type '" + std::string(type.name()) +
                "'");

    auto typed = registry.LookupByType<MyInt>();
    REQUIRE_FALSE(typed.has_value());
    REQUIRE(typed.error().message ==
            "no transcoding registered for type 'MyInt'");
}
