#include <catch2/catch_test_macros.hpp>
#include <yv/context.h>
#include <yv/schema.h>
#include <yv/yaml.h>

using namespace yv;

namespace {
    struct Compiled {
        Node source;
        PropertyType schema;
    };

    // The compiled schema borrows strings from its source node, keep them together.
    std::unique_ptr<Compiled> compile_yaml(const std::string& text) {
        auto out = std::make_unique<Compiled>();
        out->source = parse_yaml(text);
        auto err = compile(out->source, out->schema);
        if (err) FAIL("schema failed to compile:\n" << err->to_string());
        return out;
    }

    std::optional<ValidationError> check(const Compiled& compiled, const std::string& text) {
        Context ctx;
        auto document = parse_yaml(text);
        return validate(ctx, compiled.schema, document);
    }
}

TEST_CASE("not inverts the inner result", "[modifiers][not]") {
    auto schema = compile_yaml("not:\n  type: integer\n");
    REQUIRE(std::holds_alternative<SchemaNot>(schema->schema.value));
    REQUIRE_FALSE(check(*schema, "hello").has_value());
    REQUIRE(check(*schema, "10")->message() ==
            "special requirements for field not met: validation inversion failed because inner result matched");
}

TEST_CASE("not of not behaves like the inner schema", "[modifiers][not]") {
    auto schema = compile_yaml("not:\n  not:\n    type: integer\n");
    REQUIRE_FALSE(check(*schema, "10").has_value());
    REQUIRE(check(*schema, "hello").has_value());
}

TEST_CASE("oneOf requires exactly one branch", "[modifiers][oneOf]") {
    auto schema = compile_yaml(R"(
oneOf:
  - type: integer
    maximum: 10
  - type: integer
    minimum: 5
  - type: string
)");
    REQUIRE(std::get<SchemaOneOf>(schema->schema.value).items.size() == 3);

    SECTION("one branch matches") {
        REQUIRE_FALSE(check(*schema, "2").has_value());
        REQUIRE_FALSE(check(*schema, "20").has_value());
        REQUIRE_FALSE(check(*schema, "text").has_value());
    }
    SECTION("several branches match") {
        auto err = check(*schema, "7");
        REQUIRE(err.has_value());
        REQUIRE(err->to_string() ==
                "#[0]: special requirements for field not met: multiple branches validated successfully\n"
                "#[1]: special requirements for field not met: multiple branches validated successfully\n");
    }
    SECTION("no branch matches") {
        auto err = check(*schema, "true");
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ValidationErrorKind::Multiple);
        REQUIRE(err->to_string() ==
                "#: wrong type, expected integer got boolean\n"
                "#: wrong type, expected integer got boolean\n"
                "#: wrong type, expected string got boolean\n");
    }
}

TEST_CASE("oneOf with a single failing branch returns that error", "[modifiers][oneOf]") {
    auto schema = compile_yaml("oneOf:\n  - type: string\n");
    REQUIRE(*check(*schema, "1") == ValidationError::wrongType("string", "integer"));
}

TEST_CASE("anyOf accepts any matching branch", "[modifiers][anyOf]") {
    auto schema = compile_yaml("anyOf:\n  - type: integer\n    minimum: 5\n  - type: string\n");
    REQUIRE_FALSE(check(*schema, "7").has_value());
    REQUIRE_FALSE(check(*schema, "seven").has_value());

    auto err = check(*schema, "3");
    REQUIRE(err->to_string() ==
            "#: special requirements for field not met: value violates lower limit constraint\n"
            "#: wrong type, expected string got integer\n");
}

TEST_CASE("allOf requires every branch", "[modifiers][allOf]") {
    auto schema = compile_yaml("allOf:\n  - type: integer\n    minimum: 0\n  - type: integer\n    maximum: 100\n");
    REQUIRE_FALSE(check(*schema, "50").has_value());
    REQUIRE(check(*schema, "150")->message() ==
            "special requirements for field not met: value violates upper limit constraint");
    REQUIRE(check(*schema, "x")->leafCount() == 2);
}

TEST_CASE("Modifiers inside objects report field paths", "[modifiers][object]") {
    auto schema = compile_yaml(R"(
type: object
items:
  value:
    anyOf:
      - type: integer
      - type: boolean
)");
    REQUIRE_FALSE(check(*schema, "value: 1").has_value());
    REQUIRE(check(*schema, "value: x")->to_string() ==
            "#.value: wrong type, expected integer got string\n"
            "#.value: wrong type, expected boolean got string\n");
}

TEST_CASE("Modifier compile errors", "[modifiers][errors]") {
    PropertyType schema;

    auto empty = parse_yaml("oneOf: []\n");
    REQUIRE(compile(empty, schema)->to_string() ==
            "#.oneOf: malformed field: oneOf modifier requires an array of schemas to validate against\n");

    auto not_list = parse_yaml("anyOf:\n  type: integer\n");
    REQUIRE(compile(not_list, schema)->to_string() == "#.anyOf: wrong type, expected array got hash\n");

    auto bad_branch = parse_yaml("allOf:\n  - type: integer\n  - type: nope\n");
    REQUIRE(compile(bad_branch, schema)->to_string() == "#.allOf[1]: unknown type specified: nope\n");

    auto not_scalar = parse_yaml("not: integer\n");
    REQUIRE(compile(not_scalar, schema)->to_string() == "#.not: wrong type, expected hash got string\n");

    auto not_bad = parse_yaml("not:\n  type: nope\n");
    REQUIRE(compile(not_bad, schema)->to_string() == "#.not: unknown type specified: nope\n");

    auto mixed = parse_yaml("oneOf:\n  - type: integer\ntype: integer\n");
    REQUIRE(*compile(mixed, schema) == SchemaError::extraField("type"));
}
