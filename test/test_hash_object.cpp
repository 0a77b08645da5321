#include <catch2/catch_test_macros.hpp>
#include <yv/context.h>
#include <yv/schema.h>
#include <yv/yaml.h>

using namespace yv;

TEST_CASE("Hash validates every value", "[hash]") {
    auto yaml = parse_yaml("type: hash\nitems:\n  type: integer\n");
    SchemaHash schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());

    Context ctx;
    auto good = parse_yaml("a: 1\nb: 2\n");
    REQUIRE_FALSE(validate(ctx, schema, good, 0).has_value());

    auto bad = parse_yaml("a: 1\nb: two\nc: 3.0\n");
    auto err = validate(ctx, schema, bad, 0);
    REQUIRE(err.has_value());
    REQUIRE(err->to_string() ==
            "#.b: wrong type, expected integer got string\n"
            "#.c: wrong type, expected integer got float\n");

    auto list = parse_yaml("[1, 2]");
    REQUIRE(*validate(ctx, schema, list, 0) == ValidationError::wrongType("hash", "array"));
}

TEST_CASE("Hash without items accepts any values", "[hash]") {
    auto yaml = parse_yaml("type: hash\n");
    SchemaHash schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());
    REQUIRE_FALSE(schema.items);

    Context ctx;
    auto doc = parse_yaml("a: 1\nb: [x]\n");
    REQUIRE_FALSE(validate(ctx, schema, doc, 0).has_value());

    auto extra = parse_yaml("type: hash\nrequired: [a]\n");
    SchemaHash bad;
    REQUIRE(*compile(extra, bad) == SchemaError::extraField("required"));
}

TEST_CASE("Object requires declared fields", "[object]") {
    auto yaml = parse_yaml(R"(
type: object
items:
  name:
    type: string
  age:
    type: integer
required:
  - name
)");
    PropertyType schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());

    Context ctx;
    auto missing = parse_yaml("age: 5\n");
    auto err = validate(ctx, schema, missing);
    REQUIRE(err.has_value());
    REQUIRE(err->to_string() == "#: missing field, 'name' not found\n");

    auto only_name = parse_yaml("name: Ada\n");
    REQUIRE_FALSE(validate(ctx, schema, only_name).has_value());

    auto extra = parse_yaml("name: Ada\nnickname: countess\n");
    err = validate(ctx, schema, extra);
    REQUIRE(err->to_string() == "#: field 'nickname' is not specified in the schema\n");
}

TEST_CASE("Object reports every invalid field", "[object]") {
    auto yaml = parse_yaml(R"(
type: object
items:
  a:
    type: integer
  b:
    type: string
  c:
    type: boolean
)");
    PropertyType schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());

    Context ctx;
    auto doc = parse_yaml("a: x\nb: 1\nc: 2.5\n");
    auto err = validate(ctx, schema, doc);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ValidationErrorKind::Multiple);
    REQUIRE(err->leafCount() == 3);
    REQUIRE(err->to_string() ==
            "#.a: wrong type, expected integer got string\n"
            "#.b: wrong type, expected string got integer\n"
            "#.c: wrong type, expected boolean got float\n");
}

TEST_CASE("Object stops at key set errors", "[object]") {
    auto yaml = parse_yaml("type: object\nitems:\n  a:\n    type: integer\nrequired: [a]\n");
    PropertyType schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());

    Context ctx;
    auto doc = parse_yaml("a: wrong\nb: 1\n");
    REQUIRE(validate(ctx, schema, doc)->to_string() == "#: field 'b' is not specified in the schema\n");

    auto scalar = parse_yaml("10");
    REQUIRE(*validate(ctx, schema, scalar) == ValidationError::wrongType("hash", "integer"));
}

TEST_CASE("Object compile errors", "[object][errors]") {
    SECTION("items is required") {
        auto yaml = parse_yaml("type: object\n");
        SchemaObject schema;
        REQUIRE(*compile(yaml, schema) == SchemaError::fieldMissing("items"));
    }
    SECTION("field errors are reported under items") {
        auto yaml = parse_yaml("type: object\nitems:\n  name:\n    type: strnig\n  age: 5\n");
        SchemaObject schema;
        auto err = compile(yaml, schema);
        REQUIRE(err.has_value());
        REQUIRE(err->to_string() ==
                "#.items.age: wrong type, expected hash got integer\n"
                "#.items.name: unknown type specified: strnig\n");
    }
    SECTION("required must list field names") {
        auto yaml = parse_yaml("type: object\nitems:\n  a:\n    type: integer\nrequired: [a, 3]\n");
        SchemaObject schema;
        REQUIRE(compile(yaml, schema)->to_string() == "#.required[1]: wrong type, expected string got integer\n");

        auto scalar = parse_yaml("type: object\nitems:\n  a:\n    type: integer\nrequired: a\n");
        SchemaObject other;
        REQUIRE(compile(scalar, other)->to_string() == "#.required: wrong type, expected array got string\n");
    }
    SECTION("items must be a hash") {
        auto yaml = parse_yaml("type: object\nitems: [a]\n");
        SchemaObject schema;
        REQUIRE(compile(yaml, schema)->to_string() == "#.items: wrong type, expected hash got array\n");
    }
}

TEST_CASE("Schema type field", "[property][errors]") {
    PropertyType schema;

    auto missing = parse_yaml("minLength: 3\n");
    REQUIRE(*compile(missing, schema) == SchemaError::fieldMissing("type"));

    auto wrong = parse_yaml("type: [string]\n");
    REQUIRE(compile(wrong, schema)->to_string() == "#.type: wrong type, expected string got array\n");

    auto unknown = parse_yaml("type: date\n");
    REQUIRE(compile(unknown, schema)->message() == "unknown type specified: date");

    auto scalar = parse_yaml("string");
    REQUIRE(*compile(scalar, schema) == SchemaError::wrongType("hash", "string"));
}
