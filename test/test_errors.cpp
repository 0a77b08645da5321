#include <catch2/catch_test_macros.hpp>
#include <yv/context.h>
#include <yv/errors.h>
#include <yv/yaml.h>
#include <sstream>

using namespace yv;

TEST_CASE("Breadcrumb renders root to leaf", "[errors][breadcrumb]") {
    Breadcrumb crumb;
    REQUIRE(crumb.to_string().empty());
    crumb.push("field");
    crumb.push(std::size_t(2));
    crumb.push("something");
    crumb.push("items");
    REQUIRE(crumb.to_string() == ".items.something[2].field");
    REQUIRE(crumb.size() == 4);
}

TEST_CASE("Error messages", "[errors]") {
    REQUIRE(SchemaError::wrongType("hash", "string").message() == "wrong type, expected hash got string");
    REQUIRE(malformed_field("bad").message() == "malformed field: bad");
    REQUIRE(SchemaError::fieldMissing("type").message() == "missing field, 'type' not found");
    REQUIRE(SchemaError::extraField("typo").message() == "field 'typo' is not specified in the schema");
    REQUIRE(unknown_type("date").message() == "unknown type specified: date");
    REQUIRE(SchemaError::unknownSchema("x").message() == "schema 'x' references was not found");
    REQUIRE(violation("too short").message() == "special requirements for field not met: too short");
    REQUIRE(ValidationError::multiple({}).message() == "multiple errors were encountered");
}

TEST_CASE("Flatten prints one line per leaf", "[errors][flatten]") {
    auto leaf = ValidationError::wrongType("integer", "string");
    leaf.withPathName("num").withPathIndex(0);

    auto other = violation("value violates upper limit constraint");
    other.withPathName("num").withPathIndex(4);

    auto multiple = ValidationError::multiple({leaf, other});
    multiple.withPathName("level2").withPathName("something");

    REQUIRE(multiple.to_string() ==
            "#.something.level2[0].num: wrong type, expected integer got string\n"
            "#.something.level2[4].num: special requirements for field not met: value violates upper limit "
            "constraint\n");
    REQUIRE(multiple.leafCount() == 2);

    std::ostringstream ss;
    ss << leaf;
    REQUIRE(ss.str() == "#[0].num: wrong type, expected integer got string\n");
}

TEST_CASE("Flatten nests multiple errors", "[errors][flatten]") {
    auto inner = SchemaError::multiple({SchemaError::fieldMissing("a"), SchemaError::extraField("b")});
    inner.withPathIndex(1);
    auto outer = SchemaError::multiple({std::move(inner), SchemaError::fieldMissing("c")});
    outer.withPathName("root");

    REQUIRE(outer.to_string() ==
            "#.root[1]: missing field, 'a' not found\n"
            "#.root[1]: field 'b' is not specified in the schema\n"
            "#.root: missing field, 'c' not found\n");
    REQUIRE(outer.leafCount() == 3);
}

TEST_CASE("condense collapses error lists", "[errors][condense]") {
    REQUIRE_FALSE(condense(std::vector<ValidationError>{}).has_value());

    auto one = condense(std::vector<ValidationError>{violation("x")});
    REQUIRE(one.has_value());
    REQUIRE(one->kind == ValidationErrorKind::ValidationError);

    auto many = condense(std::vector<ValidationError>{violation("x"), violation("y")});
    REQUIRE(many->kind == ValidationErrorKind::Multiple);
    REQUIRE(many->errors.size() == 2);
}

TEST_CASE("Schema error path through nested objects", "[errors][schema]") {
    auto yaml = parse_yaml(R"(
type: object
items:
  test:
    type: integer
  something:
    type: object
    items:
      level2:
        type: object
        items:
          leaf:
            notype: hello
)");
    PropertyType schema;
    auto err = compile(yaml, schema);
    REQUIRE(err.has_value());
    REQUIRE(err->to_string() == "#.items.something.items.level2.items.leaf: missing field, 'type' not found\n");
}

TEST_CASE("Validation error path through nested containers", "[errors][validation]") {
    auto yaml = parse_yaml(R"(
type: object
items:
  test:
    type: integer
  something:
    type: object
    items:
      level2:
        type: array
        items:
          type: object
          items:
            num:
              type: integer
)");
    PropertyType schema;
    REQUIRE_FALSE(compile(yaml, schema).has_value());

    auto document = parse_yaml(R"(
test: 20
something:
  level2:
    - num: abc
    - num:
        hash: value
    - num:
        - array: hello
    - num: 10
    - num: jkl
)");
    Context ctx;
    auto err = validate(ctx, schema, document);
    REQUIRE(err.has_value());
    REQUIRE(err->to_string() ==
            "#.something.level2[0].num: wrong type, expected integer got string\n"
            "#.something.level2[1].num: wrong type, expected integer got hash\n"
            "#.something.level2[2].num: wrong type, expected integer got array\n"
            "#.something.level2[4].num: wrong type, expected integer got string\n");
}

TEST_CASE("SchemaException carries the error tree", "[errors][context]") {
    auto docs = parse_yaml_documents(R"(
uri: broken
schema:
  type: strnig
)");
    try {
        auto ctx = Context::compile(docs);
        FAIL("expected SchemaException");
    } catch (const SchemaException& e) {
        REQUIRE(std::string(e.what()) == "#.broken: unknown type specified: strnig\n");
        REQUIRE(e.error().kind == SchemaErrorKind::UnknownType);
    }
}
