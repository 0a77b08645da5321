#include <catch2/catch_all.hpp>
#include <yv/parse.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace yv;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("load_documents prefers JSON", "[parse]") {
    auto docs = load_documents(R"({"a": [1, 2]})");
    REQUIRE(docs.size() == 1);
    REQUIRE(docs[0].at("a").size() == 2);
}

TEST_CASE("load_documents falls back to YAML", "[parse]") {
    auto docs = load_documents("a: 1\n---\nb: 2\n");
    REQUIRE(docs.size() == 2);
    REQUIRE(docs[0].at("a").asInt() == 1);
    REQUIRE(docs[1].at("b").asInt() == 2);
}

TEST_CASE("load_documents accepts YAML flow style that is not JSON", "[parse]") {
    auto docs = load_documents("{a: 1, b: [x, y]}");
    REQUIRE(docs.size() == 1);
    REQUIRE(docs[0].at("b").at(1).asString() == "y");
}

TEST_CASE("load_documents reports the error of the likely format", "[parse][errors]") {
    REQUIRE_THROWS_WITH(load_documents("{\"a\": [1, 2}"), ContainsSubstring("Most likely intended format: JSON"));
    REQUIRE_THROWS_WITH(load_documents("a: 1\na: 2\n"), ContainsSubstring("Most likely intended format: YAML") &&
                                                            ContainsSubstring("duplicate key 'a'"));
}

TEST_CASE("read_file reads examples and reports missing files", "[parse][files]") {
#ifndef YV_EXAMPLES_DIR
    FAIL("YV_EXAMPLES_DIR not defined");
#endif
    fs::path examples = YV_EXAMPLES_DIR;
    auto text = read_file((examples / "customers" / "schema.yaml").string());
    auto docs = load_documents(text);
    REQUIRE(docs.size() == 4);
    REQUIRE(docs[3].at("uri").asString() == "customer-list");

    REQUIRE_THROWS_WITH(read_file((examples / "does-not-exist.yaml").string()),
                        ContainsSubstring("could not open file"));
}
