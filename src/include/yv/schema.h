#pragma once

#include <yv/errors.h>
#include <yv/limits.h>
#include <yv/node.h>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string_view>
#include <variant>
#include <vector>

namespace yv {

class Context;
struct PropertyType;

// `pattern` runs on std::regex, which backtracks; nested quantifiers such as
// `(a*)*b` are exponential on long non-matching input.
struct SchemaString {
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::regex> pattern;
};

template <typename T>
struct NumericTraits;

template <>
struct NumericTraits<std::int64_t> {
    static constexpr std::string_view name = "integer";
    static constexpr std::int64_t unit = 1;
    static bool matches(const Node& node) { return node.isInt(); }
    static std::int64_t value(const Node& node) { return node.asInt(); }
};

template <>
struct NumericTraits<double> {
    static constexpr std::string_view name = "real";
    static constexpr double unit = std::numeric_limits<double>::min();
    static bool matches(const Node& node) { return node.isReal(); }
    static double value(const Node& node) { return node.asDouble(); }
};

// Shared shape of the integer and real schemas.
template <typename T>
struct NumericSchema {
    std::optional<Limit<T>> lower;
    std::optional<Limit<T>> upper;
    std::optional<T> multiple_of;
};

using SchemaInteger = NumericSchema<std::int64_t>;
using SchemaReal = NumericSchema<double>;

struct SchemaBool {};

struct SchemaArray {
    std::unique_ptr<PropertyType> items;
    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;
    bool unique_items = false;
    std::unique_ptr<PropertyType> contains;
    std::optional<std::size_t> min_contains;
    std::optional<std::size_t> max_contains;
};

// Open-ended map; every value is checked against `items` when present.
struct SchemaHash {
    std::unique_ptr<PropertyType> items;
};

// Fixed set of named fields. Undeclared keys are always rejected.
struct SchemaObject {
    std::map<std::string_view, std::unique_ptr<PropertyType>> items;
    std::vector<std::string_view> required;
};

// Resolved by name in the Context at validation time.
struct SchemaReference {
    std::string_view uri;
};

struct SchemaNot {
    std::unique_ptr<PropertyType> item;
};

struct SchemaOneOf {
    std::vector<PropertyType> items;
};

struct SchemaAnyOf {
    std::vector<PropertyType> items;
};

struct SchemaAllOf {
    std::vector<PropertyType> items;
};

// One compiled schema node.
struct PropertyType {
    using Variant = std::variant<SchemaObject, SchemaArray, SchemaHash, SchemaString, SchemaInteger, SchemaReal,
                                 SchemaBool, SchemaReference, SchemaNot, SchemaOneOf, SchemaAnyOf, SchemaAllOf>;
    Variant value;
};

// A top-level schema document: {uri: ..., schema: ...}.
// Holds views into the document it was compiled from.
struct Schema {
    std::string_view uri;
    PropertyType root;

    std::optional<ValidationError> validate(const Context& ctx, const Node& document) const;
    std::optional<ValidationError> validate(const Context& ctx, const Node&& document) const = delete;
};

// Compilers. Each checks the key set of `node` first and reports every
// problem it finds; `out` is only meaningful when no error is returned.
std::optional<SchemaError> compile(const Node& node, SchemaString& out);
template <typename T>
std::optional<SchemaError> compile(const Node& node, NumericSchema<T>& out);
std::optional<SchemaError> compile(const Node& node, SchemaBool& out);
std::optional<SchemaError> compile(const Node& node, SchemaArray& out);
std::optional<SchemaError> compile(const Node& node, SchemaHash& out);
std::optional<SchemaError> compile(const Node& node, SchemaObject& out);
std::optional<SchemaError> compile(const Node& node, SchemaReference& out);
std::optional<SchemaError> compile(const Node& node, SchemaNot& out);
std::optional<SchemaError> compile(const Node& node, SchemaOneOf& out);
std::optional<SchemaError> compile(const Node& node, SchemaAnyOf& out);
std::optional<SchemaError> compile(const Node& node, SchemaAllOf& out);

std::optional<SchemaError> compile(const Node& node, PropertyType& out);
std::optional<SchemaError> compile(const Node&& node, PropertyType& out) = delete;
std::optional<SchemaError> compile(const Node& document, Schema& out);
std::optional<SchemaError> compile(const Node&& document, Schema& out) = delete;

// Validators. `depth` counts the references resolved on the way here.
std::optional<ValidationError> validate(const Context& ctx, const SchemaString& schema, const Node& node,
                                        std::size_t depth);
template <typename T>
std::optional<ValidationError> validate(const Context& ctx, const NumericSchema<T>& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaBool& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaArray& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaHash& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaObject& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaReference& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaNot& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaOneOf& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaAnyOf& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const SchemaAllOf& schema, const Node& node,
                                        std::size_t depth);
std::optional<ValidationError> validate(const Context& ctx, const PropertyType& schema, const Node& node,
                                        std::size_t depth = 0);

extern template std::optional<SchemaError> compile<std::int64_t>(const Node&, SchemaInteger&);
extern template std::optional<SchemaError> compile<double>(const Node&, SchemaReal&);
extern template std::optional<ValidationError> validate<std::int64_t>(const Context&, const SchemaInteger&,
                                                                      const Node&, std::size_t);
extern template std::optional<ValidationError> validate<double>(const Context&, const SchemaReal&, const Node&,
                                                                std::size_t);

}  // namespace yv
