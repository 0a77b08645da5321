#pragma once

#include <yv/errors.h>
#include <yv/node.h>
#include <yv/schema.h>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace yv {

// Thrown by Context::compile. what() is the flattened report.
class SchemaException : public std::runtime_error {
  public:
    explicit SchemaException(SchemaError error);

    const SchemaError& error() const noexcept { return my_error; }

  private:
    SchemaError my_error;
};

// Registry of compiled schemas keyed by URI. References between schemas are
// resolved by name on every validation, so schemas may refer to each other
// (or themselves) in any order. The Context borrows from the schema
// documents it was compiled from; they must outlive it.
class Context {
  public:
    static constexpr std::size_t DEFAULT_MAX_REFERENCE_DEPTH = 256;

    Context() = default;
    Context(Context&&) = default;
    Context& operator=(Context&&) = default;

    // Compile every document, collecting every error. Throws SchemaException on failure.
    static Context compile(const std::vector<Node>& documents);
    static Context compile(const std::vector<Node>&& documents) = delete;

    // Same as compile() but hands the error back instead of throwing.
    static std::optional<SchemaError> tryCompile(const std::vector<Node>& documents, Context& out);
    static std::optional<SchemaError> tryCompile(const std::vector<Node>&& documents, Context& out) = delete;

    // Registers a compiled schema. A schema with the same URI is replaced.
    void insert(Schema schema);

    const Schema* lookup(std::string_view uri) const;
    bool contains(std::string_view uri) const { return lookup(uri) != nullptr; }
    std::size_t size() const noexcept { return schemas.size(); }
    std::vector<std::string_view> uris() const;

    // Validate `document` against the schema registered under `uri`.
    // Throws std::out_of_range if no such schema exists.
    std::optional<ValidationError> validate(std::string_view uri, const Node& document) const;
    std::optional<ValidationError> validate(std::string_view uri, const Node&& document) const = delete;

    // Number of nested $ref resolutions allowed in one validation; 0 means unlimited.
    void setMaxReferenceDepth(std::size_t depth) noexcept { max_reference_depth = depth; }
    std::size_t maxReferenceDepth() const noexcept { return max_reference_depth; }

  private:
    std::map<std::string_view, Schema> schemas;
    std::size_t max_reference_depth = DEFAULT_MAX_REFERENCE_DEPTH;
};

}  // namespace yv
