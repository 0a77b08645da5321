#include <yv/context.h>
#include <yv/debug.h>
#include <iostream>

namespace yv {

SchemaException::SchemaException(SchemaError error) : std::runtime_error(error.to_string()), my_error(std::move(error)) {}

Context Context::compile(const std::vector<Node>& documents) {
    Context ctx;
    if (auto err = tryCompile(documents, ctx)) throw SchemaException(std::move(*err));
    return ctx;
}

std::optional<SchemaError> Context::tryCompile(const std::vector<Node>& documents, Context& out) {
    std::vector<SchemaError> errors;
    std::vector<Schema> compiled;
    for (auto const& document : documents) {
        Schema schema;
        if (auto err = yv::compile(document, schema))
            errors.push_back(std::move(*err));
        else
            compiled.push_back(std::move(schema));
    }
    if (auto err = condense(std::move(errors))) return err;

    for (auto& schema : compiled) out.insert(std::move(schema));
    return std::nullopt;
}

void Context::insert(Schema schema) {
    auto uri = schema.uri;
    auto it = schemas.find(uri);
    if (it != schemas.end()) {
        if (debug_enabled()) std::cerr << "[yv] schema '" << uri << "' registered twice, keeping the later one\n";
        it->second = std::move(schema);
        return;
    }
    if (debug_enabled()) std::cerr << "[yv] registered schema '" << uri << "'\n";
    schemas.emplace(uri, std::move(schema));
}

const Schema* Context::lookup(std::string_view uri) const {
    auto it = schemas.find(uri);
    if (it == schemas.end()) return nullptr;
    return &it->second;
}

std::vector<std::string_view> Context::uris() const {
    std::vector<std::string_view> out;
    out.reserve(schemas.size());
    for (auto const& kv : schemas) out.push_back(kv.first);
    return out;
}

std::optional<ValidationError> Context::validate(std::string_view uri, const Node& document) const {
    const Schema* schema = lookup(uri);
    if (schema == nullptr) throw std::out_of_range("schema '" + std::string(uri) + "' not found in context");
    return schema->validate(*this, document);
}

}  // namespace yv
