#include <yv/context.h>
#include <yv/schema.h>
#include <yv/utils.h>

namespace yv {

namespace {
    template <typename T>
    std::optional<SchemaError> compile_as(const Node& node, PropertyType& out) {
        T compiled;
        if (auto err = compile(node, compiled)) return err;
        out.value = std::move(compiled);
        return std::nullopt;
    }
}

// Modifiers take precedence over `type`, checked as $ref, not, oneOf, allOf, anyOf.
std::optional<SchemaError> compile(const Node& node, PropertyType& out) {
    if (!node.isHash()) return SchemaError::wrongType("hash", type_to_str(node));

    if (lookup(node, "$ref")) return compile_as<SchemaReference>(node, out);
    if (lookup(node, "not")) return compile_as<SchemaNot>(node, out);
    if (lookup(node, "oneOf")) return compile_as<SchemaOneOf>(node, out);
    if (lookup(node, "allOf")) return compile_as<SchemaAllOf>(node, out);
    if (lookup(node, "anyOf")) return compile_as<SchemaAnyOf>(node, out);

    std::optional<std::string_view> type;
    if (auto err = read_field(node, "type", type)) return err;
    if (!type) return SchemaError::fieldMissing("type");

    if (*type == "object") return compile_as<SchemaObject>(node, out);
    if (*type == "array") return compile_as<SchemaArray>(node, out);
    if (*type == "hash") return compile_as<SchemaHash>(node, out);
    if (*type == "string") return compile_as<SchemaString>(node, out);
    if (*type == "integer") return compile_as<SchemaInteger>(node, out);
    if (*type == "real") return compile_as<SchemaReal>(node, out);
    if (*type == "boolean") return compile_as<SchemaBool>(node, out);
    return unknown_type(*type);
}

std::optional<ValidationError> validate(const Context& ctx, const PropertyType& schema, const Node& node,
                                        std::size_t depth) {
    return std::visit([&](auto const& s) { return validate(ctx, s, node, depth); }, schema.value);
}

std::optional<SchemaError> compile(const Node& document, Schema& out) {
    if (auto err = strict_contents<SchemaError>(document, {"uri", "schema"}, {})) return err;

    const Node& uri = document.at("uri");
    if (!uri.isString()) {
        auto err = SchemaError::wrongType("string", type_to_str(uri));
        err.withPathName("uri");
        return err;
    }
    out.uri = uri.asString();

    if (auto err = compile(document.at("schema"), out.root)) {
        err->withPathName(out.uri);
        return err;
    }
    return std::nullopt;
}

std::optional<ValidationError> Schema::validate(const Context& ctx, const Node& document) const {
    return yv::validate(ctx, root, document, 0);
}

}  // namespace yv
