#include <yv/context.h>
#include <yv/debug.h>
#include <yv/schema.h>
#include <yv/utils.h>
#include <iostream>
#include <set>

namespace yv {

namespace {
    // Compile an optional nested schema node stored under `field`.
    std::optional<SchemaError> compile_child(const Node& node, std::string_view field,
                                             std::unique_ptr<PropertyType>& out) {
        const Node* child = lookup(node, field);
        if (child == nullptr) return std::nullopt;
        auto compiled = std::make_unique<PropertyType>();
        if (auto err = compile(*child, *compiled)) {
            err->withPathName(field);
            return err;
        }
        out = std::move(compiled);
        return std::nullopt;
    }
}

std::optional<SchemaError> compile(const Node& node, SchemaArray& out) {
    if (auto err = strict_contents<SchemaError>(
            node, {},
            {"type", "items", "minItems", "maxItems", "uniqueItems", "contains", "minContains", "maxContains"}))
        return err;

    std::vector<SchemaError> errors;
    if (auto err = compile_child(node, "items", out.items)) errors.push_back(std::move(*err));
    if (auto err = read_count(node, "minItems", out.min_items)) errors.push_back(std::move(*err));
    if (auto err = read_count(node, "maxItems", out.max_items)) errors.push_back(std::move(*err));

    std::optional<bool> unique;
    if (auto err = read_field(node, "uniqueItems", unique)) errors.push_back(std::move(*err));
    out.unique_items = unique.value_or(false);

    if (auto err = compile_child(node, "contains", out.contains)) errors.push_back(std::move(*err));
    if (auto err = read_count(node, "minContains", out.min_contains)) errors.push_back(std::move(*err));
    if (auto err = read_count(node, "maxContains", out.max_contains)) errors.push_back(std::move(*err));

    if (out.min_items && out.max_items && *out.min_items > *out.max_items)
        errors.push_back(malformed_field("minItems cannot be greater than maxItems"));

    // a child that failed to compile still counts as given
    bool has_contains = lookup(node, "contains") != nullptr;
    if (!has_contains) {
        if (out.min_contains && out.max_contains)
            errors.push_back(
                malformed_field("minContains and maxContains requires 'contains' to specify a schema to validate against"));
        else if (out.min_contains)
            errors.push_back(malformed_field("minContains requires 'contains' to specify a schema to validate against"));
        else if (out.max_contains)
            errors.push_back(malformed_field("maxContains requires 'contains' to specify a schema to validate against"));
    } else if (out.min_contains && out.max_contains && *out.min_contains > *out.max_contains) {
        errors.push_back(malformed_field("minContains cannot be greater than maxContains"));
    }

    return condense(std::move(errors));
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaArray& schema, const Node& node,
                                        std::size_t depth) {
    if (!node.isArray()) return ValidationError::wrongType("array", type_to_str(node));

    auto const& elements = node.elements();
    if (schema.min_items && elements.size() < *schema.min_items)
        return violation("array contains fewer than minItems items");
    if (schema.max_items && elements.size() > *schema.max_items)
        return violation("array contains more than maxItems items");

    if (schema.unique_items) {
        std::set<std::string> seen;
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (!seen.insert(elements[i].dump()).second) {
                auto err = violation("array contains duplicate key");
                err.withPathIndex(i);
                return err;
            }
        }
    }

    if (schema.contains) {
        std::size_t matched = 0;
        for (auto const& element : elements) {
            if (!validate(ctx, *schema.contains, element, depth)) ++matched;
        }
        if (!schema.min_contains && !schema.max_contains && matched < 1)
            return violation("at least one item in the array must match the 'contains' schema");
        if (schema.min_contains && matched < *schema.min_contains)
            return violation("fewer than minContains items validated against schema in 'contains'");
        if (schema.max_contains && matched > *schema.max_contains)
            return violation("more than maxContains items validated against schema in 'contains'");
    }

    if (!schema.items) return std::nullopt;

    std::vector<ValidationError> errors;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (auto err = validate(ctx, *schema.items, elements[i], depth)) {
            err->withPathIndex(i);
            errors.push_back(std::move(*err));
        }
    }
    return condense(std::move(errors));
}

std::optional<SchemaError> compile(const Node& node, SchemaHash& out) {
    if (auto err = strict_contents<SchemaError>(node, {}, {"type", "items"})) return err;
    return compile_child(node, "items", out.items);
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaHash& schema, const Node& node,
                                        std::size_t depth) {
    if (!node.isHash()) return ValidationError::wrongType("hash", type_to_str(node));
    if (!schema.items) return std::nullopt;

    std::vector<ValidationError> errors;
    for (auto const& kv : node.items()) {
        if (auto err = validate(ctx, *schema.items, kv.second, depth)) {
            err->withPathName(kv.first);
            errors.push_back(std::move(*err));
        }
    }
    return condense(std::move(errors));
}

std::optional<SchemaError> compile(const Node& node, SchemaObject& out) {
    if (auto err = strict_contents<SchemaError>(node, {"items"}, {"type", "required"})) return err;

    std::vector<SchemaError> errors;
    const Node& items = node.at("items");
    if (!items.isHash()) {
        auto err = SchemaError::wrongType("hash", type_to_str(items));
        err.withPathName("items");
        errors.push_back(std::move(err));
    } else {
        std::vector<SchemaError> field_errors;
        for (auto const& kv : items.items()) {
            auto field = std::make_unique<PropertyType>();
            if (auto err = compile(kv.second, *field)) {
                err->withPathName(kv.first);
                field_errors.push_back(std::move(*err));
                continue;
            }
            out.items.emplace(std::string_view(kv.first), std::move(field));
        }
        if (auto err = condense(std::move(field_errors))) {
            err->withPathName("items");
            errors.push_back(std::move(*err));
        }
    }

    if (const Node* required = lookup(node, "required")) {
        if (!required->isArray()) {
            auto err = SchemaError::wrongType("array", type_to_str(*required));
            err.withPathName("required");
            errors.push_back(std::move(err));
        } else {
            auto const& names = required->elements();
            for (std::size_t i = 0; i < names.size(); ++i) {
                if (!names[i].isString()) {
                    auto err = SchemaError::wrongType("string", type_to_str(names[i]));
                    err.withPathIndex(i).withPathName("required");
                    errors.push_back(std::move(err));
                    continue;
                }
                out.required.push_back(names[i].asString());
            }
        }
    }

    return condense(std::move(errors));
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaObject& schema, const Node& node,
                                        std::size_t depth) {
    if (!node.isHash()) return ValidationError::wrongType("hash", type_to_str(node));

    KeyList required_fields, optional_fields;
    for (auto const& kv : schema.items) {
        bool required = std::find(schema.required.begin(), schema.required.end(), kv.first) != schema.required.end();
        (required ? required_fields : optional_fields).push_back(kv.first);
    }
    if (auto err = strict_contents<ValidationError>(node, required_fields, optional_fields)) return err;

    std::vector<ValidationError> errors;
    for (auto const& kv : schema.items) {
        const Node* value = node.find(std::string(kv.first));
        if (value == nullptr) continue;
        if (auto err = validate(ctx, *kv.second, *value, depth)) {
            err->withPathName(kv.first);
            errors.push_back(std::move(*err));
        }
    }
    return condense(std::move(errors));
}

std::optional<SchemaError> compile(const Node& node, SchemaReference& out) {
    if (auto err = strict_contents<SchemaError>(node, {"$ref"}, {})) return err;

    const Node& uri = node.at("$ref");
    if (!uri.isString()) {
        auto err = SchemaError::wrongType("string", type_to_str(uri));
        err.withPathName("$ref");
        return err;
    }
    out.uri = uri.asString();
    return std::nullopt;
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaReference& schema, const Node& node,
                                        std::size_t depth) {
    std::size_t limit = ctx.maxReferenceDepth();
    if (limit != 0 && depth >= limit) return violation("maximum reference depth exceeded");

    const Schema* target = ctx.lookup(schema.uri);
    if (target == nullptr) {
        if (debug_enabled()) std::cerr << "[yv] reference to unknown schema '" << schema.uri << "'\n";
        return ValidationError::unknownSchema(schema.uri);
    }
    if (debug_enabled()) std::cerr << "[yv] resolving '" << schema.uri << "' at depth " << depth + 1 << "\n";
    return validate(ctx, target->root, node, depth + 1);
}

}  // namespace yv
