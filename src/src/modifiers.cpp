#include <yv/schema.h>
#include <yv/utils.h>

namespace yv {

namespace {
    // Shared by oneOf/anyOf/allOf: {<keyword>: [node, ...]} and nothing else.
    std::optional<SchemaError> compile_list(const Node& node, std::string_view keyword, std::vector<PropertyType>& out) {
        if (auto err = strict_contents<SchemaError>(node, {keyword}, {})) return err;

        const Node& list = node.at(std::string(keyword));
        if (!list.isArray()) {
            auto err = SchemaError::wrongType("array", type_to_str(list));
            err.withPathName(keyword);
            return err;
        }
        if (list.empty()) {
            auto err = malformed_field(std::string(keyword) + " modifier requires an array of schemas to validate against");
            err.withPathName(keyword);
            return err;
        }

        std::vector<SchemaError> errors;
        auto const& elements = list.elements();
        out.resize(elements.size());
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (auto err = compile(elements[i], out[i])) {
                err->withPathIndex(i).withPathName(keyword);
                errors.push_back(std::move(*err));
            }
        }
        return condense(std::move(errors));
    }

    // Errors of every branch that failed, plus the indices of those that passed.
    struct BranchResults {
        std::vector<ValidationError> errors;
        std::vector<std::size_t> passed;
    };

    BranchResults run_branches(const Context& ctx, const std::vector<PropertyType>& branches, const Node& node,
                               std::size_t depth) {
        BranchResults results;
        for (std::size_t i = 0; i < branches.size(); ++i) {
            if (auto err = validate(ctx, branches[i], node, depth))
                results.errors.push_back(std::move(*err));
            else
                results.passed.push_back(i);
        }
        return results;
    }
}

std::optional<SchemaError> compile(const Node& node, SchemaNot& out) {
    if (auto err = strict_contents<SchemaError>(node, {"not"}, {})) return err;

    const Node& inner = node.at("not");
    if (!inner.isHash()) {
        auto err = SchemaError::wrongType("hash", type_to_str(inner));
        err.withPathName("not");
        return err;
    }
    auto item = std::make_unique<PropertyType>();
    if (auto err = compile(inner, *item)) {
        err->withPathName("not");
        return err;
    }
    out.item = std::move(item);
    return std::nullopt;
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaNot& schema, const Node& node,
                                        std::size_t depth) {
    if (validate(ctx, *schema.item, node, depth)) return std::nullopt;
    return violation("validation inversion failed because inner result matched");
}

std::optional<SchemaError> compile(const Node& node, SchemaOneOf& out) { return compile_list(node, "oneOf", out.items); }

std::optional<SchemaError> compile(const Node& node, SchemaAnyOf& out) { return compile_list(node, "anyOf", out.items); }

std::optional<SchemaError> compile(const Node& node, SchemaAllOf& out) { return compile_list(node, "allOf", out.items); }

// Exactly one branch has to match. When several do, the ambiguity itself is
// reported, once per matching branch.
std::optional<ValidationError> validate(const Context& ctx, const SchemaOneOf& schema, const Node& node,
                                        std::size_t depth) {
    auto results = run_branches(ctx, schema.items, node, depth);
    if (results.passed.size() == 1) return std::nullopt;
    if (results.passed.empty()) return condense(std::move(results.errors));

    std::vector<ValidationError> errors;
    for (auto index : results.passed) {
        auto err = violation("multiple branches validated successfully");
        err.withPathIndex(index);
        errors.push_back(std::move(err));
    }
    return condense(std::move(errors));
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaAnyOf& schema, const Node& node,
                                        std::size_t depth) {
    auto results = run_branches(ctx, schema.items, node, depth);
    if (!results.passed.empty()) return std::nullopt;
    return condense(std::move(results.errors));
}

std::optional<ValidationError> validate(const Context& ctx, const SchemaAllOf& schema, const Node& node,
                                        std::size_t depth) {
    return condense(run_branches(ctx, schema.items, node, depth).errors);
}

}  // namespace yv
