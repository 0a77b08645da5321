#include <yv/utils.h>

namespace yv {

namespace {
    SchemaError wrong_field_type(std::string_view field, std::string_view expected, const Node& value) {
        auto e = SchemaError::wrongType(expected, type_to_str(value));
        e.withPathName(field);
        return e;
    }
}

std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<int64_t>& out) {
    const Node* value = lookup(node, field);
    if (value == nullptr) return std::nullopt;
    if (!value->isInt()) return wrong_field_type(field, "integer", *value);
    out = value->asInt();
    return std::nullopt;
}

// Reals accept integer values, widened.
std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<double>& out) {
    const Node* value = lookup(node, field);
    if (value == nullptr) return std::nullopt;
    if (!value->isReal() && !value->isInt()) return wrong_field_type(field, "real", *value);
    out = value->asDouble();
    return std::nullopt;
}

std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<bool>& out) {
    const Node* value = lookup(node, field);
    if (value == nullptr) return std::nullopt;
    if (!value->isBool()) return wrong_field_type(field, "boolean", *value);
    out = value->asBool();
    return std::nullopt;
}

std::optional<SchemaError> read_field(const Node& node, std::string_view field,
                                      std::optional<std::string_view>& out) {
    const Node* value = lookup(node, field);
    if (value == nullptr) return std::nullopt;
    if (!value->isString()) return wrong_field_type(field, "string", *value);
    out = std::string_view(value->asString());
    return std::nullopt;
}

std::optional<SchemaError> read_count(const Node& node, std::string_view field, std::optional<std::size_t>& out) {
    std::optional<int64_t> raw;
    if (auto err = read_field(node, field, raw)) return err;
    if (!raw) return std::nullopt;
    if (*raw < 0) {
        auto e = malformed_field(std::string(field) + " must not be negative");
        e.withPathName(field);
        return e;
    }
    out = static_cast<std::size_t>(*raw);
    return std::nullopt;
}

}  // namespace yv
