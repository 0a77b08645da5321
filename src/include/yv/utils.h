#pragma once

#include <yv/errors.h>
#include <yv/node.h>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yv {

using KeyList = std::vector<std::string_view>;

inline std::string_view type_to_str(const Node& node) { return node.typeString(); }

// Absent and explicit null fields are both treated as missing.
inline const Node* lookup(const Node& node, std::string_view field) {
    const Node* value = node.find(std::string(field));
    if (value == nullptr || value->isNull()) return nullptr;
    return value;
}

// Checks that `node` is a hash holding every key in `required` and no key
// outside `required` and `optional`. Every missing and every extra key is
// reported, missing ones first.
template <typename E>
std::optional<E> strict_contents(const Node& node, const KeyList& required, const KeyList& optional) {
    if (!node.isHash()) return E::wrongType("hash", type_to_str(node));

    std::vector<E> errors;
    for (auto field : required) {
        if (!node.has(std::string(field))) errors.push_back(E::fieldMissing(field));
    }
    for (auto const& kv : node.items()) {
        std::string_view key = kv.first;
        bool known = std::find(required.begin(), required.end(), key) != required.end() ||
                     std::find(optional.begin(), optional.end(), key) != optional.end();
        if (!known) errors.push_back(E::extraField(key));
    }
    return condense(std::move(errors));
}

// Typed readers for optional schema fields. A missing field leaves `out`
// empty; a field of the wrong kind yields an error whose path is the field.
std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<int64_t>& out);
std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<double>& out);
std::optional<SchemaError> read_field(const Node& node, std::string_view field, std::optional<bool>& out);
std::optional<SchemaError> read_field(const Node& node, std::string_view field,
                                      std::optional<std::string_view>& out);

// Non-negative integer field (lengths and counts).
std::optional<SchemaError> read_count(const Node& node, std::string_view field, std::optional<std::size_t>& out);

}  // namespace yv
