#pragma once

#include <yv/breadcrumb.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace yv {

// Problems found while compiling schema documents. Views borrow from the schema tree.
enum class SchemaErrorKind { WrongType, MalformedField, FieldMissing, ExtraField, UnknownType, UnknownSchema, Multiple };

// Problems found while validating a document. Views borrow from the document tree
// (and, for missing fields, from the schema tree that named the field).
enum class ValidationErrorKind { WrongType, ValidationError, FieldMissing, ExtraField, UnknownSchema, Multiple };

// An error of one taxonomy together with the path at which it occurred.
// A Multiple error owns its children, so a report is a tree; `state` of a
// Multiple is a prefix shared by all of its children.
template <typename KindT>
struct Error {
    using Kind = KindT;

    Kind kind = Kind::Multiple;
    std::string_view expected;  // WrongType
    std::string_view actual;    // WrongType
    std::string_view field;     // FieldMissing, ExtraField, UnknownType, UnknownSchema
    std::string error;          // MalformedField, ValidationError
    std::vector<Error> errors;  // Multiple
    Breadcrumb state;

    static Error wrongType(std::string_view expected, std::string_view actual) {
        Error e;
        e.kind = Kind::WrongType;
        e.expected = expected;
        e.actual = actual;
        return e;
    }

    static Error fieldMissing(std::string_view field) {
        Error e;
        e.kind = Kind::FieldMissing;
        e.field = field;
        return e;
    }

    static Error extraField(std::string_view field) {
        Error e;
        e.kind = Kind::ExtraField;
        e.field = field;
        return e;
    }

    static Error unknownSchema(std::string_view uri) {
        Error e;
        e.kind = Kind::UnknownSchema;
        e.field = uri;
        return e;
    }

    static Error multiple(std::vector<Error> errors) {
        Error e;
        e.kind = Kind::Multiple;
        e.errors = std::move(errors);
        return e;
    }

    Error& withPathName(std::string_view name) {
        state.push(name);
        return *this;
    }

    Error& withPathIndex(std::size_t index) {
        state.push(index);
        return *this;
    }

    // The text of this error alone, without its path.
    std::string message() const;

    // Depth-first: a Multiple extends the prefix with its own path and
    // recurses, a leaf writes "<prefix><path>: <message>\n".
    void flatten(std::ostream& os, const std::string& root) const {
        if (kind == Kind::Multiple) {
            std::string prefix = root + state.to_string();
            for (auto const& e : errors) e.flatten(os, prefix);
            return;
        }
        os << root << state << ": " << message() << "\n";
    }

    // Full report rooted at "#".
    std::string to_string() const;

    // Number of non-Multiple errors in the tree.
    std::size_t leafCount() const {
        if (kind != Kind::Multiple) return 1;
        std::size_t n = 0;
        for (auto const& e : errors) n += e.leafCount();
        return n;
    }

    bool operator==(const Error& rhs) const {
        return kind == rhs.kind && expected == rhs.expected && actual == rhs.actual && field == rhs.field &&
               error == rhs.error && errors == rhs.errors && state == rhs.state;
    }
    bool operator!=(const Error& rhs) const { return not(*this == rhs); }
};

using SchemaError = Error<SchemaErrorKind>;
using ValidationError = Error<ValidationErrorKind>;

template <>
std::string Error<SchemaErrorKind>::message() const;
template <>
std::string Error<ValidationErrorKind>::message() const;

extern template struct Error<SchemaErrorKind>;
extern template struct Error<ValidationErrorKind>;

SchemaError malformed_field(std::string error);
SchemaError unknown_type(std::string_view type);
ValidationError violation(std::string error);

std::ostream& operator<<(std::ostream& os, const SchemaError& e);
std::ostream& operator<<(std::ostream& os, const ValidationError& e);

// No errors: success. One error: that error. More: a Multiple holding them all.
template <typename E>
std::optional<E> condense(std::vector<E> errors) {
    if (errors.empty()) return std::nullopt;
    if (errors.size() == 1) return std::move(errors.front());
    return E::multiple(std::move(errors));
}

}  // namespace yv
