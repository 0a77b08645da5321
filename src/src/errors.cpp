#include <yv/errors.h>
#include <sstream>

namespace yv {

template <>
std::string Error<SchemaErrorKind>::message() const {
    switch (kind) {
        case SchemaErrorKind::WrongType:
            return "wrong type, expected " + std::string(expected) + " got " + std::string(actual);
        case SchemaErrorKind::MalformedField:
            return "malformed field: " + error;
        case SchemaErrorKind::FieldMissing:
            return "missing field, '" + std::string(field) + "' not found";
        case SchemaErrorKind::ExtraField:
            return "field '" + std::string(field) + "' is not specified in the schema";
        case SchemaErrorKind::UnknownType:
            return "unknown type specified: " + std::string(field);
        case SchemaErrorKind::UnknownSchema:
            return "schema '" + std::string(field) + "' references was not found";
        case SchemaErrorKind::Multiple:
            break;
    }
    return "multiple errors were encountered";
}

template <>
std::string Error<ValidationErrorKind>::message() const {
    switch (kind) {
        case ValidationErrorKind::WrongType:
            return "wrong type, expected " + std::string(expected) + " got " + std::string(actual);
        case ValidationErrorKind::ValidationError:
            return "special requirements for field not met: " + error;
        case ValidationErrorKind::FieldMissing:
            return "missing field, '" + std::string(field) + "' not found";
        case ValidationErrorKind::ExtraField:
            return "field '" + std::string(field) + "' is not specified in the schema";
        case ValidationErrorKind::UnknownSchema:
            return "schema '" + std::string(field) + "' references was not found";
        case ValidationErrorKind::Multiple:
            break;
    }
    return "multiple errors were encountered";
}

template <typename KindT>
std::string Error<KindT>::to_string() const {
    std::ostringstream ss;
    flatten(ss, "#");
    return ss.str();
}

template struct Error<SchemaErrorKind>;
template struct Error<ValidationErrorKind>;

SchemaError malformed_field(std::string error) {
    SchemaError e;
    e.kind = SchemaErrorKind::MalformedField;
    e.error = std::move(error);
    return e;
}

SchemaError unknown_type(std::string_view type) {
    SchemaError e;
    e.kind = SchemaErrorKind::UnknownType;
    e.field = type;
    return e;
}

ValidationError violation(std::string error) {
    ValidationError e;
    e.kind = ValidationErrorKind::ValidationError;
    e.error = std::move(error);
    return e;
}

std::ostream& operator<<(std::ostream& os, const SchemaError& e) { return os << e.to_string(); }

std::ostream& operator<<(std::ostream& os, const ValidationError& e) { return os << e.to_string(); }

}  // namespace yv
