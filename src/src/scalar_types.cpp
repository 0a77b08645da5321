#include <yv/schema.h>
#include <yv/utils.h>
#include <cmath>

namespace yv {

namespace {
    // Number of UTF-8 code points; continuation bytes are not counted.
    std::size_t utf8_length(const std::string& s) {
        std::size_t n = 0;
        for (unsigned char c : s) {
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    template <typename T>
    bool is_multiple(T value, T divisor) {
        if constexpr (std::is_integral_v<T>) {
            return value % divisor == 0;
        } else {
            return std::fmod(value, divisor) == 0.0;
        }
    }
}

std::optional<SchemaError> compile(const Node& node, SchemaString& out) {
    if (auto err = strict_contents<SchemaError>(node, {}, {"type", "minLength", "maxLength", "pattern"})) return err;

    std::vector<SchemaError> errors;
    if (auto err = read_count(node, "minLength", out.min_length)) errors.push_back(std::move(*err));
    if (auto err = read_count(node, "maxLength", out.max_length)) errors.push_back(std::move(*err));

    std::optional<std::string_view> pattern;
    if (auto err = read_field(node, "pattern", pattern)) {
        errors.push_back(std::move(*err));
    } else if (pattern) {
        try {
            out.pattern.emplace(std::string(*pattern), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            auto bad = malformed_field(e.what());
            bad.withPathName("pattern");
            errors.push_back(std::move(bad));
        }
    }

    if (out.min_length && out.max_length && *out.min_length > *out.max_length)
        errors.push_back(malformed_field("minLength cannot be greater than maxLength"));

    return condense(std::move(errors));
}

std::optional<ValidationError> validate(const Context&, const SchemaString& schema, const Node& node, std::size_t) {
    if (!node.isString()) return ValidationError::wrongType("string", type_to_str(node));

    auto const& value = node.asString();
    std::size_t length = utf8_length(value);
    if (schema.min_length && length < *schema.min_length) return violation("string length is less than minLength");
    if (schema.max_length && length > *schema.max_length)
        return violation("string length is greater than maxLength");
    if (schema.pattern && !std::regex_search(value, *schema.pattern))
        return violation("supplied value does not match regex pattern for field");
    return std::nullopt;
}

template <typename T>
std::optional<SchemaError> compile(const Node& node, NumericSchema<T>& out) {
    if (auto err = strict_contents<SchemaError>(
            node, {}, {"type", "minimum", "maximum", "exclusiveMinimum", "exclusiveMaximum", "multipleOf"}))
        return err;

    std::optional<T> minimum, maximum, exclusive_minimum, exclusive_maximum, multiple_of;
    std::vector<SchemaError> errors;
    if (auto err = read_field(node, "minimum", minimum)) errors.push_back(std::move(*err));
    if (auto err = read_field(node, "maximum", maximum)) errors.push_back(std::move(*err));
    if (auto err = read_field(node, "exclusiveMinimum", exclusive_minimum)) errors.push_back(std::move(*err));
    if (auto err = read_field(node, "exclusiveMaximum", exclusive_maximum)) errors.push_back(std::move(*err));
    if (auto err = read_field(node, "multipleOf", multiple_of)) errors.push_back(std::move(*err));
    if (!errors.empty()) return condense(std::move(errors));

    if (minimum && exclusive_minimum)
        errors.push_back(malformed_field("both minimum and exclusiveMinimum can't be defined at the same time"));
    else if (minimum)
        out.lower = Limit<T>::inclusive(*minimum);
    else if (exclusive_minimum)
        out.lower = Limit<T>::exclusive(*exclusive_minimum);

    if (maximum && exclusive_maximum)
        errors.push_back(malformed_field("both maximum and exclusiveMaximum can't be defined at the same time"));
    else if (maximum)
        out.upper = Limit<T>::inclusive(*maximum);
    else if (exclusive_maximum)
        out.upper = Limit<T>::exclusive(*exclusive_maximum);

    if (!has_span(out.lower, out.upper, NumericTraits<T>::unit))
        errors.push_back(malformed_field("range given for lower and upper limits is empty"));

    if (multiple_of) {
        if (*multiple_of <= 0) {
            auto bad = malformed_field("multipleOf must be greater than zero");
            bad.withPathName("multipleOf");
            errors.push_back(std::move(bad));
        } else {
            out.multiple_of = multiple_of;
        }
    }

    return condense(std::move(errors));
}

template <typename T>
std::optional<ValidationError> validate(const Context&, const NumericSchema<T>& schema, const Node& node,
                                        std::size_t) {
    if (!NumericTraits<T>::matches(node)) return ValidationError::wrongType(NumericTraits<T>::name, type_to_str(node));

    T value = NumericTraits<T>::value(node);
    if (schema.lower && schema.lower->is_lesser(value)) return violation("value violates lower limit constraint");
    if (schema.upper && schema.upper->is_greater(value)) return violation("value violates upper limit constraint");
    if (schema.multiple_of && !is_multiple(value, *schema.multiple_of))
        return violation("value must be a multiple of the multipleOf field");
    return std::nullopt;
}

template std::optional<SchemaError> compile<std::int64_t>(const Node&, SchemaInteger&);
template std::optional<SchemaError> compile<double>(const Node&, SchemaReal&);
template std::optional<ValidationError> validate<std::int64_t>(const Context&, const SchemaInteger&, const Node&,
                                                               std::size_t);
template std::optional<ValidationError> validate<double>(const Context&, const SchemaReal&, const Node&,
                                                         std::size_t);

std::optional<SchemaError> compile(const Node& node, SchemaBool&) {
    return strict_contents<SchemaError>(node, {}, {"type"});
}

std::optional<ValidationError> validate(const Context&, const SchemaBool&, const Node& node, std::size_t) {
    if (!node.isBool()) return ValidationError::wrongType("boolean", type_to_str(node));
    return std::nullopt;
}

}  // namespace yv
