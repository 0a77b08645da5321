#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>

namespace yv {

// One side of a numeric range, either inclusive (minimum/maximum) or
// exclusive (exclusiveMinimum/exclusiveMaximum).
template <typename T>
struct Limit {
    enum class Kind { Inclusive, Exclusive };

    Kind kind = Kind::Inclusive;
    T value{};

    static Limit inclusive(T v) { return Limit{Kind::Inclusive, v}; }
    static Limit exclusive(T v) { return Limit{Kind::Exclusive, v}; }

    bool isExclusive() const { return kind == Kind::Exclusive; }

    // True when `v` falls below this limit used as a lower bound.
    bool is_lesser(T v) const { return isExclusive() ? v <= value : v < value; }

    // True when `v` falls above this limit used as an upper bound.
    bool is_greater(T v) const { return isExclusive() ? v >= value : v > value; }

    bool operator==(const Limit& rhs) const { return kind == rhs.kind && value == rhs.value; }
};

// Whether at least one value lies within [lower, upper]. With two exclusive
// limits the distance between them must exceed `unit`, the smallest step of T.
template <typename T>
bool has_span(const std::optional<Limit<T>>& lower, const std::optional<Limit<T>>& upper, T unit) {
    if (!lower || !upper) return true;
    if (lower->isExclusive() && upper->isExclusive()) {
        if (upper->value <= lower->value) return false;
        if constexpr (std::is_integral_v<T>) {
            auto span = static_cast<std::uint64_t>(upper->value) - static_cast<std::uint64_t>(lower->value);
            return span > static_cast<std::uint64_t>(unit);
        } else {
            return upper->value - lower->value > unit;
        }
    }
    return upper->value >= lower->value;
}

}  // namespace yv
