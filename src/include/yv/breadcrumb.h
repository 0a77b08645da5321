#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace yv {

// Path from the root of a compile/validate call down to a failure.
// Segments are pushed leaf-to-root while an error travels back up the call
// stack, and rendered in reverse: names as ".name", indices as "[n]".
class Breadcrumb {
  public:
    using Segment = std::variant<std::string_view, std::size_t>;

    void push(std::string_view name) { segments.emplace_back(std::in_place_index<0>, name); }
    void push(std::size_t index) { segments.emplace_back(std::in_place_index<1>, index); }

    bool empty() const noexcept { return segments.empty(); }
    std::size_t size() const noexcept { return segments.size(); }

    // Segments in push (leaf-to-root) order.
    const std::vector<Segment>& raw() const noexcept { return segments; }

    std::string to_string() const;

    bool operator==(const Breadcrumb& rhs) const { return segments == rhs.segments; }
    bool operator!=(const Breadcrumb& rhs) const { return not(*this == rhs); }

  private:
    std::vector<Segment> segments;
};

std::ostream& operator<<(std::ostream& os, const Breadcrumb& crumb);

}  // namespace yv
