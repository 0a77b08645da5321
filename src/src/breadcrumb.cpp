#include <yv/breadcrumb.h>
#include <sstream>

namespace yv {

std::ostream& operator<<(std::ostream& os, const Breadcrumb& crumb) {
    auto const& segments = crumb.raw();
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (auto name = std::get_if<std::string_view>(&*it))
            os << '.' << *name;
        else
            os << '[' << std::get<std::size_t>(*it) << ']';
    }
    return os;
}

std::string Breadcrumb::to_string() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

}  // namespace yv
