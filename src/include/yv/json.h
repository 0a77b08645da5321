#pragma once

#include <yv/node.h>
#include <string>

namespace yv {

// Parse a single JSON value. `//` and `/* */` comments are accepted.
// Throws std::runtime_error ("JSON parse error: ...") with line/column info.
Node parse_json(const std::string& text);

namespace json_literals {
    inline Node operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}  // namespace json_literals

}  // namespace yv
