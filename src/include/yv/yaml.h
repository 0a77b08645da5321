#pragma once

#include <yv/node.h>
#include <string>
#include <vector>

namespace yv {

// Parse every document of a YAML stream. Documents are separated by `---`
// lines; `...` lines end a document. Throws std::runtime_error on malformed
// input, with the line and column of the problem.
std::vector<Node> parse_yaml_documents(const std::string& text);

// Parse the first document of a YAML stream (Null for an empty stream).
Node parse_yaml(const std::string& text);

}  // namespace yv
