#pragma once

#include <yv/node.h>
#include <string>
#include <vector>

namespace yv {

// Auto-detecting loader. Text holding a single JSON value is parsed as JSON,
// anything else as a (possibly multi-document) YAML stream. If both parsers
// fail a runtime_error is thrown carrying the error of the more likely format.
std::vector<Node> load_documents(const std::string& text);

// Read a whole file into a string. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

}  // namespace yv
