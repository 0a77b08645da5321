#include <yv/parse.h>
#include <yv/debug.h>
#include <yv/json.h>
#include <yv/yaml.h>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace yv {

namespace {
    // JSON text starts with a bracket or a quote; YAML usually does not.
    bool looks_like_json(const std::string& text) {
        size_t start = 0;
        while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
            ++start;
        }
        if (start >= text.size()) return false;
        char c = text[start];
        return c == '{' || c == '[' || c == '"';
    }
}

std::vector<Node> load_documents(const std::string& text) {
    std::string json_error, yaml_error;

    try {
        std::vector<Node> docs;
        docs.push_back(parse_json(text));
        return docs;
    } catch (const std::exception& e) {
        json_error = e.what();
    }

    try {
        return parse_yaml_documents(text);
    } catch (const std::exception& e) {
        yaml_error = e.what();
    }

    bool json_guess = looks_like_json(text);
    if (debug_enabled()) {
        std::cerr << "[yv] load_documents: JSON failed: " << json_error << "\n";
        std::cerr << "[yv] load_documents: YAML failed: " << yaml_error << "\n";
    }
    std::string msg = "Failed to parse document. Most likely intended format: ";
    msg += json_guess ? "JSON" : "YAML";
    msg += "\n\n";
    msg += json_guess ? json_error : yaml_error;
    throw std::runtime_error(msg);
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("could not open file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace yv
