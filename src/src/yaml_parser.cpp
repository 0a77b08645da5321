#include <yv/yaml.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace yv {

namespace {
    bool is_blank(char c) { return c == ' ' || c == '\t'; }
    bool is_break(char c) { return c == '\n' || c == '\r' || c == '\0'; }

    std::string trim(const std::string& str) {
        size_t b = 0;
        size_t e = str.size();
        while (b < e && std::isspace(static_cast<unsigned char>(str[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(str[e - 1]))) --e;
        return str.substr(b, e - b);
    }

    struct YamlParser {
        const std::string& s;
        size_t i = 0;

        YamlParser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }
        char peek_at(size_t k) const { return k < s.size() ? s[k] : '\0'; }
        char get() { return i < s.size() ? s[i++] : '\0'; }
        bool eof() const { return i >= s.size(); }
        bool at_line_start() const { return i == 0 || s[i - 1] == '\n'; }
        bool at_eol() const { return is_break(peek()); }
        bool at_eol_or_comment() const { return at_eol() || peek() == '#'; }

        [[noreturn]] void fail(const std::string& msg) const {
            size_t line = 1;
            size_t col = 1;
            for (size_t k = 0; k < i && k < s.size(); ++k) {
                if (s[k] == '\n') {
                    ++line;
                    col = 1;
                } else {
                    ++col;
                }
            }
            throw std::runtime_error("YAML parse error: " + msg + " (line " + std::to_string(line) +
                                     ", column " + std::to_string(col) + ")");
        }

        void skip_ws_inline() {
            while (i < s.size() && is_blank(s[i])) ++i;
        }

        void skip_to_eol() {
            while (i < s.size() && s[i] != '\n') ++i;
            if (i < s.size()) ++i;
        }

        // `---` / `...` at column zero
        bool at_marker(const char* marker) const {
            if (!at_line_start()) return false;
            if (s.compare(i, 3, marker) != 0) return false;
            char after = peek_at(i + 3);
            return is_break(after) || is_blank(after);
        }

        // Indentation of the line starting at i. -1 for blank and comment-only
        // lines, -2 for a document marker (which ends every open block).
        int get_indent() const {
            if (at_marker("---") || at_marker("...")) return -2;
            size_t k = i;
            int indent = 0;
            while (k < s.size() && is_blank(s[k])) {
                ++indent;
                ++k;
            }
            if (k >= s.size() || is_break(s[k]) || s[k] == '#') return -1;
            return indent;
        }

        void skip_blank_lines() {
            while (!eof() && get_indent() == -1) skip_to_eol();
        }

        int column() const {
            size_t k = i;
            while (k > 0 && s[k - 1] != '\n') --k;
            return static_cast<int>(i - k);
        }

        bool is_sequence_entry(size_t k) const { return peek_at(k) == '-' && (is_blank(peek_at(k + 1)) || is_break(peek_at(k + 1))); }

        // Does the text starting at `k` look like `key: ...`?
        bool line_has_key(size_t k) const {
            char c = peek_at(k);
            if (c == '[' || c == '{') return false;
            if (c == '"' || c == '\'') {
                size_t j = k + 1;
                while (j < s.size() && s[j] != c && s[j] != '\n') {
                    if (c == '"' && s[j] == '\\') ++j;
                    ++j;
                }
                if (j >= s.size() || s[j] != c) return false;
                ++j;
                while (j < s.size() && is_blank(s[j])) ++j;
                return peek_at(j) == ':' && (is_blank(peek_at(j + 1)) || is_break(peek_at(j + 1)));
            }
            for (size_t j = k; j < s.size() && !is_break(s[j]); ++j) {
                if (s[j] == '#' && j > k && is_blank(s[j - 1])) return false;
                if (s[j] == ':' && (is_blank(peek_at(j + 1)) || is_break(peek_at(j + 1)))) return true;
            }
            return false;
        }

        void finish_line() {
            skip_ws_inline();
            if (peek() == '#' || at_eol()) {
                skip_to_eol();
                return;
            }
            fail("unexpected characters after value");
        }

        std::string parse_quoted() {
            char quote = get();
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') fail("unterminated quoted string");
                if (quote == '\'') {
                    if (c == '\'') {
                        // '' is an escaped single quote
                        if (peek() == '\'') {
                            out.push_back('\'');
                            get();
                            continue;
                        }
                        break;
                    }
                    out.push_back(c);
                    continue;
                }
                if (c == '"') break;
                if (c == '\\') {
                    char e = get();
                    if (e == 'n')
                        out.push_back('\n');
                    else if (e == 't')
                        out.push_back('\t');
                    else if (e == 'r')
                        out.push_back('\r');
                    else if (e == '0')
                        out.push_back('\0');
                    else if (e == '\0')
                        fail("unterminated quoted string");
                    else
                        out.push_back(e);
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        Node parse_scalar(const std::string& str) {
            if (str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL") return Node::null();
            if (str == "true" || str == "True" || str == "TRUE") return Node(true);
            if (str == "false" || str == "False" || str == "FALSE") return Node(false);

            if (str == ".inf" || str == "+.inf" || str == ".Inf" || str == ".INF")
                return Node(std::numeric_limits<double>::infinity());
            if (str == "-.inf" || str == "-.Inf" || str == "-.INF")
                return Node(-std::numeric_limits<double>::infinity());
            if (str == ".nan" || str == ".NaN" || str == ".NAN") return Node(std::nan(""));

            const char* begin = str.c_str();
            char* end = nullptr;

            size_t digits = (str[0] == '-' || str[0] == '+') ? 1 : 0;
            int base = 10;
            if (str.compare(digits, 2, "0x") == 0) base = 16;
            if (str.compare(digits, 2, "0o") == 0) base = 8;
            if (base != 10) {
                std::string body = str.substr(0, digits) + str.substr(digits + 2);
                errno = 0;
                long long v = std::strtoll(body.c_str(), &end, base);
                if (errno == 0 && end != body.c_str() && *end == '\0' && body.size() > digits) return Node(int64_t(v));
                return Node(str);
            }

            if (str.find_first_of(".eE") == std::string::npos) {
                errno = 0;
                long long v = std::strtoll(begin, &end, 10);
                if (errno == 0 && end != begin && *end == '\0') return Node(int64_t(v));
                return Node(str);
            }

            if (str.find_first_of("0123456789") != std::string::npos) {
                errno = 0;
                double d = std::strtod(begin, &end);
                if (errno == 0 && end != begin && *end == '\0') return Node(d);
            }
            return Node(str);
        }

        Node parse_plain() {
            std::string text;
            while (!at_eol()) {
                if (peek() == '#' && (text.empty() || is_blank(text.back()))) break;
                text.push_back(get());
            }
            return parse_scalar(trim(text));
        }

        void skip_flow_ws() {
            while (!eof()) {
                char c = peek();
                if (std::isspace(static_cast<unsigned char>(c))) {
                    get();
                } else if (c == '#') {
                    skip_to_eol();
                } else {
                    break;
                }
            }
        }

        Node parse_flow_item() {
            char c = peek();
            if (c == '[' || c == '{') return parse_flow();
            if (c == '"' || c == '\'') return Node(parse_quoted());
            std::string text;
            while (!eof() && peek() != ',' && peek() != ']' && peek() != '}' && peek() != '\n') text.push_back(get());
            return parse_scalar(trim(text));
        }

        Node parse_flow() {
            char open = get();
            if (open == '[') {
                Node out = Node::array();
                skip_flow_ws();
                if (peek() == ']') {
                    get();
                    return out;
                }
                while (true) {
                    skip_flow_ws();
                    out.push_back(parse_flow_item());
                    skip_flow_ws();
                    char c = get();
                    if (c == ']') break;
                    if (c != ',') fail("expected ',' or ']' in flow sequence");
                    skip_flow_ws();
                    if (peek() == ']') {
                        get();
                        break;
                    }
                }
                return out;
            }

            Node out = Node::hash();
            skip_flow_ws();
            if (peek() == '}') {
                get();
                return out;
            }
            while (true) {
                skip_flow_ws();
                std::string key;
                if (peek() == '"' || peek() == '\'') {
                    key = parse_quoted();
                } else {
                    while (!eof() && peek() != ':' && peek() != ',' && peek() != '}' && peek() != '\n')
                        key.push_back(get());
                    key = trim(key);
                }
                if (key.empty()) fail("empty key in flow mapping");
                skip_flow_ws();
                if (get() != ':') fail("expected ':' after key in flow mapping");
                skip_flow_ws();
                Node value;
                if (peek() != ',' && peek() != '}') value = parse_flow_item();
                if (out.has(key)) fail("duplicate key '" + key + "'");
                out.set(key, std::move(value));
                skip_flow_ws();
                char c = get();
                if (c == '}') break;
                if (c != ',') fail("expected ',' or '}' in flow mapping");
                skip_flow_ws();
                if (peek() == '}') {
                    get();
                    break;
                }
            }
            return out;
        }

        // A scalar or flow collection that occupies the rest of the line.
        Node parse_inline_value() {
            Node v;
            char c = peek();
            if (c == '[' || c == '{') {
                v = parse_flow();
            } else if (c == '"' || c == '\'') {
                v = Node(parse_quoted());
            } else {
                v = parse_plain();
            }
            finish_line();
            return v;
        }

        std::string parse_key() {
            std::string key;
            if (peek() == '"' || peek() == '\'') {
                key = parse_quoted();
                skip_ws_inline();
                if (peek() != ':') fail("expected ':' after key");
            } else {
                while (!at_eol() && !(peek() == ':' && (is_blank(peek_at(i + 1)) || is_break(peek_at(i + 1))))) {
                    if (peek() == '#' && !key.empty() && is_blank(key.back())) break;
                    key.push_back(get());
                }
                if (peek() != ':') fail("expected ':' after key");
                key = trim(key);
                if (key.empty()) fail("empty key");
            }
            get();  // consume ':'
            return key;
        }

        // Value of a `key:` whose content starts on the following lines.
        Node parse_nested(int parent_indent) {
            skip_blank_lines();
            if (eof()) return Node::null();
            int indent = get_indent();
            if (indent > parent_indent) return parse_block(indent);
            // a sequence may sit at the same indentation as its key
            if (indent == parent_indent && is_sequence_entry(i + static_cast<size_t>(indent)))
                return parse_sequence(indent);
            return Node::null();
        }

        Node parse_mapping(int indent) {
            Node out = Node::hash();
            bool first = !at_line_start();
            while (true) {
                if (!first) {
                    skip_blank_lines();
                    if (eof()) break;
                    int ind = get_indent();
                    if (ind < indent) break;
                    if (ind > indent) fail("bad indentation of a mapping entry");
                    if (is_sequence_entry(i + static_cast<size_t>(ind))) break;
                    skip_ws_inline();
                }
                first = false;

                std::string key = parse_key();
                if (out.has(key)) fail("duplicate key '" + key + "'");

                skip_ws_inline();
                Node value;
                if (at_eol_or_comment()) {
                    skip_to_eol();
                    value = parse_nested(indent);
                } else {
                    value = parse_inline_value();
                }
                out.set(key, std::move(value));
            }
            return out;
        }

        Node parse_sequence(int indent) {
            Node out = Node::array();
            bool first = !at_line_start();
            while (true) {
                if (!first) {
                    skip_blank_lines();
                    if (eof()) break;
                    int ind = get_indent();
                    if (ind < indent) break;
                    if (ind > indent) fail("bad indentation of a sequence entry");
                    if (!is_sequence_entry(i + static_cast<size_t>(ind))) break;
                    skip_ws_inline();
                }
                first = false;

                get();  // consume '-'
                skip_ws_inline();
                if (at_eol_or_comment()) {
                    skip_to_eol();
                    skip_blank_lines();
                    int ind2 = eof() ? -1 : get_indent();
                    if (ind2 > indent)
                        out.push_back(parse_block(ind2));
                    else
                        out.push_back(Node::null());
                } else {
                    out.push_back(parse_inline_block(column()));
                }
            }
            return out;
        }

        // Content that starts mid-line, right after a sequence dash.
        Node parse_inline_block(int col) {
            if (is_sequence_entry(i)) return parse_sequence(col);
            if (line_has_key(i)) return parse_mapping(col);
            return parse_inline_value();
        }

        // Expects to be at the start of a content line indented by `indent`.
        Node parse_block(int indent) {
            size_t content = i + static_cast<size_t>(indent);
            if (is_sequence_entry(content)) return parse_sequence(indent);
            if (line_has_key(content)) return parse_mapping(indent);
            skip_ws_inline();
            return parse_inline_value();
        }

        std::vector<Node> parse_documents() {
            std::vector<Node> docs;
            while (true) {
                skip_blank_lines();
                if (eof()) break;
                if (at_marker("...")) {
                    skip_to_eol();
                    continue;
                }
                if (at_marker("---")) {
                    i += 3;
                    skip_ws_inline();
                    if (!at_eol_or_comment()) fail("content after a document marker is not supported");
                    skip_to_eol();
                    skip_blank_lines();
                    // an explicit document with no content
                    if (at_marker("---") || at_marker("...")) docs.push_back(Node::null());
                    continue;
                }
                int indent = get_indent();
                docs.push_back(parse_block(indent));
                skip_blank_lines();
                if (!eof() && !at_marker("---") && !at_marker("...")) fail("unexpected content at end of document");
            }
            return docs;
        }
    };
}  // namespace

std::vector<Node> parse_yaml_documents(const std::string& text) {
    YamlParser parser(text);
    return parser.parse_documents();
}

Node parse_yaml(const std::string& text) {
    auto docs = parse_yaml_documents(text);
    if (docs.empty()) return Node::null();
    return std::move(docs.front());
}

}  // namespace yv
