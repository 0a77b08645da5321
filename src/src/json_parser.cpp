#include <yv/json.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace yv {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
            return c;
        }

        [[noreturn]] void fail(const std::string& base) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = col > 0 ? col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();

            std::ostringstream ss;
            ss << "JSON parse error: " << base << " (line " << line << ", column " << col << ")\n";
            ss << line_text << "\n" << std::string(caret_pos, ' ') << '^';
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            throw std::runtime_error(ss.str());
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) fail("unterminated block comment");
                    continue;
                }
                break;
            }
        }

        std::string parse_string() {
            get();  // opening quote
            std::string out;
            while (true) {
                if (i >= s.size()) fail("unexpected end of input in string");
                char c = get();
                if (c == '"') break;
                if (c == '\n') fail("newline in string");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"':
                    case '\\':
                    case '/':
                        out.push_back(e);
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'u': {
                        unsigned code = 0;
                        for (int k = 0; k < 4; ++k) {
                            char h = get();
                            if (!std::isxdigit(static_cast<unsigned char>(h))) fail("invalid unicode escape");
                            code = code * 16 + static_cast<unsigned>(std::isdigit(static_cast<unsigned char>(h))
                                                                         ? h - '0'
                                                                         : std::tolower(h) - 'a' + 10);
                        }
                        // encode as UTF-8 (surrogate pairs are not combined)
                        if (code < 0x80) {
                            out.push_back(static_cast<char>(code));
                        } else if (code < 0x800) {
                            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
                            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                        } else {
                            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
                            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                        }
                        break;
                    }
                    default:
                        fail(std::string("invalid escape '\\") + e + "'");
                }
            }
            return out;
        }

        Node parse_number() {
            size_t start = i;
            bool is_real = false;
            if (peek() == '-') get();
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            if (peek() == '.') {
                is_real = true;
                get();
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_real = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string text = s.substr(start, i - start);
            char* end = nullptr;
            errno = 0;
            if (not is_real) {
                long long v = std::strtoll(text.c_str(), &end, 10);
                if (errno == 0 and end != text.c_str() and *end == '\0') return Node(int64_t(v));
                errno = 0;
            }
            double d = std::strtod(text.c_str(), &end);
            if (errno != 0 or end == text.c_str() or *end != '\0') fail("invalid number '" + text + "'");
            return Node(d);
        }

        void expect_word(const char* word) {
            for (const char* p = word; *p; ++p) {
                if (get() != *p) fail(std::string("invalid literal, expected '") + word + "'");
            }
        }

        Node parse_value() {
            skip_ws();
            char c = peek();
            if (c == '\0') fail("unexpected end of input");
            if (c == '{') {
                push_opener('{');
                get();
                Node out = Node::hash();
                skip_ws();
                if (peek() == '}') {
                    get();
                    opener_stack.pop_back();
                    return out;
                }
                while (true) {
                    skip_ws();
                    if (peek() != '"') fail("expected string key in object");
                    std::string key = parse_string();
                    skip_ws();
                    if (get() != ':') fail("expected ':' after key in object");
                    if (out.has(key)) fail("duplicate key '" + key + "' in object");
                    out.set(key, parse_value());
                    skip_ws();
                    char d = get();
                    if (d == '}') break;
                    if (d != ',') fail("expected ',' or '}' in object");
                }
                opener_stack.pop_back();
                return out;
            }
            if (c == '[') {
                push_opener('[');
                get();
                Node out = Node::array();
                skip_ws();
                if (peek() == ']') {
                    get();
                    opener_stack.pop_back();
                    return out;
                }
                while (true) {
                    out.push_back(parse_value());
                    skip_ws();
                    char d = get();
                    if (d == ']') break;
                    if (d != ',') fail("expected ',' or ']' in array");
                }
                opener_stack.pop_back();
                return out;
            }
            if (c == '"') return Node(parse_string());
            if (c == 't') {
                expect_word("true");
                return Node(true);
            }
            if (c == 'f') {
                expect_word("false");
                return Node(false);
            }
            if (c == 'n') {
                expect_word("null");
                return Node::null();
            }
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            fail(std::string("unexpected character '") + c + "'");
        }

        void push_opener(char ch) { opener_stack.push_back(Opener{ch, line, col}); }

        Node parse() {
            Node v = parse_value();
            skip_ws();
            if (i < s.size()) fail("extra data after JSON value");
            return v;
        }
    };
}  // namespace

Node parse_json(const std::string& text) {
    Parser p(text);
    return p.parse();
}

}  // namespace yv
