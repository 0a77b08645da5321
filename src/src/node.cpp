#include <yv/node.h>
#include <iomanip>
#include <sstream>

namespace yv {

namespace {
    void dump_string(std::ostringstream& ss, const std::string& s) {
        ss << '"';
        for (char c : s) {
            switch (c) {
                case '"':
                    ss << "\\\"";
                    break;
                case '\\':
                    ss << "\\\\";
                    break;
                case '\n':
                    ss << "\\n";
                    break;
                case '\t':
                    ss << "\\t";
                    break;
                case '\r':
                    ss << "\\r";
                    break;
                default:
                    ss << c;
            }
        }
        ss << '"';
    }

    void dump_value(std::ostringstream& ss, const Node& n) {
        switch (n.type()) {
            case Node::String:
                dump_string(ss, n.asString());
                break;
            case Node::Integer:
                ss << n.asInt();
                break;
            case Node::Real: {
                std::ostringstream r;
                r << std::setprecision(17) << n.asDouble();
                std::string text = r.str();
                // keep reals distinguishable from integers
                if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
                ss << text;
                break;
            }
            case Node::Boolean:
                ss << (n.asBool() ? "true" : "false");
                break;
            case Node::Null:
                ss << "null";
                break;
            case Node::BadValue:
                ss << "<bad value>";
                break;
            case Node::Array: {
                ss << '[';
                bool first = true;
                for (auto const& el : n.elements()) {
                    if (!first) ss << ',';
                    first = false;
                    dump_value(ss, el);
                }
                ss << ']';
                break;
            }
            case Node::Hash: {
                ss << '{';
                bool first = true;
                for (auto const& p : n.items()) {
                    if (!first) ss << ',';
                    first = false;
                    dump_string(ss, p.first);
                    ss << ':';
                    dump_value(ss, p.second);
                }
                ss << '}';
                break;
            }
        }
    }

    std::runtime_error wrong_kind(const Node& n, const char* wanted) {
        return std::runtime_error(std::string("node is not ") + wanted + " (it is " +
                                  std::string(n.typeString()) + ")");
    }
}  // namespace

std::string_view Node::typeString() const noexcept {
    switch (my_type) {
        case TYPE::String:
            return "string";
        case TYPE::Integer:
            return "integer";
        case TYPE::Real:
            return "float";
        case TYPE::Boolean:
            return "boolean";
        case TYPE::Null:
            return "null";
        case TYPE::Array:
            return "array";
        case TYPE::Hash:
            return "hash";
        case TYPE::BadValue:
            break;
    }
    return "bad_value";
}

const std::string& Node::asString() const {
    if (my_type != TYPE::String) throw wrong_kind(*this, "a string");
    return m_string;
}

int64_t Node::asInt() const {
    if (my_type != TYPE::Integer) throw wrong_kind(*this, "an integer");
    return m_int;
}

double Node::asDouble() const {
    if (my_type == TYPE::Real) return m_double;
    if (my_type == TYPE::Integer) return static_cast<double>(m_int);
    throw wrong_kind(*this, "a number");
}

bool Node::asBool() const {
    if (my_type != TYPE::Boolean) throw wrong_kind(*this, "a boolean");
    return m_bool;
}

std::size_t Node::size() const noexcept {
    switch (my_type) {
        case TYPE::Array:
            return m_array.size();
        case TYPE::Hash:
            return m_hash.size();
        default:
            return 0;
    }
}

const Node* Node::find(const std::string& key) const {
    if (my_type != TYPE::Hash) return nullptr;
    auto it = m_hash.find(key);
    if (it == m_hash.end()) return nullptr;
    return &it->second;
}

const Node& Node::at(const std::string& key) const {
    const Node* n = find(key);
    if (n == nullptr) throw std::out_of_range("key '" + key + "' not found");
    return *n;
}

const Node& Node::at(std::size_t index) const {
    if (my_type != TYPE::Array) throw wrong_kind(*this, "an array");
    if (index >= m_array.size())
        throw std::out_of_range("index " + std::to_string(index) + " out of range");
    return m_array[index];
}

const Node::Sequence& Node::elements() const {
    if (my_type != TYPE::Array) throw wrong_kind(*this, "an array");
    return m_array;
}

const Node::Mapping& Node::items() const {
    if (my_type != TYPE::Hash) throw wrong_kind(*this, "a hash");
    return m_hash;
}

std::vector<std::string> Node::keys() const {
    std::vector<std::string> out;
    if (my_type != TYPE::Hash) return out;
    out.reserve(m_hash.size());
    for (auto const& p : m_hash) out.push_back(p.first);
    return out;
}

Node& Node::push_back(Node value) {
    if (my_type == TYPE::Null) my_type = TYPE::Array;
    if (my_type != TYPE::Array) throw wrong_kind(*this, "an array");
    m_array.push_back(std::move(value));
    return m_array.back();
}

Node& Node::set(const std::string& key, Node value) {
    if (my_type == TYPE::Null) my_type = TYPE::Hash;
    if (my_type != TYPE::Hash) throw wrong_kind(*this, "a hash");
    auto& slot = m_hash[key];
    slot = std::move(value);
    return slot;
}

bool Node::operator==(const Node& rhs) const {
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case TYPE::String:
            return m_string == rhs.m_string;
        case TYPE::Integer:
            return m_int == rhs.m_int;
        case TYPE::Real:
            return m_double == rhs.m_double;
        case TYPE::Boolean:
            return m_bool == rhs.m_bool;
        case TYPE::Array:
            return m_array == rhs.m_array;
        case TYPE::Hash:
            return m_hash == rhs.m_hash;
        case TYPE::Null:
        case TYPE::BadValue:
            return true;
    }
    return false;
}

std::string Node::dump() const {
    std::ostringstream ss;
    dump_value(ss, *this);
    return ss.str();
}

}  // namespace yv
