#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace yv {

// Immutable-after-load document tree produced by the YAML and JSON loaders.
// Compiled schemas and errors hold string_views into the keys and string
// values of a Node tree, so a tree must stay alive (and unmodified) for as
// long as anything compiled from or validated against it.
class Node {
  public:
    enum TYPE { String, Integer, Real, Boolean, Null, Array, Hash, BadValue };

    using Sequence = std::vector<Node>;
    using Mapping = std::map<std::string, Node>;

    Node() = default;

    Node(const std::string& s) : my_type(TYPE::String), m_string(s) {}
    Node(std::string&& s) : my_type(TYPE::String), m_string(std::move(s)) {}
    Node(const char* s) : Node(std::string(s)) {}
    Node(int64_t n) : my_type(TYPE::Integer), m_int(n) {}
    Node(int n) : Node(int64_t(n)) {}
    Node(double x) : my_type(TYPE::Real), m_double(x) {}
    Node(bool b) : my_type(TYPE::Boolean), m_bool(b) {}

    static Node null() { return Node(); }

    static Node badValue() {
        Node n;
        n.my_type = TYPE::BadValue;
        return n;
    }

    static Node array(Sequence items = {}) {
        Node n;
        n.my_type = TYPE::Array;
        n.m_array = std::move(items);
        return n;
    }

    static Node hash() {
        Node n;
        n.my_type = TYPE::Hash;
        return n;
    }

    TYPE type() const noexcept { return my_type; }

    // Name of the node kind as it appears in "wrong type" errors.
    std::string_view typeString() const noexcept;

    bool isString() const noexcept { return my_type == TYPE::String; }
    bool isInt() const noexcept { return my_type == TYPE::Integer; }
    bool isReal() const noexcept { return my_type == TYPE::Real; }
    bool isBool() const noexcept { return my_type == TYPE::Boolean; }
    bool isNull() const noexcept { return my_type == TYPE::Null; }
    bool isArray() const noexcept { return my_type == TYPE::Array; }
    bool isHash() const noexcept { return my_type == TYPE::Hash; }
    bool isBadValue() const noexcept { return my_type == TYPE::BadValue; }

    const std::string& asString() const;
    int64_t asInt() const;
    double asDouble() const;
    bool asBool() const;

    // Number of elements for arrays and hashes, 0 for scalars.
    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    bool has(const std::string& key) const { return find(key) != nullptr; }

    // Returns nullptr if this is not a hash or the key is absent.
    const Node* find(const std::string& key) const;

    const Node& at(const std::string& key) const;
    const Node& at(std::size_t index) const;

    const Sequence& elements() const;
    const Mapping& items() const;
    std::vector<std::string> keys() const;

    // Builders used by the loaders. Converts a Null node to the target kind.
    Node& push_back(Node value);
    Node& set(const std::string& key, Node value);

    bool operator==(const Node& rhs) const;
    bool operator!=(const Node& rhs) const { return not(*this == rhs); }

    // Compact JSON-like rendering, used for diagnostics and duplicate detection.
    std::string dump() const;

  private:
    TYPE my_type = TYPE::Null;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;
    Sequence m_array;
    Mapping m_hash;
};

}  // namespace yv
