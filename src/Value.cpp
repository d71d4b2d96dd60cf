/**
 * @file Value.cpp
 * @brief Implementation of the immutable value tree
 */

#include "mpjson/Value.hpp"
#include "mpjson/Errors.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace mpjson {

// ============================================================================
// Number
// ============================================================================

Number::Number(std::int64_t value) noexcept
    : repr_(Repr::Int64)
{
    v_.i64 = value;
}

Number::Number(std::uint64_t value) noexcept {
    if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        repr_ = Repr::Int64;
        v_.i64 = static_cast<std::int64_t>(value);
    } else {
        repr_ = Repr::UInt64;
        v_.u64 = value;
    }
}

Number::Number(double value) noexcept
    : repr_(Repr::Double)
{
    v_.f64 = value;
}

std::int32_t Number::int32_value_exact() const {
    if (repr_ == Repr::Int64 &&
        v_.i64 >= std::numeric_limits<std::int32_t>::min() &&
        v_.i64 <= std::numeric_limits<std::int32_t>::max()) {
        return static_cast<std::int32_t>(v_.i64);
    }
    throw OverflowError(to_string(), "int32");
}

std::int64_t Number::int64_value_exact() const {
    if (repr_ == Repr::Int64) {
        return v_.i64;
    }
    throw OverflowError(to_string(), "int64");
}

std::uint64_t Number::uint64_value_exact() const {
    switch (repr_) {
        case Repr::Int64:
            if (v_.i64 >= 0) return static_cast<std::uint64_t>(v_.i64);
            break;
        case Repr::UInt64:
            return v_.u64;
        case Repr::Double:
            break;
    }
    throw OverflowError(to_string(), "uint64");
}

double Number::double_value() const noexcept {
    switch (repr_) {
        case Repr::Int64:
            return static_cast<double>(v_.i64);
        case Repr::UInt64:
            return static_cast<double>(v_.u64);
        case Repr::Double:
            return v_.f64;
    }
    return v_.f64;
}

std::string Number::to_string() const {
    switch (repr_) {
        case Repr::Int64:
            return std::to_string(v_.i64);
        case Repr::UInt64:
            return std::to_string(v_.u64);
        case Repr::Double: {
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v_.f64;
            return oss.str();
        }
    }
    return std::string();
}

bool operator==(const Number& a, const Number& b) noexcept {
    if (a.repr_ != b.repr_) return false;
    switch (a.repr_) {
        case Number::Repr::Int64:
            return a.v_.i64 == b.v_.i64;
        case Number::Repr::UInt64:
            return a.v_.u64 == b.v_.u64;
        case Number::Repr::Double:
            return a.v_.f64 == b.v_.f64;
    }
    return false;
}

// ============================================================================
// Value
// ============================================================================

// Alternative order follows Kind, so index() maps directly onto it.
struct Value::Node {
    using Data = std::variant<std::monostate, bool, Number, std::string, Array, Object>;

    explicit Node(Data d)
        : data(std::move(d))
    {}

    Data data;
};

Value::Value()
    : Value(null())
{}

Value Value::null() {
    static const std::shared_ptr<const Node> node =
        std::make_shared<Node>(Node::Data(std::monostate()));
    return Value(node);
}

Value Value::boolean(bool b) {
    static const std::shared_ptr<const Node> true_node =
        std::make_shared<Node>(Node::Data(true));
    static const std::shared_ptr<const Node> false_node =
        std::make_shared<Node>(Node::Data(false));
    return Value(b ? true_node : false_node);
}

Value Value::number(std::int64_t v) {
    return number(Number(v));
}

Value Value::number(std::uint64_t v) {
    return number(Number(v));
}

Value Value::number(double v) {
    return number(Number(v));
}

Value Value::number(const Number& n) {
    return Value(std::make_shared<Node>(Node::Data(n)));
}

Value Value::string(std::string s) {
    return Value(std::make_shared<Node>(Node::Data(std::move(s))));
}

Value Value::array(Array elements) {
    return Value(std::make_shared<Node>(Node::Data(std::move(elements))));
}

Value Value::empty_array() {
    static const std::shared_ptr<const Node> node =
        std::make_shared<Node>(Node::Data(Array()));
    return Value(node);
}

Value Value::empty_object() {
    static const std::shared_ptr<const Node> node =
        std::make_shared<Node>(Node::Data(Object()));
    return Value(node);
}

Value Value::object(Object members) {
    Object unique;
    unique.reserve(members.size());
    std::unordered_map<std::string_view, std::size_t> index;
    index.reserve(members.size());

    for (auto& member : members) {
        auto it = index.find(member.first);
        if (it != index.end()) {
            unique[it->second].second = std::move(member.second);
            continue;
        }
        unique.push_back(std::move(member));
        // Keys are stable once moved into `unique` (reserved, no reallocation).
        index.emplace(unique.back().first, unique.size() - 1);
    }
    return Value(std::make_shared<Node>(Node::Data(std::move(unique))));
}

Kind Value::kind() const noexcept {
    return static_cast<Kind>(node_->data.index());
}

bool Value::as_bool() const {
    if (const auto* b = std::get_if<bool>(&node_->data)) return *b;
    throw TypeError("boolean", type_name(*this));
}

const Number& Value::as_number() const {
    if (const auto* n = std::get_if<Number>(&node_->data)) return *n;
    throw TypeError("number", type_name(*this));
}

const std::string& Value::as_string() const {
    if (const auto* s = std::get_if<std::string>(&node_->data)) return *s;
    throw TypeError("string", type_name(*this));
}

const Value::Array& Value::as_array() const {
    if (const auto* a = std::get_if<Array>(&node_->data)) return *a;
    throw TypeError("array", type_name(*this));
}

const Value::Object& Value::as_object() const {
    if (const auto* o = std::get_if<Object>(&node_->data)) return *o;
    throw TypeError("object", type_name(*this));
}

std::size_t Value::size() const noexcept {
    if (const auto* a = std::get_if<Array>(&node_->data)) return a->size();
    if (const auto* o = std::get_if<Object>(&node_->data)) return o->size();
    return 0;
}

const Value& Value::at(std::size_t index) const {
    const Array& elements = as_array();
    if (index >= elements.size()) {
        throw std::out_of_range("Array index " + std::to_string(index) +
                                " out of range (size " + std::to_string(elements.size()) + ")");
    }
    return elements[index];
}

const Value& Value::at(const std::string& key) const {
    (void)as_object();
    const Value* member = find(key);
    if (!member) {
        throw std::out_of_range("Missing key: " + key);
    }
    return *member;
}

const Value* Value::find(const std::string& key) const noexcept {
    const auto* members = std::get_if<Object>(&node_->data);
    if (!members) return nullptr;
    for (const auto& member : *members) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

bool operator==(const Value& a, const Value& b) {
    if (a.same_instance(b)) return true;
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case Kind::Null:
            return true;
        case Kind::Bool:
            return a.as_bool() == b.as_bool();
        case Kind::Number:
            return a.as_number() == b.as_number();
        case Kind::String:
            return a.as_string() == b.as_string();
        case Kind::Array:
            return a.as_array() == b.as_array();
        case Kind::Object: {
            // Member order does not take part in equality.
            const auto& am = a.as_object();
            if (am.size() != b.size()) return false;
            for (const auto& member : am) {
                const Value* other = b.find(member.first);
                if (!other || !(*other == member.second)) return false;
            }
            return true;
        }
    }
    return false;
}

std::string type_name(const Value& val) {
    switch (val.kind()) {
        case Kind::Null: return "null";
        case Kind::Bool: return "boolean";
        case Kind::Number: return val.as_number().is_integral() ? "integer" : "float";
        case Kind::String: return "string";
        case Kind::Array: return "array";
        case Kind::Object: return "object";
    }
    return "unknown";
}

} // namespace mpjson
