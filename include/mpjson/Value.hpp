/**
 * @file Value.hpp
 * @brief Immutable JSON value tree exchanged with the codec
 *
 * Supports:
 * - Null
 * - Bool (true | false)
 * - Number (int64, uint64 above INT64_MAX, or double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 *
 * A Value is a handle to a reference-counted, immutable node. Copies share
 * the node; same_instance() tells whether two handles share one, which is
 * how decode-side caching becomes observable.
 */

#ifndef MPJSON_VALUE_HPP
#define MPJSON_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mpjson {

/**
 * @brief Structural kind of a Value
 */
enum class Kind {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Numeric payload of a Number value
 *
 * Integral numbers are held as int64; only integers above INT64_MAX use the
 * uint64 representation. Floating-point numbers are held as double and never
 * count as integral, even when they have no fractional part.
 */
class Number {
public:
    enum class Repr {
        Int64,
        UInt64,
        Double
    };

    explicit Number(int value) noexcept : Number(static_cast<std::int64_t>(value)) {}
    explicit Number(std::int64_t value) noexcept;
    explicit Number(std::uint64_t value) noexcept;
    explicit Number(double value) noexcept;

    Repr repr() const noexcept { return repr_; }
    bool is_integral() const noexcept { return repr_ != Repr::Double; }

    /**
     * @brief Integral value that fits into int32
     * @throws OverflowError if the number is floating or out of range
     */
    std::int32_t int32_value_exact() const;

    /**
     * @brief Integral value that fits into int64
     * @throws OverflowError if the number is floating or above INT64_MAX
     */
    std::int64_t int64_value_exact() const;

    /**
     * @brief Non-negative integral value, including values above INT64_MAX
     * @throws OverflowError if the number is floating or negative
     */
    std::uint64_t uint64_value_exact() const;

    /**
     * @brief Nearest double; never fails
     */
    double double_value() const noexcept;

    /**
     * @brief Exact decimal text for integers, round-trip precision text for doubles
     */
    std::string to_string() const;

    friend bool operator==(const Number& a, const Number& b) noexcept;
    friend bool operator!=(const Number& a, const Number& b) noexcept { return !(a == b); }

private:
    Repr repr_;
    union {
        std::int64_t i64;
        std::uint64_t u64;
        double f64;
    } v_;
};

/**
 * @brief Immutable JSON value handle
 */
class Value {
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    /**
     * @brief Null value (shares the null singleton)
     */
    Value();

    // Factories. null(), boolean(), empty_array() and empty_object() hand out
    // process-wide singletons; the others allocate a fresh node.
    static Value null();
    static Value boolean(bool b);
    static Value number(int v) { return number(static_cast<std::int64_t>(v)); }
    static Value number(std::int64_t v);
    static Value number(std::uint64_t v);
    static Value number(double v);
    static Value number(const Number& n);
    static Value string(std::string s);
    static Value array(Array elements);
    static Value empty_array();
    static Value empty_object();

    /**
     * @brief Build an object from members in order
     *
     * A key given more than once keeps its first position and takes the
     * last value.
     */
    static Value object(Object members);

    Kind kind() const noexcept;

    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_bool() const noexcept { return kind() == Kind::Bool; }
    bool is_number() const noexcept { return kind() == Kind::Number; }
    bool is_string() const noexcept { return kind() == Kind::String; }
    bool is_array() const noexcept { return kind() == Kind::Array; }
    bool is_object() const noexcept { return kind() == Kind::Object; }

    // Kind-checked accessors; throw TypeError on mismatch.
    bool as_bool() const;
    const Number& as_number() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const Object& as_object() const;

    /**
     * @brief Element or member count; 0 for scalars
     */
    std::size_t size() const noexcept;

    /**
     * @brief Array element by index
     * @throws TypeError if not an array
     * @throws std::out_of_range if index >= size()
     */
    const Value& at(std::size_t index) const;

    /**
     * @brief Object member by key
     * @throws TypeError if not an object
     * @throws std::out_of_range if the key is absent
     */
    const Value& at(const std::string& key) const;

    /**
     * @brief Object member by key, nullptr if absent or not an object
     */
    const Value* find(const std::string& key) const noexcept;

    /**
     * @brief True if both handles refer to the same node
     */
    bool same_instance(const Value& other) const noexcept {
        return node_ == other.node_;
    }

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    struct Node;

    explicit Value(std::shared_ptr<const Node> node) noexcept
        : node_(std::move(node))
    {}

    std::shared_ptr<const Node> node_;
};

/**
 * @brief Human-readable kind name for a Value
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
std::string type_name(const Value& val);

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace mpjson

#endif // MPJSON_VALUE_HPP
