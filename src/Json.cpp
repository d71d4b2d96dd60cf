/**
 * @file Json.cpp
 * @brief Implementation of Value <-> nlohmann::ordered_json conversion
 */

#include "mpjson/Json.hpp"
#include "mpjson/Errors.hpp"
#include "mpjson/Util.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace mpjson {

Value from_json(const Json& j) {
    switch (j.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return Value::null();

        case Json::value_t::boolean:
            return Value::boolean(j.get<bool>());

        case Json::value_t::number_integer:
            return Value::number(j.get<std::int64_t>());

        case Json::value_t::number_unsigned:
            return Value::number(j.get<std::uint64_t>());

        case Json::value_t::number_float:
            return Value::number(j.get<double>());

        case Json::value_t::string:
            return Value::string(j.get<std::string>());

        case Json::value_t::binary: {
            const auto& bin = j.get_binary();
            return Value::string(base64_encode(reinterpret_cast<const char*>(bin.data()), bin.size()));
        }

        case Json::value_t::array: {
            if (j.empty()) return Value::empty_array();
            Value::Array elements;
            elements.reserve(j.size());
            for (const auto& elem : j) {
                elements.push_back(from_json(elem));
            }
            return Value::array(std::move(elements));
        }

        case Json::value_t::object: {
            if (j.empty()) return Value::empty_object();
            Value::Object members;
            members.reserve(j.size());
            for (auto it = j.begin(); it != j.end(); ++it) {
                members.emplace_back(it.key(), from_json(it.value()));
            }
            return Value::object(std::move(members));
        }
    }
    return Value::null();
}

Json to_json(const Value& value) {
    switch (value.kind()) {
        case Kind::Null:
            return Json(nullptr);

        case Kind::Bool:
            return Json(value.as_bool());

        case Kind::Number: {
            const Number& num = value.as_number();
            switch (num.repr()) {
                case Number::Repr::Int64: return Json(num.int64_value_exact());
                case Number::Repr::UInt64: return Json(num.uint64_value_exact());
                case Number::Repr::Double: return Json(num.double_value());
            }
            break;
        }

        case Kind::String:
            return Json(value.as_string());

        case Kind::Array: {
            Json arr = Json::array();
            for (const auto& elem : value.as_array()) {
                arr.push_back(to_json(elem));
            }
            return arr;
        }

        case Kind::Object: {
            Json obj = Json::object();
            for (const auto& member : value.as_object()) {
                obj[member.first] = to_json(member.second);
            }
            return obj;
        }
    }
    return Json(nullptr);
}

namespace {

/**
 * @brief SAX handler building a Value straight from JSON text
 *
 * nlohmann reports an integer literal outside [INT64_MIN, UINT64_MAX] as a
 * float. The raw token is visible here, so such literals raise
 * OverflowError instead of silently losing precision.
 */
class ValueBuilder : public nlohmann::json_sax<Json> {
public:
    explicit ValueBuilder(std::string origin)
        : origin_(std::move(origin))
    {}

    Value result() { return std::move(result_); }

    bool null() override { return add(Value::null()); }
    bool boolean(bool val) override { return add(Value::boolean(val)); }
    bool number_integer(number_integer_t val) override { return add(Value::number(std::int64_t{val})); }
    bool number_unsigned(number_unsigned_t val) override { return add(Value::number(std::uint64_t{val})); }

    bool number_float(number_float_t val, const string_t& text) override {
        if (text.find_first_of(".eE") == string_t::npos) {
            throw OverflowError(text, text[0] == '-' ? "int64" : "uint64");
        }
        return add(Value::number(val));
    }

    bool string(string_t& val) override { return add(Value::string(std::move(val))); }

    bool binary(binary_t& val) override {
        return add(Value::string(base64_encode(reinterpret_cast<const char*>(val.data()), val.size())));
    }

    bool start_object(std::size_t) override {
        frames_.emplace_back();
        frames_.back().is_object = true;
        return true;
    }

    bool key(string_t& val) override {
        frames_.back().key = std::move(val);
        return true;
    }

    bool end_object() override {
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return add(frame.members.empty() ? Value::empty_object()
                                         : Value::object(std::move(frame.members)));
    }

    bool start_array(std::size_t) override {
        frames_.emplace_back();
        return true;
    }

    bool end_array() override {
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return add(frame.elements.empty() ? Value::empty_array()
                                          : Value::array(std::move(frame.elements)));
    }

    bool parse_error(std::size_t, const std::string&, const Json::exception& ex) override {
        throw ParseError(origin_, 0, 0, ex.what());
    }

private:
    struct Frame {
        bool is_object = false;
        std::string key;
        Value::Array elements;
        Value::Object members;
    };

    std::string origin_;
    std::vector<Frame> frames_;
    Value result_;

    bool add(Value v) {
        if (frames_.empty()) {
            result_ = std::move(v);
        } else if (frames_.back().is_object) {
            frames_.back().members.emplace_back(std::move(frames_.back().key), std::move(v));
        } else {
            frames_.back().elements.push_back(std::move(v));
        }
        return true;
    }
};

} // anonymous namespace

Value parse_json(const std::string& text, const std::string& origin) {
    ValueBuilder builder(origin);
    if (!Json::sax_parse(text, &builder)) {
        throw ParseError(origin, 0, 0, "JSON document ended unexpectedly");
    }
    return builder.result();
}

std::string dump_json(const Value& value, int indent) {
    return to_json(value).dump(indent, ' ', false, Json::error_handler_t::replace);
}

Value load_json_file(const std::string& path) {
    return parse_json(read_file(path), path);
}

} // namespace mpjson
