/**
 * @file Codec.cpp
 * @brief Implementation of the recursive codec
 */

#include "mpjson/Codec.hpp"
#include "mpjson/Classify.hpp"
#include "mpjson/Errors.hpp"
#include "mpjson/Util.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace mpjson {

namespace {

using Packer = msgpack::packer<Sink>;

void check_depth(std::size_t depth, std::size_t max_depth) {
    if (max_depth != 0 && depth > max_depth) {
        throw NestingDepthError(max_depth);
    }
}

void pack_string(Packer& packer, const std::string& s) {
    if (s.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw IoError("String of " + std::to_string(s.size()) + " bytes exceeds MessagePack limit");
    }
    const auto len = static_cast<std::uint32_t>(s.size());
    packer.pack_str(len);
    packer.pack_str_body(s.data(), len);
}

std::uint32_t container_length(std::size_t n) {
    if (n > std::numeric_limits<std::uint32_t>::max()) {
        throw IoError("Container of " + std::to_string(n) + " entries exceeds MessagePack limit");
    }
    return static_cast<std::uint32_t>(n);
}

void pack_number(Packer& packer, const Number& num) {
    switch (num.repr()) {
        case Number::Repr::Int64: {
            const std::int64_t v = num.int64_value_exact();
            if (v >= std::numeric_limits<std::int32_t>::min() &&
                v <= std::numeric_limits<std::int32_t>::max()) {
                packer.pack_int32(static_cast<std::int32_t>(v));
            } else {
                packer.pack_int64(v);
            }
            break;
        }
        case Number::Repr::UInt64:
            packer.pack_uint64(num.uint64_value_exact());
            break;
        case Number::Repr::Double:
            packer.pack_double(num.double_value());
            break;
    }
}

void encode_value(Packer& packer, const Value& value, std::size_t depth, std::size_t max_depth) {
    switch (value.kind()) {
        case Kind::Null:
            packer.pack_nil();
            break;

        case Kind::Bool:
            if (value.as_bool()) {
                packer.pack_true();
            } else {
                packer.pack_false();
            }
            break;

        case Kind::Number:
            pack_number(packer, value.as_number());
            break;

        case Kind::String:
            pack_string(packer, value.as_string());
            break;

        case Kind::Array: {
            check_depth(depth + 1, max_depth);
            const auto& elements = value.as_array();
            packer.pack_array(container_length(elements.size()));
            for (const auto& element : elements) {
                encode_value(packer, element, depth + 1, max_depth);
            }
            break;
        }

        case Kind::Object: {
            check_depth(depth + 1, max_depth);
            const auto& members = value.as_object();
            packer.pack_map(container_length(members.size()));
            for (const auto& member : members) {
                pack_string(packer, member.first);
                encode_value(packer, member.second, depth + 1, max_depth);
            }
            break;
        }
    }
}

/**
 * @brief Walks one unpacked msgpack::object tree into a Value
 */
class Decoder {
public:
    Decoder(const StringCache& strings, SmallIntCache& ints, std::size_t max_depth)
        : strings_(strings)
        , ints_(ints)
        , max_depth_(max_depth)
    {}

    Value decode(const msgpack::object& obj, std::size_t depth) {
        switch (format_tag(obj)) {
            case FormatTag::Nil:
                return Value::null();

            case FormatTag::Boolean:
                return Value::boolean(obj.via.boolean);

            case FormatTag::Map:
                return decode_map(obj, depth + 1);

            case FormatTag::Array:
                return decode_array(obj, depth + 1);

            case FormatTag::String:
                return decode_string(obj);

            case FormatTag::UnsignedInteger64:
                return Value::number(obj.via.u64);

            case FormatTag::Integer:
                return decode_integer(obj);

            case FormatTag::Float:
                return Value::number(obj.via.f64);

            case FormatTag::Binary:
                // Zero-length payloads may carry a null pointer.
                if (obj.via.bin.size == 0) return Value::string(std::string());
                return Value::string(base64_encode(obj.via.bin.ptr, obj.via.bin.size));

            case FormatTag::Extension:
                throw UnsupportedTypeError("extension (type " +
                                           std::to_string(static_cast<int>(obj.via.ext.type())) + ")");
        }
        throw DecodeError("Unhandled MessagePack format tag");
    }

private:
    const StringCache& strings_;
    SmallIntCache& ints_;
    std::size_t max_depth_;

    Value decode_map(const msgpack::object& obj, std::size_t depth) {
        check_depth(depth, max_depth_);
        const auto& map = obj.via.map;
        if (map.size == 0) {
            return Value::empty_object();
        }

        Value::Object members;
        members.reserve(map.size);
        for (std::uint32_t i = 0; i < map.size; ++i) {
            const msgpack::object& key = map.ptr[i].key;
            if (key.type != msgpack::type::STR) {
                throw DecodeError(std::string("Map key must be a string, got ") +
                                  tag_name(format_tag(key)));
            }
            members.emplace_back(std::string(key.via.str.ptr, key.via.str.size),
                                 decode(map.ptr[i].val, depth));
        }
        return Value::object(std::move(members));
    }

    Value decode_array(const msgpack::object& obj, std::size_t depth) {
        check_depth(depth, max_depth_);
        const auto& array = obj.via.array;
        if (array.size == 0) {
            return Value::empty_array();
        }

        Value::Array elements;
        elements.reserve(array.size);
        for (std::uint32_t i = 0; i < array.size; ++i) {
            elements.push_back(decode(array.ptr[i], depth));
        }
        return Value::array(std::move(elements));
    }

    Value decode_string(const msgpack::object& obj) {
        std::string text(obj.via.str.ptr, obj.via.str.size);
        if (const Value* cached = strings_.find(text)) {
            return *cached;
        }
        return Value::string(std::move(text));
    }

    Value decode_integer(const msgpack::object& obj) {
        const std::int64_t v = obj.type == msgpack::type::POSITIVE_INTEGER
            ? static_cast<std::int64_t>(obj.via.u64)
            : obj.via.i64;
        // int32 and int64 widths share the one [-128, 127] table.
        return ints_.number(v);
    }
};

} // anonymous namespace

// ============================================================================
// Codec
// ============================================================================

Codec::Codec()
    : Codec(CodecOptions())
{}

Codec::Codec(CodecOptions options)
    : strings_(options.cached_strings)
    , ints_(options.int_cache ? std::move(options.int_cache) : SmallIntCache::shared())
    , max_depth_(options.max_depth)
{}

void Codec::encode(Sink& sink, const Value& value) const {
    Packer packer(sink);
    encode_value(packer, value, 0, max_depth_);
}

void Codec::encode_list(Sink& sink, const std::vector<Value>& values) const {
    Packer packer(sink);
    for (const auto& value : values) {
        encode_value(packer, value, 0, max_depth_);
    }
}

Value Codec::decode(Source& source) const {
    if (!source.has_next()) {
        throw DecodeError("No MessagePack data left to decode", source.offset());
    }
    const std::size_t start = source.offset();
    msgpack::object_handle handle = source.next();

    Decoder decoder(strings_, *ints_, max_depth_);
    try {
        return decoder.decode(handle.get(), 0);
    } catch (const UnsupportedTypeError&) {
        throw;
    } catch (const DecodeError& e) {
        if (e.offset() != DecodeError::npos) throw;
        throw DecodeError(e.what(), start);
    }
}

std::vector<Value> Codec::decode_list(Source& source) const {
    std::vector<Value> values;
    while (source.has_next()) {
        values.push_back(decode(source));
    }
    return values;
}

std::string Codec::to_msgpack(const Value& value) const {
    Sink sink;
    encode(sink, value);
    return sink.bytes();
}

Value Codec::from_msgpack(const std::string& bytes) const {
    Source source(bytes);
    Value value = decode(source);
    if (source.has_next()) {
        throw DecodeError(std::to_string(source.size() - source.offset()) +
                          " trailing bytes after MessagePack value", source.offset());
    }
    return value;
}

} // namespace mpjson
