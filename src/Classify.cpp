/**
 * @file Classify.cpp
 * @brief Implementation of format tag classification
 */

#include "mpjson/Classify.hpp"
#include "mpjson/Errors.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace mpjson {

FormatTag format_tag(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return FormatTag::Nil;
        case msgpack::type::BOOLEAN:
            return FormatTag::Boolean;
        case msgpack::type::POSITIVE_INTEGER:
            if (obj.via.u64 > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return FormatTag::UnsignedInteger64;
            }
            return FormatTag::Integer;
        case msgpack::type::NEGATIVE_INTEGER:
            return FormatTag::Integer;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return FormatTag::Float;
        case msgpack::type::STR:
            return FormatTag::String;
        case msgpack::type::BIN:
            return FormatTag::Binary;
        case msgpack::type::ARRAY:
            return FormatTag::Array;
        case msgpack::type::MAP:
            return FormatTag::Map;
        case msgpack::type::EXT:
            return FormatTag::Extension;
    }
    throw DecodeError("Unknown MessagePack object type " +
                      std::to_string(static_cast<int>(obj.type)));
}

const char* tag_name(FormatTag tag) noexcept {
    switch (tag) {
        case FormatTag::Nil: return "nil";
        case FormatTag::Boolean: return "boolean";
        case FormatTag::Integer: return "integer";
        case FormatTag::UnsignedInteger64: return "uint64";
        case FormatTag::Float: return "float";
        case FormatTag::String: return "string";
        case FormatTag::Binary: return "binary";
        case FormatTag::Array: return "array";
        case FormatTag::Map: return "map";
        case FormatTag::Extension: return "extension";
    }
    return "unknown";
}

} // namespace mpjson
