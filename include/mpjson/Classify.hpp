/**
 * @file Classify.hpp
 * @brief Format tags of decoded MessagePack objects
 *
 * The decoder dispatches on the tag of each msgpack::object produced by
 * msgpack::unpack. Integers above INT64_MAX get a tag of their own because
 * only they need the big-integer Number representation.
 */

#ifndef MPJSON_CLASSIFY_HPP
#define MPJSON_CLASSIFY_HPP

#include <msgpack.hpp>

namespace mpjson {

enum class FormatTag {
    Nil,
    Boolean,
    Integer,
    UnsignedInteger64,
    Float,
    String,
    Binary,
    Array,
    Map,
    Extension
};

/**
 * @brief Classify a decoded MessagePack object
 * @throws DecodeError for an object type this library does not know
 */
FormatTag format_tag(const msgpack::object& obj);

/**
 * @brief Lower-case name of a tag, for messages
 */
const char* tag_name(FormatTag tag) noexcept;

} // namespace mpjson

#endif // MPJSON_CLASSIFY_HPP
