/**
 * @file Json.hpp
 * @brief Conversion between Value and nlohmann::ordered_json
 *
 * ordered_json keeps object members in insertion order, so a document read
 * from text encodes its keys in the order they were written.
 *
 * Numbers map as follows:
 * - number_integer -> int64 Number
 * - number_unsigned -> int64 Number, or uint64 above INT64_MAX
 * - number_float -> double Number
 * Binary values (only produced by nlohmann's binary readers) become base64
 * strings, matching what the codec decodes from MessagePack bin.
 *
 * JSON has no NaN or infinity. to_json keeps such doubles, but dump_json
 * writes them as null, so a decoded non-finite float does not survive a
 * trip through JSON text.
 */

#ifndef MPJSON_JSON_HPP
#define MPJSON_JSON_HPP

#include "mpjson/Value.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mpjson {

using Json = nlohmann::ordered_json;

/**
 * @brief Convert a nlohmann tree into an immutable Value
 */
Value from_json(const Json& j);

/**
 * @brief Convert a Value into a nlohmann tree
 */
Json to_json(const Value& value);

/**
 * @brief Parse JSON text
 *
 * @param text JSON document
 * @param origin Name used in error messages (file path or "<string>")
 * @throws ParseError if the text is not valid JSON
 * @throws OverflowError if an integer literal lies outside
 *         [INT64_MIN, UINT64_MAX]
 */
Value parse_json(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Serialize a Value as JSON text
 * @param indent Spaces per level; negative for compact output
 *
 * NaN and infinite doubles are written as null. Invalid UTF-8 in strings
 * is replaced with U+FFFD.
 */
std::string dump_json(const Value& value, int indent = -1);

/**
 * @brief Load and parse a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the content is not valid JSON
 */
Value load_json_file(const std::string& path);

} // namespace mpjson

#endif // MPJSON_JSON_HPP
