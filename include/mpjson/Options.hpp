/**
 * @file Options.hpp
 * @brief Codec construction options and options-file loading
 *
 * Options file keys (JSON or TOML, detected by extension):
 * - cached_strings: array of strings to decode as shared instances
 * - max_depth: non-negative integer, 0 = unbounded
 * - isolated_int_cache: bool, give the codec its own SmallIntCache
 *
 * Unknown keys are ignored.
 */

#ifndef MPJSON_OPTIONS_HPP
#define MPJSON_OPTIONS_HPP

#include "mpjson/Cache.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <string>

namespace mpjson {

/**
 * @brief Settings fixed at codec construction
 */
struct CodecOptions {
    // Literals decoded as one shared String each. Empty disables the cache.
    std::set<std::string> cached_strings;
    // Small-integer cache to use; nullptr selects SmallIntCache::shared().
    std::shared_ptr<SmallIntCache> int_cache;
    // Deepest container nesting accepted by encode and decode; 0 = unbounded.
    std::size_t max_depth = 0;
};

/**
 * @brief Load options from a .json or .toml file
 *
 * @param path Path to the options file
 * @return Options with every key found in the file applied
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws OptionsError if a key has the wrong type or the extension is unsupported
 */
CodecOptions load_options_file(const std::string& path);

} // namespace mpjson

#endif // MPJSON_OPTIONS_HPP
