#ifndef MPJSON_UTIL_HPP
#define MPJSON_UTIL_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace mpjson {

// Standard base64 (RFC 4648 alphabet) with '=' padding.
std::string base64_encode(const char* data, std::size_t size);

// Helpers
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char delim);

// Lower-cased extension of path including the dot (".json"), or "".
std::string file_extension(const std::string& path);

// Read a whole file in binary mode. Throws FileNotFoundError / IoError.
std::string read_file(const std::string& path);

} // namespace mpjson

#endif // MPJSON_UTIL_HPP
