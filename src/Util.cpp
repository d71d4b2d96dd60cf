#include "mpjson/Util.hpp"
#include "mpjson/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mpjson {

namespace {

char base64_digit(std::uint32_t b) {
    if (b < 26) return static_cast<char>('A' + b);
    if (b < 52) return static_cast<char>('a' + b - 26);
    if (b < 62) return static_cast<char>('0' + b - 52);
    return b == 62 ? '+' : '/';
}

} // anonymous namespace

std::string base64_encode(const char* data, std::size_t size) {
    std::string out;
    out.reserve((size + 2) / 3 * 4);

    const auto* p = reinterpret_cast<const unsigned char*>(data);
    const auto* end = p + size;

    // 3-byte groups
    while (end - p >= 3) {
        std::uint32_t word = (std::uint32_t(p[0]) << 16) | (std::uint32_t(p[1]) << 8) | p[2];
        p += 3;
        out += base64_digit((word >> 18) & 0x3f);
        out += base64_digit((word >> 12) & 0x3f);
        out += base64_digit((word >> 6) & 0x3f);
        out += base64_digit(word & 0x3f);
    }

    // 1-byte or 2-byte tail
    const auto nrem = static_cast<std::size_t>(end - p);
    if (nrem != 0) {
        std::uint32_t word = std::uint32_t(p[0]) << 16;
        if (nrem == 2) word |= std::uint32_t(p[1]) << 8;
        out += base64_digit((word >> 18) & 0x3f);
        out += base64_digit((word >> 12) & 0x3f);
        out += nrem == 2 ? base64_digit((word >> 6) & 0x3f) : '=';
        out += '=';
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::string file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

std::string read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("Cannot open file: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IoError("Failed to read file: " + path);
    }
    return ss.str();
}

} // namespace mpjson
