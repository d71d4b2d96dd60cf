/**
 * @file Errors.hpp
 * @brief Exception types for mpjson
 *
 * Error taxonomy:
 * - Error: Base class
 * - DecodeError: Truncated, corrupt or unrepresentable MessagePack input
 * - UnsupportedTypeError: MessagePack extension type encountered
 * - IoError: Sink or source stream failure
 * - NestingDepthError: Configured container depth exceeded
 * - OverflowError: Narrowing Number accessor out of range
 * - TypeError: Kind-checked Value accessor used on another kind
 * - FileNotFoundError / ParseError / OptionsError: File and options loading
 */

#ifndef MPJSON_ERRORS_HPP
#define MPJSON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mpjson {

/**
 * @brief Base class for all mpjson exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief MessagePack input could not be decoded
 *
 * Carries the byte offset of the value being read when the source knows it.
 */
class DecodeError : public Error {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    explicit DecodeError(const std::string& message, std::size_t offset = npos)
        : Error(format_message(message, offset))
        , offset_(offset)
    {}

    /**
     * @brief Byte offset of the failing value, or npos if unknown
     */
    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::size_t offset_;

    static std::string format_message(const std::string& message, std::size_t offset) {
        if (offset == npos) return message;
        return message + " (at byte " + std::to_string(offset) + ")";
    }
};

/**
 * @brief MessagePack category with no JSON counterpart (extension types)
 */
class UnsupportedTypeError : public DecodeError {
public:
    explicit UnsupportedTypeError(const std::string& type_name)
        : DecodeError("Unsupported MessagePack type: " + type_name)
        , type_name_(type_name)
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string type_name_;
};

/**
 * @brief The underlying stream failed to accept or deliver bytes
 */
class IoError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Containers nest deeper than the configured bound
 */
class NestingDepthError : public Error {
public:
    explicit NestingDepthError(std::size_t max_depth)
        : Error("Maximum nesting depth of " + std::to_string(max_depth) + " exceeded")
        , max_depth_(max_depth)
    {}

    std::size_t max_depth() const noexcept {
        return max_depth_;
    }

private:
    std::size_t max_depth_;
};

/**
 * @brief A Number does not fit the requested narrower type
 */
class OverflowError : public Error {
public:
    /**
     * @param value Decimal text of the number
     * @param target Name of the requested type (e.g., "int64")
     */
    OverflowError(std::string value, std::string target)
        : Error("Number " + value + " does not fit into " + target)
        , value_(std::move(value))
        , target_(std::move(target))
    {}

    const std::string& value() const noexcept {
        return value_;
    }

    const std::string& target() const noexcept {
        return target_;
    }

private:
    std::string value_;
    std::string target_;
};

/**
 * @brief Value accessed as a kind it does not hold
 */
class TypeError : public Error {
public:
    /**
     * @param expected Expected kind (e.g., "object")
     * @param actual Actual kind (e.g., "integer")
     */
    TypeError(std::string expected, std::string actual)
        : Error("Expected " + expected + " but value is " + actual)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief JSON or TOML text could not be parsed
 */
class ParseError : public Error {
public:
    /**
     * @param file Path of the file, or "<string>" for in-memory text
     * @param line Line number (1-based), 0 if unknown
     * @param column Column number (1-based), 0 if unknown
     * @param details Detailed error message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : Error(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Options file holds a key of the wrong type or has an unknown format
 */
class OptionsError : public Error {
public:
    using Error::Error;
};

} // namespace mpjson

#endif // MPJSON_ERRORS_HPP
