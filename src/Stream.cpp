/**
 * @file Stream.cpp
 * @brief Implementation of Sink and Source
 */

#include "mpjson/Stream.hpp"
#include "mpjson/Errors.hpp"

#include <sstream>

namespace mpjson {

// ============================================================================
// Sink
// ============================================================================

void Sink::write(const char* data, std::size_t size) {
    if (out_) {
        out_->write(data, static_cast<std::streamsize>(size));
        if (!*out_) {
            throw IoError("Failed to write " + std::to_string(size) + " bytes to output stream");
        }
    } else {
        buffer_.append(data, size);
    }
    written_ += size;
}

void Sink::flush() {
    if (!out_) return;
    out_->flush();
    if (!*out_) {
        throw IoError("Failed to flush output stream");
    }
}

// ============================================================================
// Source
// ============================================================================

Source Source::from_stream(std::istream& in) {
    if (!in) {
        throw IoError("Input stream is not readable");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw IoError("Failed to read input stream");
    }
    return Source(ss.str());
}

namespace {

// Every array element and str/bin/ext byte takes at least one input byte,
// every map entry at least two. Headers claiming more are rejected before
// msgpack-c allocates storage for them.
msgpack::unpack_limit limit_for(std::size_t remaining) {
    return msgpack::unpack_limit(
        remaining,      // array
        remaining / 2,  // map
        remaining,      // str
        remaining,      // bin
        remaining       // ext
    );
}

} // anonymous namespace

msgpack::object_handle Source::next() {
    const std::size_t start = offset_;
    try {
        std::size_t off = offset_;
        msgpack::object_handle handle = msgpack::unpack(
            data_.data(), data_.size(), off, nullptr, nullptr, limit_for(data_.size() - start));
        offset_ = off;
        return handle;
    } catch (const msgpack::insufficient_bytes&) {
        throw DecodeError("Truncated MessagePack value", start);
    } catch (const msgpack::size_overflow& e) {
        throw DecodeError(std::string("Truncated MessagePack value: ") + e.what(), start);
    } catch (const msgpack::unpack_error& e) {
        throw DecodeError(std::string("Malformed MessagePack value: ") + e.what(), start);
    }
}

} // namespace mpjson
