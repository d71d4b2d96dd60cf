/**
 * @file Stream.hpp
 * @brief Byte sinks and sources for the codec
 *
 * Sink is the output stream handed to msgpack::packer: it collects bytes in
 * memory or forwards them to a std::ostream, and turns a failed write into
 * IoError.
 *
 * Source owns a MessagePack byte buffer and hands out one self-delimiting
 * value at a time through msgpack::unpack. has_next() is the end-of-data
 * signal decode_list() relies on.
 *
 * Source is buffer-only. from_stream() reads the istream to EOF before the
 * first value is decoded, so decode_list() on a pipe or socket returns only
 * after the peer closes it. Container and payload lengths are checked
 * against the bytes left in the buffer before anything is allocated.
 */

#ifndef MPJSON_STREAM_HPP
#define MPJSON_STREAM_HPP

#include <msgpack.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace mpjson {

class Sink {
public:
    /**
     * @brief Memory-backed sink; read the result with bytes()
     */
    Sink() = default;

    /**
     * @brief Sink forwarding every write to out
     *
     * The stream is not owned and must outlive the sink.
     */
    explicit Sink(std::ostream& out) noexcept
        : out_(&out)
    {}

    Sink(const Sink&) = delete;
    Sink& operator=(const Sink&) = delete;

    /**
     * @brief Append bytes (stream concept used by msgpack::packer)
     * @throws IoError if the underlying stream fails
     */
    void write(const char* data, std::size_t size);

    /**
     * @brief Flush the underlying stream, if any
     * @throws IoError if the flush fails
     */
    void flush();

    /**
     * @brief Bytes collected by a memory-backed sink (empty for stream sinks)
     */
    const std::string& bytes() const noexcept { return buffer_; }

    /**
     * @brief Total number of bytes written so far
     */
    std::size_t bytes_written() const noexcept { return written_; }

private:
    std::ostream* out_ = nullptr;
    std::string buffer_;
    std::size_t written_ = 0;
};

class Source {
public:
    explicit Source(std::string bytes)
        : data_(std::move(bytes))
    {}

    Source(const char* data, std::size_t size)
        : data_(data, size)
    {}

    /**
     * @brief Read an input stream to its end
     * @throws IoError if the stream reports a read failure
     */
    static Source from_stream(std::istream& in);

    /**
     * @brief True while unread bytes remain
     */
    bool has_next() const noexcept { return offset_ < data_.size(); }

    /**
     * @brief Unpack the next complete value and advance past it
     * @throws DecodeError if the value is truncated or malformed
     */
    msgpack::object_handle next();

    /**
     * @brief Offset of the first unread byte
     */
    std::size_t offset() const noexcept { return offset_; }

    std::size_t size() const noexcept { return data_.size(); }

private:
    std::string data_;
    std::size_t offset_ = 0;
};

} // namespace mpjson

#endif // MPJSON_STREAM_HPP
