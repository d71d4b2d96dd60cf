/**
 * @file Codec.hpp
 * @brief Recursive MessagePack <-> Value codec
 *
 * Encoding walks the Value tree depth-first and writes through a
 * msgpack::packer bound to a Sink. Decoding unpacks one value from a Source
 * and walks the resulting msgpack::object tree depth-first.
 *
 * Integer widths on encode:
 * - int32 range -> int32 form
 * - rest of int64 -> int64 form
 * - above INT64_MAX -> uint64 form
 * The packer still picks the most compact wire encoding of each form.
 * Floating-point numbers are always written as float64.
 *
 * On decode, nil/true/false/empty containers come back as singletons,
 * integers in [-128, 127] come from the SmallIntCache, configured strings
 * from the StringCache, and binary payloads become base64 strings.
 * Extension types raise UnsupportedTypeError.
 */

#ifndef MPJSON_CODEC_HPP
#define MPJSON_CODEC_HPP

#include "mpjson/Cache.hpp"
#include "mpjson/Options.hpp"
#include "mpjson/Stream.hpp"
#include "mpjson/Value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mpjson {

class Codec {
public:
    Codec();
    explicit Codec(CodecOptions options);

    /**
     * @brief Write one value
     * @throws IoError if the sink fails
     * @throws NestingDepthError if a depth bound is configured and exceeded
     */
    void encode(Sink& sink, const Value& value) const;

    /**
     * @brief Write values back-to-back with no count prefix
     */
    void encode_list(Sink& sink, const std::vector<Value>& values) const;

    /**
     * @brief Read one value
     * @throws DecodeError on truncated/malformed input or a non-string map key
     * @throws UnsupportedTypeError on an extension type
     * @throws NestingDepthError if a depth bound is configured and exceeded
     */
    Value decode(Source& source) const;

    /**
     * @brief Read values until the source has no more data
     */
    std::vector<Value> decode_list(Source& source) const;

    /**
     * @brief Encode one value into a byte string
     */
    std::string to_msgpack(const Value& value) const;

    /**
     * @brief Decode a byte string holding exactly one value
     * @throws DecodeError if bytes remain after the value
     */
    Value from_msgpack(const std::string& bytes) const;

    const StringCache& string_cache() const noexcept { return strings_; }
    SmallIntCache& int_cache() const noexcept { return *ints_; }
    std::size_t max_depth() const noexcept { return max_depth_; }

private:
    StringCache strings_;
    std::shared_ptr<SmallIntCache> ints_;
    std::size_t max_depth_;
};

} // namespace mpjson

#endif // MPJSON_CODEC_HPP
