/**
 * @file Cache.hpp
 * @brief Decode-side instance caches
 *
 * - SmallIntCache: one shared Number per integer in [-128, 127], filled on
 *   first use and never evicted.
 * - StringCache: one shared String per configured literal, fixed at
 *   construction.
 *
 * Both hand out the same Value instance for equal inputs, so repeated
 * small integers and enumeration-like strings cost one allocation each.
 */

#ifndef MPJSON_CACHE_HPP
#define MPJSON_CACHE_HPP

#include "mpjson/Value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

namespace mpjson {

/**
 * @brief Lazily populated table of shared small-integer Numbers
 *
 * Thread safety: slots are read with an acquire load and published with a
 * release store through the std::shared_ptr atomic access functions, so a
 * Number seen in a slot is fully constructed. Filling is not locked: two
 * threads missing the same slot may both build a Number, the last store
 * wins, and both callers get values that compare equal. Only instance
 * identity across such a race is unspecified.
 */
class SmallIntCache {
public:
    static constexpr std::int64_t min_value = -128;
    static constexpr std::int64_t max_value = 127;
    static constexpr std::size_t slot_count = 256;

    SmallIntCache() = default;

    SmallIntCache(const SmallIntCache&) = delete;
    SmallIntCache& operator=(const SmallIntCache&) = delete;

    /**
     * @brief Process-wide instance used by codecs that do not inject one
     */
    static const std::shared_ptr<SmallIntCache>& shared();

    static bool in_range(std::int64_t v) noexcept {
        return v >= min_value && v <= max_value;
    }

    /**
     * @brief Number value for v; cached instance when v is in range
     */
    Value number(std::int64_t v);

    /**
     * @brief Number of slots populated so far
     */
    std::size_t populated() const noexcept;

private:
    std::array<std::shared_ptr<const Value>, slot_count> slots_;
};

/**
 * @brief Immutable map from configured literals to shared String values
 *
 * Lookup is exact byte equality. A default-constructed cache is empty and
 * every lookup misses.
 */
class StringCache {
public:
    StringCache() = default;
    explicit StringCache(const std::set<std::string>& literals);

    /**
     * @brief Cached instance for text, or nullptr when not configured
     */
    const Value* find(const std::string& text) const;

    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<std::string, Value> entries_;
};

} // namespace mpjson

#endif // MPJSON_CACHE_HPP
