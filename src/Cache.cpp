/**
 * @file Cache.cpp
 * @brief Implementation of the decode-side caches
 */

#include "mpjson/Cache.hpp"

#include <atomic>

namespace mpjson {

// ============================================================================
// SmallIntCache
// ============================================================================

const std::shared_ptr<SmallIntCache>& SmallIntCache::shared() {
    static const std::shared_ptr<SmallIntCache> instance = std::make_shared<SmallIntCache>();
    return instance;
}

Value SmallIntCache::number(std::int64_t v) {
    if (!in_range(v)) {
        return Value::number(v);
    }

    auto& slot = slots_[static_cast<std::size_t>(v - min_value)];
    std::shared_ptr<const Value> cached = std::atomic_load_explicit(&slot, std::memory_order_acquire);
    if (!cached) {
        cached = std::make_shared<Value>(Value::number(v));
        std::atomic_store_explicit(&slot, cached, std::memory_order_release);
    }
    return *cached;
}

std::size_t SmallIntCache::populated() const noexcept {
    std::size_t count = 0;
    for (const auto& slot : slots_) {
        if (std::atomic_load_explicit(&slot, std::memory_order_relaxed)) ++count;
    }
    return count;
}

// ============================================================================
// StringCache
// ============================================================================

StringCache::StringCache(const std::set<std::string>& literals) {
    entries_.reserve(literals.size());
    for (const auto& literal : literals) {
        entries_.emplace(literal, Value::string(literal));
    }
}

const Value* StringCache::find(const std::string& text) const {
    if (entries_.empty()) return nullptr;
    auto it = entries_.find(text);
    return it == entries_.end() ? nullptr : &it->second;
}

} // namespace mpjson
