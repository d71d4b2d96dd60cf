/**
 * @file test_cache.cpp
 * @brief Unit tests for the small-integer and string caches (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mpjson/Cache.hpp"
#include "mpjson/Codec.hpp"
#include "mpjson/Errors.hpp"
#include "mpjson/Json.hpp"

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mpjson;

// ============================================================================
// SmallIntCache
// ============================================================================

TEST(SmallIntCacheTest, StartsEmptyAndFillsLazily) {
    SmallIntCache cache;
    EXPECT_EQ(cache.populated(), 0u);

    Value a = cache.number(5);
    EXPECT_EQ(cache.populated(), 1u);
    Value b = cache.number(5);
    EXPECT_EQ(cache.populated(), 1u);
    EXPECT_TRUE(a.same_instance(b));
    EXPECT_EQ(a.as_number().int64_value_exact(), 5);
}

TEST(SmallIntCacheTest, RangeBoundaries) {
    SmallIntCache cache;
    EXPECT_TRUE(cache.number(-128).same_instance(cache.number(-128)));
    EXPECT_TRUE(cache.number(127).same_instance(cache.number(127)));
    EXPECT_FALSE(cache.number(128).same_instance(cache.number(128)));
    EXPECT_FALSE(cache.number(-129).same_instance(cache.number(-129)));
    EXPECT_EQ(cache.populated(), 2u);
    EXPECT_EQ(cache.number(128).as_number().int64_value_exact(), 128);
}

TEST(SmallIntCacheTest, SeparateInstancesDoNotShare) {
    SmallIntCache first;
    SmallIntCache second;
    EXPECT_FALSE(first.number(1).same_instance(second.number(1)));
    EXPECT_EQ(first.number(1), second.number(1));
}

TEST(SmallIntCacheTest, SharedInstanceIsStable) {
    EXPECT_EQ(SmallIntCache::shared().get(), SmallIntCache::shared().get());
}

TEST(SmallIntCacheTest, ConcurrentPopulationYieldsEqualValues) {
    SmallIntCache cache;
    std::vector<std::thread> workers;
    std::vector<std::vector<Value>> results(4);

    for (std::size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&cache, &out = results[t]] {
            for (std::int64_t v = SmallIntCache::min_value; v <= SmallIntCache::max_value; ++v) {
                out.push_back(cache.number(v));
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(cache.populated(), SmallIntCache::slot_count);
    for (const auto& out : results) {
        ASSERT_EQ(out.size(), SmallIntCache::slot_count);
        for (std::size_t i = 0; i < out.size(); ++i) {
            EXPECT_EQ(out[i].as_number().int64_value_exact(),
                      SmallIntCache::min_value + static_cast<std::int64_t>(i));
        }
    }
    // Once settled, every lookup returns the published instance.
    EXPECT_TRUE(cache.number(0).same_instance(cache.number(0)));
}

TEST(SmallIntCacheTest, ReadersRacingOneSlotSeeConstructedValue) {
    SmallIntCache cache;
    std::vector<std::thread> workers;
    std::vector<int> mismatches(8, 0);

    for (std::size_t t = 0; t < mismatches.size(); ++t) {
        workers.emplace_back([&cache, &bad = mismatches[t]] {
            for (int i = 0; i < 1000; ++i) {
                Value v = cache.number(42);
                if (!v.is_number() || v.as_number().int64_value_exact() != 42) ++bad;
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int bad : mismatches) EXPECT_EQ(bad, 0);
    EXPECT_EQ(cache.populated(), 1u);
}

// ============================================================================
// StringCache
// ============================================================================

TEST(StringCacheTest, DefaultIsEmpty) {
    StringCache cache;
    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(cache.find("hello"), nullptr);
}

TEST(StringCacheTest, FindsConfiguredLiterals) {
    StringCache cache({"hello", "world"});
    EXPECT_EQ(cache.size(), 2u);
    const Value* hello = cache.find("hello");
    ASSERT_NE(hello, nullptr);
    EXPECT_EQ(hello->as_string(), "hello");
    EXPECT_TRUE(hello->same_instance(*cache.find("hello")));
    EXPECT_EQ(cache.find("Hello"), nullptr);
    EXPECT_EQ(cache.find("other"), nullptr);
}

// ============================================================================
// Caches seen through decode
// ============================================================================

class DecodeCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<SmallIntCache> ints = std::make_shared<SmallIntCache>();

    Codec make_codec(std::set<std::string> cached = {}) {
        CodecOptions options;
        options.int_cache = ints;
        options.cached_strings = std::move(cached);
        return Codec(std::move(options));
    }
};

TEST_F(DecodeCacheTest, NumbersFromFixture) {
    Codec codec = make_codec();
    Value original = load_json_file(std::string(MPJSON_TEST_DATA_DIR) + "/number.json");
    Value decoded = codec.from_msgpack(codec.to_msgpack(original));
    EXPECT_EQ(decoded, original);

    const Value& cached = decoded.at("cachedNumbers");
    EXPECT_TRUE(cached.at(0).same_instance(cached.at(2)));
    EXPECT_TRUE(cached.at(1).same_instance(cached.at(3)));

    const Value& not_cached = decoded.at("notCachedNumbers");
    EXPECT_FALSE(not_cached.at(0).same_instance(not_cached.at(1)));
    EXPECT_FALSE(not_cached.at(2).same_instance(not_cached.at(3)));
}

TEST_F(DecodeCacheTest, SmallIntegerSharedAcrossDecodeCalls) {
    Codec codec = make_codec();
    const std::string five = codec.to_msgpack(Value::number(5));
    Value first = codec.from_msgpack(five);
    Value second = codec.from_msgpack(five);
    EXPECT_TRUE(first.same_instance(second));
}

TEST_F(DecodeCacheTest, IntegerCacheSharedBetweenCodecsUsingSameTable) {
    Codec a = make_codec();
    Codec b = make_codec();
    const std::string bytes = a.to_msgpack(Value::number(-7));
    EXPECT_TRUE(a.from_msgpack(bytes).same_instance(b.from_msgpack(bytes)));
}

TEST_F(DecodeCacheTest, Int64WidthUsesSameTable) {
    Codec codec = make_codec();
    // 5 written as int64 (0xd3) and as fixint
    const std::string wide("\xd3\x00\x00\x00\x00\x00\x00\x00\x05", 9);
    const std::string narrow("\x05", 1);
    EXPECT_TRUE(codec.from_msgpack(wide).same_instance(codec.from_msgpack(narrow)));
}

TEST_F(DecodeCacheTest, StringsFromFixture) {
    Codec codec = make_codec({"hello", "world"});
    Value original = load_json_file(std::string(MPJSON_TEST_DATA_DIR) + "/string.json");
    Value decoded = codec.from_msgpack(codec.to_msgpack(original));
    EXPECT_EQ(decoded, original);

    const Value& cached = decoded.at("cachedStrings");
    EXPECT_TRUE(cached.at(0).same_instance(cached.at(1)));
    EXPECT_TRUE(cached.at(2).same_instance(cached.at(3)));
    EXPECT_TRUE(cached.at(0).same_instance(*codec.string_cache().find("hello")));

    const Value& not_cached = decoded.at("notCachedStrings");
    EXPECT_FALSE(not_cached.at(0).same_instance(not_cached.at(1)));
    EXPECT_FALSE(not_cached.at(2).same_instance(not_cached.at(3)));
}

TEST_F(DecodeCacheTest, NoStringCacheByDefault) {
    Codec codec = make_codec();
    const std::string bytes = codec.to_msgpack(Value::string("hello"));
    EXPECT_FALSE(codec.from_msgpack(bytes).same_instance(codec.from_msgpack(bytes)));
}

TEST_F(DecodeCacheTest, MapValuesUseStringCache) {
    Codec codec = make_codec({"hello"});
    Value decoded = codec.from_msgpack(codec.to_msgpack(
        Value::object({{"hello", Value::string("hello")}})));
    EXPECT_TRUE(decoded.at("hello").same_instance(*codec.string_cache().find("hello")));
}

TEST_F(DecodeCacheTest, ExtensionLeavesCacheUntouched) {
    Codec codec = make_codec();
    EXPECT_THROW(codec.from_msgpack(std::string("\xd4\x01\x00", 3)), UnsupportedTypeError);
    EXPECT_EQ(ints->populated(), 0u);
}
