/**
 * @file test_json.cpp
 * @brief Unit tests for JSON interop (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mpjson/Errors.hpp"
#include "mpjson/Json.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace mpjson;

TEST(JsonTest, ParseScalars) {
    EXPECT_TRUE(parse_json("null").same_instance(Value::null()));
    EXPECT_TRUE(parse_json("true").same_instance(Value::boolean(true)));
    EXPECT_EQ(parse_json("42").as_number().int64_value_exact(), 42);
    EXPECT_EQ(parse_json("-3").as_number().int64_value_exact(), -3);
    EXPECT_EQ(parse_json("2.5").as_number().repr(), Number::Repr::Double);
    EXPECT_EQ(parse_json("\"hi\"").as_string(), "hi");
}

TEST(JsonTest, ParseBigUnsigned) {
    Value v = parse_json("18446744073709551615");
    EXPECT_EQ(v.as_number().repr(), Number::Repr::UInt64);
    EXPECT_EQ(v.as_number().uint64_value_exact(), UINT64_MAX);
}

TEST(JsonTest, IntegerLiteralBeyond64BitsRaisesOverflow) {
    try {
        parse_json("18446744073709551616");
        FAIL() << "Expected OverflowError";
    } catch (const OverflowError& e) {
        EXPECT_EQ(e.value(), "18446744073709551616");
        EXPECT_EQ(e.target(), "uint64");
    }
    try {
        parse_json("[1, -9223372036854775809]");
        FAIL() << "Expected OverflowError";
    } catch (const OverflowError& e) {
        EXPECT_EQ(e.value(), "-9223372036854775809");
        EXPECT_EQ(e.target(), "int64");
    }
}

TEST(JsonTest, LargeFloatLiteralsStayFloat) {
    Value v = parse_json("[18446744073709551616.0, 1e30, -2E20]");
    for (const auto& elem : v.as_array()) {
        EXPECT_EQ(elem.as_number().repr(), Number::Repr::Double);
    }
    EXPECT_DOUBLE_EQ(v.at(1).as_number().double_value(), 1e30);
}

TEST(JsonTest, Int64BoundsParseExactly) {
    EXPECT_EQ(parse_json("-9223372036854775808").as_number().int64_value_exact(), INT64_MIN);
    EXPECT_EQ(parse_json("9223372036854775807").as_number().int64_value_exact(), INT64_MAX);
}

TEST(JsonTest, ParseNestedDocument) {
    Value v = parse_json(R"({"a": [1, {"b": null}, []], "c": {}, "a": "last"})");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v.as_object()[0].first, "a");
    EXPECT_EQ(v.at("a").as_string(), "last");
    EXPECT_TRUE(v.at("c").same_instance(Value::empty_object()));

    Value inner = parse_json(R"([1, {"b": null}, []])");
    EXPECT_TRUE(inner.at(1).at("b").is_null());
    EXPECT_TRUE(inner.at(2).same_instance(Value::empty_array()));
}

TEST(JsonTest, TrailingGarbageIsParseError) {
    EXPECT_THROW(parse_json("{} x"), ParseError);
    EXPECT_THROW(parse_json(""), ParseError);
}

TEST(JsonTest, NonFiniteDoubleDumpsAsNull) {
    Value v = Value::array({
        Value::number(std::numeric_limits<double>::quiet_NaN()),
        Value::number(std::numeric_limits<double>::infinity())
    });
    EXPECT_EQ(dump_json(v), "[null,null]");
}

TEST(JsonTest, ParseKeepsMemberOrder) {
    Value v = parse_json(R"({"z": 1, "a": 2, "m": 3})");
    const auto& members = v.as_object();
    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members[0].first, "z");
    EXPECT_EQ(members[1].first, "a");
    EXPECT_EQ(members[2].first, "m");
}

TEST(JsonTest, EmptyContainersAreSingletons) {
    EXPECT_TRUE(parse_json("[]").same_instance(Value::empty_array()));
    EXPECT_TRUE(parse_json("{}").same_instance(Value::empty_object()));
}

TEST(JsonTest, InvalidJsonRaisesParseError) {
    try {
        parse_json("{\"a\": ", "input.json");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.file(), "input.json");
    }
}

TEST(JsonTest, DumpCompactAndIndented) {
    Value v = Value::object({
        {"b", Value::array({Value::number(1), Value::null()})},
        {"a", Value::boolean(false)}
    });
    EXPECT_EQ(dump_json(v), R"({"b":[1,null],"a":false})");
    EXPECT_EQ(dump_json(v, 2), "{\n  \"b\": [\n    1,\n    null\n  ],\n  \"a\": false\n}");
}

TEST(JsonTest, DumpReplacesInvalidUtf8) {
    Value v = Value::string(std::string("a\xff", 2));
    EXPECT_NO_THROW(dump_json(v));
}

TEST(JsonTest, BinaryBecomesBase64String) {
    Json j = Json::binary({0x66, 0x6f, 0x6f});
    Value v = from_json(j);
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v.as_string(), "Zm9v");
}

TEST(JsonTest, ToJsonPreservesNumberRepresentation) {
    Json j = to_json(Value::array({
        Value::number(-1),
        Value::number(std::uint64_t{9223372036854775808ULL}),
        Value::number(0.5)
    }));
    EXPECT_TRUE(j[0].is_number_integer());
    EXPECT_TRUE(j[1].is_number_unsigned());
    EXPECT_EQ(j[1].get<std::uint64_t>(), 9223372036854775808ULL);
    EXPECT_TRUE(j[2].is_number_float());
}

TEST(JsonTest, LoadSampleFile) {
    Value v = load_json_file(std::string(MPJSON_TEST_DATA_DIR) + "/sample.json");
    EXPECT_TRUE(v.is_object());
    EXPECT_EQ(from_json(to_json(v)), v);
}

TEST(JsonTest, LoadMissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/mpjson/none.json"), FileNotFoundError);
}
