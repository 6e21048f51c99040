/**
 * @file test_parse.cpp
 * @brief Unit tests for literal type inference (GoogleTest)
 *
 * Tests aligned with Parse.cpp:
 * - Only exact "true"/"false" for booleans
 * - Only exact "null" for null
 * - JSON number grammar for integers and floats
 * - Compound values must be fully delimited and valid
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include "sjson/Parse.hpp"
#include "sjson/Value.hpp"

using namespace sjson;

// ============================================================================
// Booleans and null
// ============================================================================

TEST(ParseBoolean, ExactValues) {
    EXPECT_EQ(parse_literal("true"), true);
    EXPECT_EQ(parse_literal("false"), false);
}

TEST(ParseBoolean, CaseSensitive) {
    EXPECT_EQ(parse_literal("True"), "True");
    EXPECT_EQ(parse_literal("FALSE"), "FALSE");
}

TEST(ParseNull, ExactValue) {
    EXPECT_TRUE(parse_literal("null").is_null());
    EXPECT_EQ(parse_literal("NULL"), "NULL");
}

// ============================================================================
// Integer Parsing
// ============================================================================

TEST(ParseInteger, PositiveAndNegative) {
    EXPECT_EQ(parse_literal("0"), 0);
    EXPECT_EQ(parse_literal("37"), 37);
    EXPECT_EQ(parse_literal("-17"), -17);
    EXPECT_TRUE(parse_literal("37").is_number_integer());
}

TEST(ParseInteger, Int64Limits) {
    EXPECT_EQ(parse_literal("9223372036854775807").get<int64_t>(), INT64_MAX);
    EXPECT_EQ(parse_literal("-9223372036854775808").get<int64_t>(), INT64_MIN);
}

TEST(ParseInteger, TooWideBecomesFloat) {
    Value v = parse_literal("92233720368547758070");
    EXPECT_TRUE(v.is_number_float());
}

TEST(ParseInteger, LeadingZeroStaysString) {
    EXPECT_EQ(parse_literal("037"), "037");
    EXPECT_EQ(parse_literal("00"), "00");
}

TEST(ParseInteger, PlusSignStaysString) {
    EXPECT_EQ(parse_literal("+5"), "+5");
}

// ============================================================================
// Float Parsing
// ============================================================================

TEST(ParseFloat, Decimal) {
    Value v = parse_literal("95.5");
    EXPECT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 95.5);
    EXPECT_DOUBLE_EQ(parse_literal("-100.50").get<double>(), -100.5);
}

TEST(ParseFloat, Exponent) {
    EXPECT_DOUBLE_EQ(parse_literal("-2.5e10").get<double>(), -2.5e10);
    EXPECT_DOUBLE_EQ(parse_literal("1E3").get<double>(), 1000.0);
}

TEST(ParseFloat, NonFiniteStaysString) {
    EXPECT_EQ(parse_literal("NaN"), "NaN");
    EXPECT_EQ(parse_literal("Infinity"), "Infinity");
    EXPECT_EQ(parse_literal("-inf"), "-inf");
    EXPECT_EQ(parse_literal("1e999"), "1e999");
}

TEST(ParseFloat, UnderflowIsStillANumber) {
    Value v = parse_literal("1e-400");
    EXPECT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 0.0);
    EXPECT_TRUE(parse_literal("4e-320").is_number_float());
}

TEST(ParseFloat, OverflowStaysString) {
    EXPECT_EQ(parse_literal("1e400"), "1e400");
    EXPECT_EQ(parse_literal("-1e400"), "-1e400");
}

TEST(ParseFloat, IncompleteFormsStayString) {
    EXPECT_EQ(parse_literal("1."), "1.");
    EXPECT_EQ(parse_literal(".5"), ".5");
}

// ============================================================================
// JSON compounds
// ============================================================================

TEST(ParseCompound, Object) {
    Value v = parse_literal("{\"city\":\"Beijing\",\"country\":\"China\"}");
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v["city"], "Beijing");
}

TEST(ParseCompound, Array) {
    EXPECT_EQ(parse_literal("[]"), Value::array());
    EXPECT_EQ(parse_literal("[\"reading\",\"swimming\"]"),
              (Value{"reading", "swimming"}));
}

TEST(ParseCompound, InvalidCompoundStaysString) {
    EXPECT_EQ(parse_literal("[1,2"), "[1,2");
    EXPECT_EQ(parse_literal("{not json}"), "{not json}");
}

TEST(ParseCompound, NumberOverflowStaysString) {
    EXPECT_EQ(parse_literal("[1e400]"), "[1e400]");
    EXPECT_EQ(parse_literal("{\"a\":-1e400}"), "{\"a\":-1e400}");
}

TEST(ParseCompound, QuotedTextIsNotUnquoted) {
    EXPECT_EQ(parse_literal("\"Jerry\""), "\"Jerry\"");
}

// ============================================================================
// Strings
// ============================================================================

TEST(ParseString, Verbatim) {
    EXPECT_EQ(parse_literal("Jerry"), "Jerry");
    EXPECT_EQ(parse_literal("Hello, \"World\"!"), "Hello, \"World\"!");
    EXPECT_EQ(parse_literal(""), "");
}

// ============================================================================
// is_json_number
// ============================================================================

TEST(IsJsonNumber, Accepts) {
    EXPECT_TRUE(is_json_number("0"));
    EXPECT_TRUE(is_json_number("-1"));
    EXPECT_TRUE(is_json_number("3.25"));
    EXPECT_TRUE(is_json_number("6.02e+23"));
}

TEST(IsJsonNumber, Rejects) {
    EXPECT_FALSE(is_json_number(""));
    EXPECT_FALSE(is_json_number("037"));
    EXPECT_FALSE(is_json_number("NaN"));
    EXPECT_FALSE(is_json_number("1."));
    EXPECT_FALSE(is_json_number("- 1"));
}
