/**
 * @file test_parse.cpp
 * @brief Unit tests for scalar inference (GoogleTest)
 *
 * - Only "true"/"false" for booleans (not yes/no/on/off)
 * - Only "null" for null (not none/nil)
 * - Integers and decimal floats; no bare exponents
 * - No compound values and no unquoting: everything else stays a string
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "diffx/Parse.hpp"
#include "diffx/Value.hpp"

using namespace diffx;

// ============================================================================
// Boolean Parsing - Only true/false supported
// ============================================================================

TEST(ParseBoolean, TrueValues) {
    EXPECT_EQ(parse_scalar("true"), true);
    EXPECT_EQ(parse_scalar("True"), true);
    EXPECT_EQ(parse_scalar("TRUE"), true);
}

TEST(ParseBoolean, FalseValues) {
    EXPECT_EQ(parse_scalar("false"), false);
    EXPECT_EQ(parse_scalar("False"), false);
    EXPECT_EQ(parse_scalar("FALSE"), false);
}

TEST(ParseBoolean, YesNoStayStrings) {
    EXPECT_EQ(parse_scalar("yes"), "yes");
    EXPECT_EQ(parse_scalar("off"), "off");
}

TEST(ParseBoolean, NumericNotBoolean) {
    // "1" and "0" parse as integers, not booleans
    EXPECT_EQ(parse_scalar("1"), 1);
    EXPECT_EQ(parse_scalar("0"), 0);
}

// ============================================================================
// Null Parsing - Only null supported
// ============================================================================

TEST(ParseNull, NullValues) {
    EXPECT_TRUE(parse_scalar("null").is_null());
    EXPECT_TRUE(parse_scalar("Null").is_null());
    EXPECT_TRUE(parse_scalar("NULL").is_null());
    EXPECT_EQ(parse_scalar("none"), "none");
}

// ============================================================================
// Integer Parsing
// ============================================================================

TEST(ParseInteger, PositiveIntegers) {
    EXPECT_EQ(parse_scalar("0"), 0);
    EXPECT_EQ(parse_scalar("42"), 42);
    EXPECT_EQ(parse_scalar("999999999"), 999999999);
}

TEST(ParseInteger, NegativeIntegers) {
    EXPECT_EQ(parse_scalar("-1"), -1);
    EXPECT_EQ(parse_scalar("-12345"), -12345);
}

TEST(ParseInteger, LeadingZeros) {
    EXPECT_EQ(parse_scalar("007"), 7);
}

TEST(ParseInteger, Int64Limit) {
    Value v = parse_scalar("9223372036854775807");
    ASSERT_TRUE(v.is_number_integer());
    EXPECT_EQ(v.get<std::int64_t>(), INT64_MAX);
}

TEST(ParseInteger, WiderThanInt64BecomesFloat) {
    Value v = parse_scalar("99999999999999999999");
    ASSERT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 1e20);
}

TEST(ParseInteger, VeryLongDigitRunStaysString) {
    const std::string digits(100000, '1');
    EXPECT_EQ(parse_scalar(digits), digits);
    EXPECT_EQ(parse_scalar("-" + digits), "-" + digits);
}

// ============================================================================
// Float Parsing
// ============================================================================

TEST(ParseFloat, VeryLongFraction) {
    Value v = parse_scalar("1." + std::string(100000, '0'));
    ASSERT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 1.0);
}

TEST(ParseFloat, SimpleFloats) {
    EXPECT_DOUBLE_EQ(parse_scalar("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_scalar("0.5").get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(parse_scalar("-3.14").get<double>(), -3.14);
}

TEST(ParseFloat, ScientificNotation) {
    EXPECT_DOUBLE_EQ(parse_scalar("2.5e10").get<double>(), 2.5e10);
    EXPECT_DOUBLE_EQ(parse_scalar("1.5e-3").get<double>(), 1.5e-3);
}

TEST(ParseFloat, BareExponentIsString) {
    EXPECT_EQ(parse_scalar("1e10"), "1e10");
}

TEST(ParseFloat, MissingDigitsAreStrings) {
    EXPECT_EQ(parse_scalar(".5"), ".5");
    EXPECT_EQ(parse_scalar("5."), "5.");
}

// ============================================================================
// Raw String Fallback
// ============================================================================

TEST(ParseRawString, UnquotedStrings) {
    EXPECT_EQ(parse_scalar("hello"), "hello");
    EXPECT_EQ(parse_scalar("path/to/file"), "path/to/file");
    EXPECT_EQ(parse_scalar("hello world"), "hello world");
}

TEST(ParseRawString, CompoundTextStaysString) {
    EXPECT_EQ(parse_scalar("[1, 2, 3]"), "[1, 2, 3]");
    EXPECT_EQ(parse_scalar(R"({"key": "value"})"), R"({"key": "value"})");
}

TEST(ParseRawString, QuotesAreKept) {
    EXPECT_EQ(parse_scalar("\"42\""), "\"42\"");
}

// ============================================================================
// Edge Cases
// ============================================================================

TEST(ParseEdgeCases, EmptyString) {
    EXPECT_EQ(parse_scalar(""), "");
}

TEST(ParseEdgeCases, WhitespaceAround) {
    // No trimming: padded numbers are not numbers
    EXPECT_EQ(parse_scalar(" 42 "), " 42 ");
}

TEST(ParseEdgeCases, NumericPrefix) {
    EXPECT_EQ(parse_scalar("123abc"), "123abc");
    EXPECT_EQ(parse_scalar("3.14abc"), "3.14abc");
}
