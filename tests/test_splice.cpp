/**
 * @file test_splice.cpp
 * @brief Unit tests for optimistic text splicing (GoogleTest)
 *
 * Tests cover:
 * - Path eligibility band
 * - Boundary scanning (strings, escapes, nesting, enclosing closers)
 * - Textual value location, including its unscoped key search
 * - Set and delete splices, with exact text (order is preserved)
 */

#include <gtest/gtest.h>
#include "sjson/Splice.hpp"

using namespace sjson;

// ============================================================================
// is_optimistic_path
// ============================================================================

TEST(OptimisticPath, SimplePathsAreEligible) {
    EXPECT_TRUE(is_optimistic_path("name"));
    EXPECT_TRUE(is_optimistic_path("user.first_name"));
    EXPECT_TRUE(is_optimistic_path("items.0"));
    EXPECT_TRUE(is_optimistic_path("A.Z.a.z.0.9"));
}

TEST(OptimisticPath, JsonSyntaxIsIneligible) {
    EXPECT_FALSE(is_optimistic_path("na\"me"));
    EXPECT_FALSE(is_optimistic_path("a:b"));
    EXPECT_FALSE(is_optimistic_path("a{b"));
    EXPECT_FALSE(is_optimistic_path("a}b"));
    EXPECT_FALSE(is_optimistic_path("a,b"));
    EXPECT_FALSE(is_optimistic_path("a b"));
    EXPECT_FALSE(is_optimistic_path("a\tb"));
    EXPECT_FALSE(is_optimistic_path("a@b"));
    EXPECT_FALSE(is_optimistic_path("a=b"));
}

TEST(OptimisticPath, NegativeIndexIsIneligible) {
    EXPECT_FALSE(is_optimistic_path("items.-1"));
}

TEST(OptimisticPath, NonAsciiIsIneligible) {
    EXPECT_FALSE(is_optimistic_path("\xE5\xBC\xA0"));
}

// ============================================================================
// find_value_end
// ============================================================================

TEST(FindValueEnd, ScalarBeforeComma) {
    EXPECT_EQ(find_value_end("37,\"b\":1}", 0), 2u);
}

TEST(FindValueEnd, ScalarBeforeEnclosingCloser) {
    EXPECT_EQ(find_value_end("37}", 0), 2u);
    EXPECT_EQ(find_value_end("\"x\"]", 0), 3u);
}

TEST(FindValueEnd, StringWithDelimiters) {
    EXPECT_EQ(find_value_end("\"a,b}\",1", 0), 6u);
}

TEST(FindValueEnd, StringWithEscapedQuote) {
    const std::string text = R"("say \"hi\", ok",1)";
    EXPECT_EQ(find_value_end(text, 0), text.find(",1"));
}

TEST(FindValueEnd, EscapedBackslashEndsString) {
    const std::string text = R"("c:\\",1)";
    EXPECT_EQ(find_value_end(text, 0), 6u);
}

TEST(FindValueEnd, ObjectConsumesOwnCloser) {
    EXPECT_EQ(find_value_end("{\"x\":[1]},", 0), 9u);
    EXPECT_EQ(find_value_end("{\"x\":{\"y\":2}}}", 0), 13u);
}

TEST(FindValueEnd, ArrayConsumesOwnCloser) {
    EXPECT_EQ(find_value_end("[1,[2,3],\"]\"]}", 0), 13u);
}

TEST(FindValueEnd, RunsToEndOfInput) {
    EXPECT_EQ(find_value_end("true", 0), 4u);
    EXPECT_EQ(find_value_end("\"open", 0), 5u);
}

TEST(FindValueEnd, StartOffset) {
    const std::string text = R"({"a":12,"b":3})";
    EXPECT_EQ(find_value_end(text, 5), 7u);
}

// ============================================================================
// find_value_span
// ============================================================================

TEST(FindValueSpan, TopLevelKey) {
    const std::string json = R"({"name":"Tom","age":37})";
    auto span = find_value_span(json, "name");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), "\"Tom\"");
}

TEST(FindValueSpan, LastMember) {
    const std::string json = R"({"name":"Tom","age":37})";
    auto span = find_value_span(json, "age");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), "37");
}

TEST(FindValueSpan, NestedKey) {
    const std::string json = R"({"user":{"name":"Tom","tags":["a","b"]},"n":1})";
    auto span = find_value_span(json, "user.tags");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), R"(["a","b"])");
}

TEST(FindValueSpan, SkipsWhitespace) {
    const std::string json = "{\n  \"name\":   \"Tom\" ,\n  \"age\": 37\n}";
    auto span = find_value_span(json, "name");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), "\"Tom\"");

    span = find_value_span(json, "age");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), "37");
}

TEST(FindValueSpan, MissingKey) {
    EXPECT_FALSE(find_value_span(R"({"name":"Tom"})", "age").has_value());
    EXPECT_FALSE(find_value_span(R"({"name":"Tom"})", "name.first").has_value());
}

TEST(FindValueSpan, ArrayIndexNeverMatches) {
    EXPECT_FALSE(find_value_span(R"({"items":["a","b"]})", "items.1").has_value());
}

TEST(FindValueSpan, SpaceBeforeColonMisses) {
    EXPECT_FALSE(find_value_span(R"({"name" : "Tom"})", "name").has_value());
}

TEST(FindValueSpan, UnscopedSearchMatchesFirstOccurrence) {
    // "b" is wanted under "a" but first appears under "x", after "a"'s
    // value starts; the textual search takes it
    const std::string json = R"({"a":{"x":{"b":1}},"b":2})";
    auto span = find_value_span(json, "a.b");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(json.substr(span->start, span->end - span->start), "1");

    // A top-level key is found inside an earlier nested object
    const std::string nested_first = R"({"user":{"id":1},"id":2})";
    span = find_value_span(nested_first, "id");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(nested_first.substr(span->start, span->end - span->start), "1");
}

// ============================================================================
// splice_set
// ============================================================================

TEST(SpliceSet, QuotesBareString) {
    const std::string json = R"({"name":"Tom","age":37})";
    auto span = find_value_span(json, "name");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "Jerry", true), R"({"name":"Jerry","age":37})");
}

TEST(SpliceSet, SelfDelimitedValuesUnquoted) {
    const std::string json = R"({"a":1,"b":2})";
    auto span = find_value_span(json, "a");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "true", true), R"({"a":true,"b":2})");
    EXPECT_EQ(splice_set(json, *span, "null", true), R"({"a":null,"b":2})");
    EXPECT_EQ(splice_set(json, *span, "-100.50", true), R"({"a":-100.50,"b":2})");
    EXPECT_EQ(splice_set(json, *span, "[1,2]", true), R"({"a":[1,2],"b":2})");
    EXPECT_EQ(splice_set(json, *span, "{\"c\":3}", true), R"({"a":{"c":3},"b":2})");
    EXPECT_EQ(splice_set(json, *span, "\"s\"", true), R"({"a":"s","b":2})");
}

TEST(SpliceSet, NonJsonNumbersAreQuoted) {
    const std::string json = R"({"a":1})";
    auto span = find_value_span(json, "a");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "037", true), R"({"a":"037"})");
    EXPECT_EQ(splice_set(json, *span, "NaN", true), R"({"a":"NaN"})");
    EXPECT_EQ(splice_set(json, *span, "", true), R"({"a":""})");
}

TEST(SpliceSet, QuotingFollowsLiteralInference) {
    const std::string json = R"({"a":1})";
    auto span = find_value_span(json, "a");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "1e-400", true), R"({"a":1e-400})");
    EXPECT_EQ(splice_set(json, *span, "1e400", true), R"({"a":"1e400"})");
    EXPECT_EQ(splice_set(json, *span, "[1e400]", true), R"({"a":"[1e400]"})");
    EXPECT_EQ(splice_set(json, *span, "[1,2", true), R"({"a":"[1,2"})");
    EXPECT_EQ(splice_set(json, *span, "{x}", true), R"({"a":"{x}"})");
}

TEST(SpliceSet, RawIsNeverQuoted) {
    const std::string json = R"({"a":1})";
    auto span = find_value_span(json, "a");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "\"x\"", false), R"({"a":"x"})");
}

TEST(SpliceSet, BareQuotingDoesNotEscape) {
    const std::string json = R"({"a":1})";
    auto span = find_value_span(json, "a");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, R"(say \"hi\")", true), R"({"a":"say \"hi\""})");
}

TEST(SpliceSet, PreservesFormatting) {
    const std::string json = "{\n  \"name\": \"Tom\",\n  \"age\": 37\n}";
    auto span = find_value_span(json, "age");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_set(json, *span, "38", true), "{\n  \"name\": \"Tom\",\n  \"age\": 38\n}");
}

// ============================================================================
// splice_delete
// ============================================================================

TEST(SpliceDelete, LastMemberTakesPrecedingComma) {
    const std::string json = R"({"name":"Tom","age":37})";
    auto span = find_value_span(json, "age");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "age"), R"({"name":"Tom"})");
}

TEST(SpliceDelete, FirstMemberTakesFollowingComma) {
    const std::string json = R"({"name":"Tom","age":37})";
    auto span = find_value_span(json, "name");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "name"), R"({"age":37})");
}

TEST(SpliceDelete, MiddleMember) {
    const std::string json = R"({"a":1,"b":2,"c":3})";
    auto span = find_value_span(json, "b");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "b"), R"({"a":1,"c":3})");
}

TEST(SpliceDelete, OnlyMember) {
    const std::string json = R"({"a":{"b":1}})";
    auto span = find_value_span(json, "a.b");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "b"), R"({"a":{}})");
}

TEST(SpliceDelete, CompoundValue) {
    const std::string json = R"({"keep":1,"drop":{"x":[1,{"y":2}]},"tail":true})";
    auto span = find_value_span(json, "drop");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "drop"), R"({"keep":1,"tail":true})");
}

TEST(SpliceDelete, PrettyPrinted) {
    const std::string json = "{\n  \"name\": \"Tom\",\n  \"age\": 37\n}";
    auto span = find_value_span(json, "age");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "age"), "{\n  \"name\": \"Tom\"\n}");

    span = find_value_span(json, "name");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(splice_delete(json, *span, "name"), "{\n  \"age\": 37\n}");
}

// ============================================================================
// optimistic_set / optimistic_delete
// ============================================================================

TEST(OptimisticSet, HitPreservesOrder) {
    auto out = optimistic_set(R"({"name":"Tom","age":37})", "name", "Jerry", true);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, R"({"name":"Jerry","age":37})");
}

TEST(OptimisticSet, MissFallsBack) {
    EXPECT_FALSE(optimistic_set(R"({"name":"Tom"})", "age", "37", true).has_value());
    EXPECT_FALSE(optimistic_set(R"({"items":["a"]})", "items.0", "b", true).has_value());
}

TEST(OptimisticSet, IneligiblePathFallsBack) {
    EXPECT_FALSE(optimistic_set(R"({"a b":1})", "a b", "2", true).has_value());
}

TEST(OptimisticDelete, Hit) {
    auto out = optimistic_delete(R"({"user":{"name":"Tom","age":25,"city":"Beijing"}})",
                                 "user.age");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, R"({"user":{"name":"Tom","city":"Beijing"}})");
}

TEST(OptimisticDelete, MissFallsBack) {
    EXPECT_FALSE(optimistic_delete(R"({"items":["a","b"]})", "items.1").has_value());
    EXPECT_FALSE(optimistic_delete(R"({"a":1})", "").has_value());
}
