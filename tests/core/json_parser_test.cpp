// Tests for core/json_parser.h -- flat config object parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace tonelang {
namespace {

// ---------------------------------------------------------------------------
// Value types
// ---------------------------------------------------------------------------

TEST(JsonParserTest, ParsesScalarValues) {
  JsonParseResult result = parseJsonObject(
      R"({"notation": "C3 D3", "json": true, "legacy": false, "steps": -2, "x": null})");
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.values.size(), 5u);
  EXPECT_EQ(result.values["notation"].type, JsonValue::String);
  EXPECT_EQ(result.values["notation"].string_val, "C3 D3");
  EXPECT_EQ(result.values["json"].type, JsonValue::Bool);
  EXPECT_TRUE(result.values["json"].bool_val);
  EXPECT_FALSE(result.values["legacy"].bool_val);
  EXPECT_EQ(result.values["steps"].asInt(), -2);
  EXPECT_EQ(result.values["x"].type, JsonValue::Null);
}

TEST(JsonParserTest, ParsesFractionalAndExponentNumbers) {
  JsonParseResult result = parseJsonObject(R"({"a": 0.5, "b": 1e2})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_DOUBLE_EQ(result.values["a"].number_val, 0.5);
  EXPECT_DOUBLE_EQ(result.values["b"].number_val, 100.0);
}

TEST(JsonParserTest, ParsesNumberArrays) {
  JsonParseResult result = parseJsonObject(R"({"intervals": [0, 2, 3.0, 7], "none": []})");
  ASSERT_TRUE(result.success) << result.error_message;
  std::vector<int> intervals;
  ASSERT_TRUE(result.values["intervals"].asIntList(intervals));
  std::vector<int> expected = {0, 2, 3, 7};
  EXPECT_EQ(intervals, expected);
  EXPECT_EQ(result.values["none"].type, JsonValue::Array);
  std::vector<int> none = {1};
  ASSERT_TRUE(result.values["none"].asIntList(none));
  EXPECT_TRUE(none.empty());
}

TEST(JsonParserTest, DecodesStringEscapes) {
  JsonParseResult result = parseJsonObject(R"({"s": "a\"b\\c\nd\/e"})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.values["s"].string_val, "a\"b\\c\nd/e");
}

TEST(JsonParserTest, SkipsNestedObjects) {
  JsonParseResult result = parseJsonObject(R"({"meta": {"k": [1, "}"]}, "json": true})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.values["meta"].type, JsonValue::Null);
  EXPECT_TRUE(result.values["json"].bool_val);
}

TEST(JsonParserTest, AccessorDefaultsOnTypeMismatch) {
  JsonValue text;
  text.type = JsonValue::String;
  text.string_val = "x";
  EXPECT_FALSE(text.isInt());
  EXPECT_EQ(text.asInt(7), 7);
  std::vector<int> untouched = {5};
  EXPECT_FALSE(text.asIntList(untouched));
  EXPECT_EQ(untouched.size(), 1u);
}

// ---------------------------------------------------------------------------
// Integer checks
// ---------------------------------------------------------------------------

TEST(JsonParserIntTest, OnlyWholeNumbersInIntRangeAreInts) {
  JsonParseResult result = parseJsonObject(
      R"({"whole": 3.0, "neg": -2147483648, "frac": 2.7, "huge": 1e30, "tiny": -1e30,
          "max": 2147483647, "over": 2147483648})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_TRUE(result.values["whole"].isInt());
  EXPECT_EQ(result.values["whole"].asInt(), 3);
  EXPECT_EQ(result.values["neg"].asInt(), -2147483647 - 1);
  EXPECT_EQ(result.values["max"].asInt(), 2147483647);
  for (const char* key : {"frac", "huge", "tiny", "over"}) {
    EXPECT_FALSE(result.values[key].isInt()) << key;
    EXPECT_EQ(result.values[key].asInt(-9), -9) << key;
  }
}

TEST(JsonParserIntTest, IntListRejectsFractionsAndOverflow) {
  JsonParseResult result =
      parseJsonObject(R"({"frac": [0, 2.5], "huge": [0, 1e30], "ok": [-1, 2e1]})");
  ASSERT_TRUE(result.success) << result.error_message;
  std::vector<int> out = {9};
  EXPECT_FALSE(result.values["frac"].asIntList(out));
  EXPECT_FALSE(result.values["huge"].asIntList(out));
  std::vector<int> unchanged = {9};
  EXPECT_EQ(out, unchanged);
  ASSERT_TRUE(result.values["ok"].asIntList(out));
  std::vector<int> expected = {-1, 20};
  EXPECT_EQ(out, expected);
}

TEST(JsonParserTest, EmptyObject) {
  JsonParseResult result = parseJsonObject("  { }  ");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.values.empty());
}

TEST(JsonParserTest, LaterDuplicateKeyWins) {
  JsonParseResult result = parseJsonObject(R"({"a": 1, "a": 2})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.values["a"].asInt(), 2);
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(JsonParserTest, RejectsMalformedInput) {
  const char* bad_inputs[] = {
      "",                       // empty
      "[1, 2]",                 // not an object
      R"({"a": 1)",             // unclosed
      R"({"a" 1})",             // missing colon
      R"({"a": tru})",          // bad literal
      R"({"a": nope})",         // bad literal
      R"({"a": ["x"]})",        // non-number array element
      R"({"a": "unterminated})",
      R"({"a": 1} trailing)",
      R"({a: 1})",              // unquoted key
  };
  for (const char* input : bad_inputs) {
    JsonParseResult result = parseJsonObject(input);
    EXPECT_FALSE(result.success) << input;
    EXPECT_FALSE(result.error_message.empty()) << input;
    EXPECT_TRUE(result.values.empty()) << input;
  }
}

TEST(JsonParserTest, ReportsErrorOffset) {
  JsonParseResult result = parseJsonObject(R"({"a": 1, "b": ?})");
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error_offset, 14u);
}

}  // namespace
}  // namespace tonelang
