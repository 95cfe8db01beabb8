// Tests for core/json_parser.h -- flat-object config parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

namespace shapesound {
namespace {

std::map<std::string, JsonValue> parse(const std::string& text) {
  return parseJsonObject(text.c_str(), text.size());
}

// ---------------------------------------------------------------------------
// Value types
// ---------------------------------------------------------------------------

TEST(JsonParserTest, GeneratorConfigFields) {
  auto kv = parse(R"({"sampling":"edges","mode":"v2","duration":7.5,"volume":0.8,"seed":42})");
  ASSERT_EQ(kv.size(), 5u);
  EXPECT_EQ(kv["sampling"].asString(), "edges");
  EXPECT_EQ(kv["mode"].asString(), "v2");
  EXPECT_DOUBLE_EQ(kv["duration"].asDouble(), 7.5);
  EXPECT_DOUBLE_EQ(kv["volume"].asDouble(), 0.8);
  EXPECT_EQ(kv["seed"].asUint(), 42u);
}

TEST(JsonParserTest, BoolAndNull) {
  auto kv = parse(R"({ "play" : true , "json": false, "seed": null })");
  EXPECT_EQ(kv["play"].type, JsonValue::Bool);
  EXPECT_TRUE(kv["play"].asBool());
  EXPECT_FALSE(kv["json"].asBool(true));
  EXPECT_EQ(kv["seed"].type, JsonValue::Null);
  EXPECT_EQ(kv["seed"].asUint(9), 9u);
}

TEST(JsonParserTest, NumbersWithExponentAndSign) {
  auto kv = parse(R"({"a":-2.5,"b":1e3,"c":2.5E-1})");
  EXPECT_DOUBLE_EQ(kv["a"].asDouble(), -2.5);
  EXPECT_DOUBLE_EQ(kv["b"].asDouble(), 1000.0);
  EXPECT_DOUBLE_EQ(kv["c"].asDouble(), 0.25);
}

TEST(JsonParserTest, NegativeNumberIsNotUint) {
  auto kv = parse(R"({"seed":-1})");
  EXPECT_EQ(kv["seed"].asUint(7), 7u);
}

TEST(JsonParserTest, StringEscapes) {
  auto kv = parse(R"({"path":"a\"b\\c\nd"})");
  EXPECT_EQ(kv["path"].asString(), "a\"b\\c\nd");
}

TEST(JsonParserTest, TypeMismatchUsesDefault) {
  auto kv = parse(R"({"duration":"long","mode":3})");
  EXPECT_DOUBLE_EQ(kv["duration"].asDouble(5.0), 5.0);
  EXPECT_EQ(kv["mode"].asString("v2"), "v2");
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

TEST(JsonParserTest, NestedContainersAreSkipped) {
  auto kv = parse(R"({"extra":{"x":[1,2,{"y":"}"}]},"seed":5,"list":[1,2]})");
  EXPECT_EQ(kv.count("extra"), 0u);
  EXPECT_EQ(kv.count("list"), 0u);
  EXPECT_EQ(kv["seed"].asUint(), 5u);
}

TEST(JsonParserTest, EmptyAndNonObjectInputs) {
  EXPECT_TRUE(parse("").empty());
  EXPECT_TRUE(parse("{}").empty());
  EXPECT_TRUE(parse("[1,2]").empty());
  EXPECT_TRUE(parseJsonObject(nullptr, 10).empty());
}

TEST(JsonParserTest, KeysBeforeSyntaxErrorAreKept) {
  auto kv = parse(R"({"seed":3,"volume":})");
  EXPECT_EQ(kv["seed"].asUint(), 3u);
  EXPECT_EQ(kv.count("volume"), 0u);
}

TEST(JsonParserTest, RespectsLength) {
  const char* text = R"({"seed":12}garbage)";
  auto kv = parseJsonObject(text, std::strlen(R"({"seed":12})"));
  EXPECT_EQ(kv["seed"].asUint(), 12u);
}

}  // namespace
}  // namespace shapesound
