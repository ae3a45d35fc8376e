/**
 * @file test_util.cpp
 * @brief Tests for utility functions
 */

#include <gtest/gtest.h>
#include "unclobber/Errors.hpp"
#include "unclobber/Util.hpp"

#include <regex>

using namespace unclobber;

TEST(DotPath, SetCreatesIntermediates) {
    Value data = Value::object();
    set_by_dot(data, "a.b.c", 1);
    EXPECT_EQ(data["a"]["b"]["c"], 1);
}

TEST(DotPath, SetReplacesScalarParent) {
    Value data = {{"a", 5}};
    set_by_dot(data, "a.b", true);
    EXPECT_EQ(data["a"]["b"], true);
}

TEST(DotPath, GetAndExists) {
    Value data = {{"a", {{"b", "x"}}}};
    EXPECT_EQ(get_by_dot(data, "a.b"), "x");
    EXPECT_TRUE(exists_by_dot(data, "a.b"));
    EXPECT_FALSE(exists_by_dot(data, "a.c"));
    EXPECT_FALSE(exists_by_dot(data, "a.b.c"));
}

TEST(DotPath, GetErrors) {
    Value data = {{"a", 1}};
    EXPECT_THROW(get_by_dot(data, "missing"), KeyError);
    EXPECT_THROW(get_by_dot(data, "a.b"), TypeError);
}

TEST(Text, ToLowerAndTrim) {
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_EQ(trim("  \tvalue \r\n"), "value");
    EXPECT_EQ(trim("   "), "");
}

TEST(Text, SplitDropsEmptyParts) {
    EXPECT_EQ(split("a,,b,", ','), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split("", ',').empty());
}

TEST(Text, SplitLinesStripsCarriageReturns) {
    EXPECT_EQ(split_lines("a\r\nb\n\nc"), (std::vector<std::string>{"a", "b", "", "c"}));
    EXPECT_EQ(split_lines("one\n"), std::vector<std::string>{"one"});
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Text, NormalizeNewlines) {
    EXPECT_EQ(normalize_newlines("a\r\nb\r\n"), "a\nb\n");
    EXPECT_EQ(normalize_newlines("mixed\nends\r\nlone\rcr"), "mixed\nends\nlone\rcr");
    EXPECT_EQ(normalize_newlines(""), "");
}

TEST(RegexEscape, MatchesLiterally) {
    const std::string key = "a.b+(c)[d]{e}|f?*^$\\";
    std::regex re("^" + regex_escape(key) + "$");
    EXPECT_TRUE(std::regex_match(key, re));
    EXPECT_FALSE(std::regex_match(std::string("aXb+(c)[d]{e}|f?*^$\\"), re));
}

TEST(Utf8, Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("caf\xE9"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));          // truncated
}

TEST(ParseJsonOrString, TypedOrBare) {
    EXPECT_EQ(parse_json_or_string("true"), true);
    EXPECT_EQ(parse_json_or_string("12"), 12);
    EXPECT_EQ(parse_json_or_string("[\".md\"]"), Value::array({".md"}));
    EXPECT_EQ(parse_json_or_string("earliest"), "earliest");
    EXPECT_EQ(parse_json_or_string("/home/me/notes"), "/home/me/notes");
}

TEST(ValueDisplay, StringsBare) {
    EXPECT_EQ(display(Value("text")), "text");
    EXPECT_EQ(display(Value(3)), "3");
    EXPECT_EQ(display(Value::array({1, 2})), "[1,2]");
    EXPECT_EQ(type_name(Value::array()), "array");
}
