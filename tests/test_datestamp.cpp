/**
 * @file test_datestamp.cpp
 * @brief Tests for ISO-8601 detection and ordering
 */

#include <gtest/gtest.h>
#include "unclobber/DateStamp.hpp"
#include "unclobber/Errors.hpp"

using namespace unclobber;

// ============================================================================
// Accepted forms
// ============================================================================

TEST(ParseTimestamp, Epoch) {
    auto ts = parse_timestamp("1970-01-01");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->seconds, 0);
    EXPECT_EQ(ts->nanos, 0);
}

TEST(ParseTimestamp, DateOnly) {
    auto ts = parse_timestamp("2000-03-01");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->seconds, 951868800);
}

TEST(ParseTimestamp, DateTimeVariants) {
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20:30").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01 10:20:30").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20:30Z").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20:30.5+02:00").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20:30-0530").has_value());
    EXPECT_TRUE(parse_timestamp("2023-01-01T10:20:30+02").has_value());
}

TEST(ParseTimestamp, OffsetMovesInstant) {
    auto utc = parse_timestamp("2023-01-01T08:00:00Z");
    auto plus_two = parse_timestamp("2023-01-01T10:00:00+02:00");
    ASSERT_TRUE(utc && plus_two);
    EXPECT_EQ(*utc, *plus_two);
}

TEST(ParseTimestamp, FractionalSeconds) {
    auto ts = parse_timestamp("1970-01-01T00:00:01.25Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->seconds, 1);
    EXPECT_EQ(ts->nanos, 250000000);
}

TEST(ParseTimestamp, LeapDay) {
    EXPECT_TRUE(parse_timestamp("2024-02-29").has_value());
    EXPECT_FALSE(parse_timestamp("2023-02-29").has_value());
    EXPECT_FALSE(parse_timestamp("1900-02-29").has_value());
    EXPECT_TRUE(parse_timestamp("2000-02-29").has_value());
}

// ============================================================================
// Rejected forms
// ============================================================================

TEST(ParseTimestamp, NotDates) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("today").has_value());
    EXPECT_FALSE(parse_timestamp("2023-1-1").has_value());
    EXPECT_FALSE(parse_timestamp("2023/01/01").has_value());
    EXPECT_FALSE(parse_timestamp("2023-13-01").has_value());
    EXPECT_FALSE(parse_timestamp("2023-04-31").has_value());
    EXPECT_FALSE(parse_timestamp("2023-01-01T25:00").has_value());
    EXPECT_FALSE(parse_timestamp("2023-01-01 extra").has_value());
}

TEST(IsDatestamp, OnlyStrings) {
    EXPECT_TRUE(is_datestamp("2023-01-01"));
    EXPECT_FALSE(is_datestamp(20230101));
    EXPECT_FALSE(is_datestamp(nullptr));
    EXPECT_FALSE(is_datestamp(Value::array({"2023-01-01"})));
}

TEST(TimestampOrder, Comparison) {
    auto a = parse_timestamp("2022-12-31T23:59:59Z");
    auto b = parse_timestamp("2023-01-01");
    ASSERT_TRUE(a && b);
    EXPECT_TRUE(*a < *b);
    EXPECT_FALSE(*b < *a);
}

// ============================================================================
// Policy names
// ============================================================================

TEST(DatePolicyNames, ParseAndPrint) {
    EXPECT_EQ(parse_date_policy("latest"), DatePolicy::Latest);
    EXPECT_EQ(parse_date_policy("EARLIEST"), DatePolicy::Earliest);
    EXPECT_EQ(to_string(DatePolicy::Earliest), "earliest");
    EXPECT_EQ(to_string(DatePolicy::Latest), "latest");
    EXPECT_THROW(parse_date_policy("newest"), ConfigError);
}
