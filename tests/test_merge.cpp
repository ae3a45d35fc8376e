/**
 * @file test_merge.cpp
 * @brief Tests for the frontmatter merge using Google Test
 *
 * Validates RULES M1-M5 from Merge.hpp
 */

#include <gtest/gtest.h>
#include "unclobber/Errors.hpp"
#include "unclobber/Merge.hpp"

#include <limits>

using namespace unclobber;

// ============================================================================
// RULE M1: New keys
// ============================================================================

TEST(MergeFrontmatters, NoBlocks) {
    auto result = merge_frontmatters({});
    EXPECT_TRUE(result.merged.is_object());
    EXPECT_TRUE(result.merged.empty());
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_FALSE(result.skipped);
}

TEST(MergeFrontmatters, UnionOfKeys) {
    std::vector<Value> blocks = {{{"title", "A"}}, {{"author", "B"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged, Value({{"title", "A"}, {"author", "B"}}));
    EXPECT_TRUE(result.conflicts.empty());
}

TEST(MergeFrontmatters, FirstSeenKeyOrder) {
    std::vector<Value> blocks = {
        {{"b", 1}, {"a", 1}},
        {{"c", 1}, {"a", 2}, {"b", 1}},
    };
    auto result = merge_frontmatters(blocks);

    std::vector<std::string> keys;
    for (auto it = result.merged.begin(); it != result.merged.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"b", "a", "c"}));
}

// ============================================================================
// RULE M2: Dates
// ============================================================================

TEST(MergeFrontmatters, LatestDateWinsByDefault) {
    std::vector<Value> blocks = {{{"created", "2023-01-01"}}, {{"created", "2022-06-30"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["created"], "2023-01-01");
    EXPECT_TRUE(result.conflicts.empty());
}

TEST(MergeFrontmatters, EarliestPolicy) {
    std::vector<Value> blocks = {{{"created", "2023-01-01"}}, {{"created", "2022-06-30"}}};
    MergeOptions options;
    options.date_policy = DatePolicy::Earliest;
    auto result = merge_frontmatters(blocks, options);
    EXPECT_EQ(result.merged["created"], "2022-06-30");
}

TEST(MergeFrontmatters, DatesCompareAsInstants) {
    // 10:00+02:00 is 08:00Z, earlier than 09:00Z
    std::vector<Value> blocks = {
        {{"updated", "2024-03-01T09:00:00Z"}},
        {{"updated", "2024-03-01T10:00:00+02:00"}},
    };
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["updated"], "2024-03-01T09:00:00Z");
}

TEST(MergeFrontmatters, DateAgainstDateTime) {
    std::vector<Value> blocks = {{{"d", "2024-03-01"}}, {{"d", "2024-03-01T00:00:01Z"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["d"], "2024-03-01T00:00:01Z");
}

TEST(MergeFrontmatters, EqualInstantsKeepExisting) {
    std::vector<Value> blocks = {
        {{"d", "2024-03-01T00:00:00Z"}},
        {{"d", "2024-03-01T01:00:00+01:00"}},
    };
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["d"], "2024-03-01T00:00:00Z");
    EXPECT_TRUE(result.conflicts.empty());
}

TEST(MergeFrontmatters, DateAgainstTextIsAConflict) {
    std::vector<Value> blocks = {{{"d", "2024-03-01"}}, {{"d", "soon"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["d"], "soon");
    ASSERT_EQ(result.conflicts.size(), 1u);
}

// ============================================================================
// RULE M3: Lists
// ============================================================================

TEST(MergeFrontmatters, ListUnionSortedAndDeduplicated) {
    std::vector<Value> blocks = {
        {{"tags", Value::array({"b", "a"})}},
        {{"tags", Value::array({"c", "b"})}},
    };
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["tags"], Value::array({"a", "b", "c"}));
    EXPECT_TRUE(result.conflicts.empty());
}

TEST(MergeFrontmatters, ScalarJoinsList) {
    std::vector<Value> blocks = {{{"tags", "solo"}}, {{"tags", Value::array({"x"})}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["tags"], Value::array({"solo", "x"}));
}

TEST(MergeFrontmatters, ListThenScalar) {
    std::vector<Value> blocks = {{{"tags", Value::array({"x", "y"})}}, {{"tags", "x"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["tags"], Value::array({"x", "y"}));
}

TEST(MergeFrontmatters, ListMeetingMappingIsAConflict) {
    std::vector<Value> blocks = {{{"k", Value::array({"a"})}}, {{"k", {{"x", 1}}}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["k"], Value({{"x", 1}}));
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].key, "k");
    EXPECT_EQ(result.conflicts[0].losing, Value::array({"a"}));
}

TEST(MergeFrontmatters, MappingMeetingListIsAConflict) {
    std::vector<Value> blocks = {{{"k", {{"x", 1}}}}, {{"k", Value::array({"a", "b"})}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["k"], Value::array({"a", "b"}));
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].losing, Value({{"x", 1}}));
}

TEST(MergeFrontmatters, SingleBlockListIsUntouched) {
    std::vector<Value> blocks = {{{"tags", Value::array({"z", "a", "z"})}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["tags"], Value::array({"z", "a", "z"}));
}

TEST(UnionSorted, MixedTypes) {
    Value a = Value::array({"b", 2, nullptr});
    Value b = Value::array({true, 1.5, "a"});
    EXPECT_EQ(union_sorted(a, b), Value::array({nullptr, true, 1.5, 2, "a", "b"}));
}

TEST(UnionSorted, IntegerAndFloatEqualCollapse) {
    auto result = union_sorted(Value::array({1}), Value::array({1.0}));
    EXPECT_EQ(result.size(), 1u);
}

TEST(ValueLess, TypeRank) {
    EXPECT_TRUE(value_less(nullptr, false));
    EXPECT_TRUE(value_less(true, 0));
    EXPECT_TRUE(value_less(100, Value::object()));
    EXPECT_TRUE(value_less(Value::object(), Value::array()));
    EXPECT_TRUE(value_less(Value::array(), ""));
    EXPECT_FALSE(value_less("a", 1));
}

TEST(ValueLess, NumbersCompareNumerically) {
    EXPECT_TRUE(value_less(2, 10));
    EXPECT_TRUE(value_less(-1, 0.5));
    EXPECT_FALSE(value_less(3.0, 3));
}

TEST(ValueLess, NaNSortsLastAmongNumbers) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(value_less(1e300, nan));
    EXPECT_FALSE(value_less(nan, 1e300));
    EXPECT_FALSE(value_less(nan, nan));
    EXPECT_TRUE(value_less(nan, "a"));
}

// ============================================================================
// RULE M4: Equal values
// ============================================================================

TEST(MergeFrontmatters, EqualValuesAreNotConflicts) {
    std::vector<Value> blocks = {
        {{"title", "Same"}, {"meta", {{"k", 1}}}},
        {{"title", "Same"}, {"meta", {{"k", 1}}}},
    };
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged, blocks[0]);
    EXPECT_TRUE(result.conflicts.empty());
}

// ============================================================================
// RULE M5: Conflicts
// ============================================================================

TEST(MergeFrontmatters, AutomaticLaterValueWins) {
    std::vector<Value> blocks = {{{"a", 1}}, {{"a", 2}, {"b", 3}}};
    auto result = merge_frontmatters(blocks);

    EXPECT_EQ(result.merged, Value({{"a", 2}, {"b", 3}}));
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].key, "a");
    EXPECT_EQ(result.conflicts[0].losing, 1);
    EXPECT_EQ(result.conflicts[0].winning, 2);
}

TEST(MergeFrontmatters, TypeChangeIsAConflict) {
    std::vector<Value> blocks = {{{"draft", true}}, {{"draft", "no"}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["draft"], "no");
    EXPECT_EQ(result.conflicts.size(), 1u);
}

TEST(MergeFrontmatters, NestedMappingsAreNotMergedRecursively) {
    std::vector<Value> blocks = {
        {{"meta", {{"a", 1}}}},
        {{"meta", {{"b", 2}}}},
    };
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["meta"], Value({{"b", 2}}));
    EXPECT_EQ(result.conflicts.size(), 1u);
}

TEST(MergeFrontmatters, ThreeBlocksChainConflicts) {
    std::vector<Value> blocks = {{{"a", 1}}, {{"a", 2}}, {{"a", 3}}};
    auto result = merge_frontmatters(blocks);
    EXPECT_EQ(result.merged["a"], 3);
    ASSERT_EQ(result.conflicts.size(), 2u);
    EXPECT_EQ(result.conflicts[1].losing, 2);
}

TEST(MergeFrontmatters, InteractiveKeepExisting) {
    std::vector<Value> blocks = {{{"a", 1}}, {{"a", 2}}};
    MergeOptions options;
    options.mode = ConflictMode::Interactive;

    std::vector<std::string> asked;
    options.resolver = [&asked](const std::string& key, const Value& existing, const Value& incoming) {
        asked.push_back(key);
        EXPECT_EQ(existing, 1);
        EXPECT_EQ(incoming, 2);
        return ConflictChoice::KeepExisting;
    };

    auto result = merge_frontmatters(blocks, options);
    EXPECT_EQ(result.merged["a"], 1);
    EXPECT_EQ(asked, std::vector<std::string>{"a"});
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].winning, 1);
    EXPECT_EQ(result.conflicts[0].losing, 2);
}

TEST(MergeFrontmatters, InteractiveTakeIncoming) {
    std::vector<Value> blocks = {{{"a", 1}}, {{"a", 2}}};
    MergeOptions options;
    options.mode = ConflictMode::Interactive;
    options.resolver = [](const std::string&, const Value&, const Value&) {
        return ConflictChoice::TakeIncoming;
    };

    auto result = merge_frontmatters(blocks, options);
    EXPECT_EQ(result.merged["a"], 2);
}

TEST(MergeFrontmatters, InteractiveSkip) {
    std::vector<Value> blocks = {{{"a", 1}}, {{"a", 2}, {"b", 3}}};
    MergeOptions options;
    options.mode = ConflictMode::Interactive;
    options.resolver = [](const std::string&, const Value&, const Value&) {
        return ConflictChoice::Skip;
    };

    auto result = merge_frontmatters(blocks, options);
    EXPECT_TRUE(result.skipped);
    EXPECT_FALSE(result.merged.contains("b"));
}

TEST(MergeFrontmatters, ResolverNotCalledWithoutConflict) {
    std::vector<Value> blocks = {
        {{"tags", Value::array({"a"})}, {"d", "2020-01-01"}},
        {{"tags", Value::array({"b"})}, {"d", "2021-01-01"}, {"x", 1}},
    };
    MergeOptions options;
    options.mode = ConflictMode::Interactive;
    int calls = 0;
    options.resolver = [&calls](const std::string&, const Value&, const Value&) {
        ++calls;
        return ConflictChoice::KeepExisting;
    };

    merge_frontmatters(blocks, options);
    EXPECT_EQ(calls, 0);
}

TEST(MergeFrontmatters, InteractiveWithoutResolverThrows) {
    MergeOptions options;
    options.mode = ConflictMode::Interactive;
    std::vector<Value> blocks = {Value{{"a", 1}}};
    EXPECT_THROW(merge_frontmatters(blocks, options), MergeError);
}

TEST(MergeFrontmatters, NonMappingBlockThrows) {
    std::vector<Value> blocks = {{{"a", 1}}, Value::array({1, 2})};
    EXPECT_THROW(merge_frontmatters(blocks), MergeError);
}

// ============================================================================
// Names
// ============================================================================

TEST(ConflictModeNames, ParseAndPrint) {
    EXPECT_EQ(parse_conflict_mode("automatic"), ConflictMode::Automatic);
    EXPECT_EQ(parse_conflict_mode("Interactive"), ConflictMode::Interactive);
    EXPECT_EQ(to_string(ConflictMode::Interactive), "interactive");
    EXPECT_THROW(parse_conflict_mode("ask"), ConfigError);
}
