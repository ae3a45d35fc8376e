/**
 * @file test_emitter.cpp
 * @brief Tests for YAML re-emission
 */

#include <gtest/gtest.h>
#include "unclobber/Emitter.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Frontmatter.hpp"

#include <limits>

using namespace unclobber;

// ============================================================================
// Scalars
// ============================================================================

TEST(EmitBlock, PlainScalars) {
    Value mapping = {{"title", "Note"}, {"count", 3}, {"draft", false}};
    EXPECT_EQ(emit_block(mapping), "title: Note\ncount: 3\ndraft: false\n");
}

TEST(EmitBlock, NullAsTilde) {
    Value mapping = {{"parent", nullptr}};
    EXPECT_EQ(emit_block(mapping), "parent: ~\n");
}

TEST(EmitBlock, AmbiguousStringsAreQuoted) {
    Value mapping = {{"a", "true"}, {"b", "42"}, {"c", "null"}};
    EXPECT_EQ(emit_block(mapping), "a: \"true\"\nb: \"42\"\nc: \"null\"\n");
}

TEST(EmitBlock, DatesStayPlain) {
    Value mapping = {{"created", "2023-01-01"}};
    EXPECT_EQ(emit_block(mapping), "created: 2023-01-01\n");
}

TEST(EmitBlock, Floats) {
    Value mapping = {{"ratio", 1.5}};
    EXPECT_EQ(emit_block(mapping), "ratio: 1.5\n");

    Value special = {{"nan", std::numeric_limits<double>::quiet_NaN()},
                     {"neg", -std::numeric_limits<double>::infinity()}};
    EXPECT_EQ(emit_block(special), "nan: .nan\nneg: -.inf\n");
}

// ============================================================================
// Collections
// ============================================================================

TEST(EmitBlock, BlockSequenceIndented) {
    Value mapping = {{"tags", Value::array({"alpha", "beta"})}};
    EXPECT_EQ(emit_block(mapping), "tags:\n  - alpha\n  - beta\n");
}

TEST(EmitBlock, TopLevelListsSorted) {
    Value mapping = {{"tags", Value::array({"zeta", "alpha"})}};
    EXPECT_EQ(emit_block(mapping), "tags:\n  - alpha\n  - zeta\n");
}

TEST(EmitBlock, KeepListOrderStyle) {
    Value mapping = {{"tags", Value::array({"zeta", "alpha"})}};
    EmitStyle style;
    style.sort_sequences = false;
    EXPECT_EQ(emit_block(mapping, style), "tags:\n  - zeta\n  - alpha\n");
}

TEST(EmitBlock, EmptyCollections) {
    Value mapping = {{"tags", Value::array()}, {"meta", Value::object()}};
    EXPECT_EQ(emit_block(mapping), "tags: []\nmeta: {}\n");
}

TEST(EmitBlock, NestedMapping) {
    Value mapping = {{"meta", {{"a", 1}}}};
    EXPECT_EQ(emit_block(mapping), "meta:\n  a: 1\n");
}

TEST(EmitBlock, KeyOrderPreserved) {
    Value mapping = {{"z", 1}, {"a", 2}, {"m", 3}};
    EXPECT_EQ(emit_block(mapping), "z: 1\na: 2\nm: 3\n");
}

TEST(EmitBlock, ReadsBackToSameMapping) {
    Value mapping = {
        {"title", "A: tricky # title"},
        {"quoted", "yes"},
        {"number_text", "007"},
        {"empty", ""},
        {"list", Value::array({1, "1", nullptr})},
        {"nested", {{"deep", Value::array({"x"})}}},
    };
    auto parsed = parse_block(emit_block(mapping));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, Value({
        {"title", "A: tricky # title"},
        {"quoted", "yes"},
        {"number_text", "007"},
        {"empty", ""},
        {"list", Value::array({nullptr, 1, "1"})},
        {"nested", {{"deep", Value::array({"x"})}}},
    }));
}

// ============================================================================
// Errors
// ============================================================================

TEST(EmitBlock, NonMappingRootThrows) {
    EXPECT_THROW(emit_block(Value::array({1})), SerializationError);
    EXPECT_THROW(emit_block(Value("text")), SerializationError);
}

TEST(EmitBlock, BinaryValueThrows) {
    Value mapping = {{"blob", Value::binary({0x01, 0x02})}};
    try {
        emit_block(mapping);
        FAIL() << "Expected SerializationError";
    } catch (const SerializationError& e) {
        EXPECT_EQ(e.key(), "blob");
    }
}

// ============================================================================
// Document assembly
// ============================================================================

TEST(AssembleDocument, Layout) {
    Value mapping = {{"a", 2}, {"b", 3}};
    EXPECT_EQ(assemble_document(mapping, "Body text"), "---\na: 2\nb: 3\n---\n\nBody text\n");
}

TEST(AssembleDocument, EmptyBody) {
    Value mapping = {{"a", 1}};
    EXPECT_EQ(assemble_document(mapping, ""), "---\na: 1\n---\n\n\n");
}
