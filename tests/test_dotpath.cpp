/**
 * @file test_dotpath.cpp
 * @brief Unit tests for DotPath functionality (GoogleTest)
 *
 * Tests cover:
 * - split_dot_path / join_dot_path
 * - resolve_mapping traverses nested mappings
 * - KeyNotFoundError for missing segments
 * - TypeMismatchError for non-mapping traversal
 * - UnsupportedPathError for empty and list-index segments
 */

#include <gtest/gtest.h>
#include "stackyaml/DotPath.hpp"
#include "stackyaml/Errors.hpp"
#include "stackyaml/Parser.hpp"

using namespace stackyaml;

// ============================================================================
// split_dot_path / join_dot_path
// ============================================================================

TEST(SplitDotPath, Segments) {
    EXPECT_EQ(split_dot_path("config"), (std::vector<std::string>{"config"}));
    EXPECT_EQ(split_dot_path("config.db.host"),
              (std::vector<std::string>{"config", "db", "host"}));
}

TEST(SplitDotPath, EmptyPathHasNoSegments) {
    EXPECT_TRUE(split_dot_path("").empty());
}

TEST(SplitDotPath, KeepsEmptySegments) {
    EXPECT_EQ(split_dot_path("a..b"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split_dot_path(".a"), (std::vector<std::string>{"", "a"}));
    EXPECT_EQ(split_dot_path("a."), (std::vector<std::string>{"a", ""}));
}

TEST(JoinDotPath, JoinsSegments) {
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({"single"}), "single");
    EXPECT_EQ(join_dot_path({}), "");
}

TEST(IndexSegment, Detection) {
    EXPECT_TRUE(is_index_segment("[0]"));
    EXPECT_TRUE(is_index_segment("items[2]"));
    EXPECT_FALSE(is_index_segment("items"));
    EXPECT_FALSE(is_index_segment("aws:region"));
}

// ============================================================================
// resolve_mapping
// ============================================================================

class ResolveMappingTest : public ::testing::Test {
protected:
    void SetUp() override {
        file = parse_file(
            "config:\n"
            "  aws:region: us-west-2\n"
            "  db:\n"
            "    host: localhost\n"
            "  items:\n"
            "    - a\n"
            "  unset:\n"
            "  db: shadowed\n");
        root = as_mapping(file->documents[0].body.get());
        ASSERT_NE(root, nullptr);
    }

    std::unique_ptr<File> file;
    MappingNode* root = nullptr;
};

TEST_F(ResolveMappingTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(&resolve_mapping(*root, ""), root);
}

TEST_F(ResolveMappingTest, NestedPath) {
    MappingNode& db = resolve_mapping(*root, "config.db");
    ASSERT_EQ(db.entries.size(), 1u);
    EXPECT_EQ(db.entries[0].key->value(), "host");
}

TEST_F(ResolveMappingTest, FirstMatchingKeyWins) {
    // A later duplicate "db" does not shadow the first
    MappingNode& db = resolve_mapping(*root, "config.db");
    EXPECT_EQ(db.entries[0].key->value(), "host");
}

TEST_F(ResolveMappingTest, KeysMayContainColons) {
    MappingNode& config = resolve_mapping(*root, "config");
    EXPECT_EQ(config.entries[0].key->value(), "aws:region");
}

TEST_F(ResolveMappingTest, ConstOverload) {
    const MappingNode& croot = *root;
    const MappingNode& db = resolve_mapping(croot, "config.db");
    EXPECT_EQ(db.entries.size(), 1u);
}

TEST_F(ResolveMappingTest, MissingSegmentRaisesKeyNotFound) {
    try {
        resolve_mapping(*root, "config.cache");
        FAIL() << "Expected KeyNotFoundError";
    } catch (const KeyNotFoundError& e) {
        EXPECT_EQ(e.path(), "config.cache");
        EXPECT_EQ(e.segment(), "cache");
    }
}

TEST_F(ResolveMappingTest, MissingFirstSegment) {
    EXPECT_THROW(resolve_mapping(*root, "settings"), KeyNotFoundError);
}

TEST_F(ResolveMappingTest, ScalarSegmentRaisesTypeMismatch) {
    try {
        resolve_mapping(*root, "config.aws:region");
        FAIL() << "Expected TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_EQ(e.segment(), "aws:region");
        EXPECT_EQ(e.expected(), "mapping");
        EXPECT_EQ(e.actual(), "scalar");
    }
}

TEST_F(ResolveMappingTest, TraversalThroughScalar) {
    EXPECT_THROW(resolve_mapping(*root, "config.db.host"), TypeMismatchError);
}

TEST_F(ResolveMappingTest, SequenceSegmentRaisesTypeMismatch) {
    try {
        resolve_mapping(*root, "config.items");
        FAIL() << "Expected TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_EQ(e.actual(), "sequence");
    }
}

TEST_F(ResolveMappingTest, NullSegmentRaisesTypeMismatch) {
    try {
        resolve_mapping(*root, "config.unset");
        FAIL() << "Expected TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_EQ(e.actual(), "null");
    }
}

TEST_F(ResolveMappingTest, IndexSegmentRejected) {
    try {
        resolve_mapping(*root, "config.items[0]");
        FAIL() << "Expected UnsupportedPathError";
    } catch (const UnsupportedPathError& e) {
        EXPECT_EQ(e.segment(), "items[0]");
    }
}

TEST_F(ResolveMappingTest, EmptySegmentRejected) {
    EXPECT_THROW(resolve_mapping(*root, "config..db"), UnsupportedPathError);
    EXPECT_THROW(resolve_mapping(*root, ".config"), UnsupportedPathError);
    EXPECT_THROW(resolve_mapping(*root, "config."), UnsupportedPathError);
}

TEST_F(ResolveMappingTest, PathCheckedBeforeWalking) {
    // "missing" would raise KeyNotFoundError if the walk came first
    EXPECT_THROW(resolve_mapping(*root, "missing.x[1]"), UnsupportedPathError);
}
