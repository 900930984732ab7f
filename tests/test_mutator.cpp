/**
 * @file test_mutator.cpp
 * @brief Unit tests for leaf operations on mappings (GoogleTest)
 *
 * Tests cover:
 * - find_entry first-match lookup
 * - set_value insert and update, plain and secure shapes
 * - delete_value with comment and flow-comma handling
 * - read_value for scalars and secure mappings
 */

#include <gtest/gtest.h>
#include "stackyaml/Mutator.hpp"
#include "stackyaml/Parser.hpp"
#include "stackyaml/Printer.hpp"

using namespace stackyaml;

namespace {

/**
 * @brief Parsed source whose first document body is a mapping
 */
class Tree {
public:
    explicit Tree(const std::string& source) : file_(parse_file(source)) {}

    MappingNode& root() {
        MappingNode* root = as_mapping(file_->documents.at(0).body.get());
        if (root == nullptr) throw std::logic_error("document body is not a mapping");
        return *root;
    }

    MappingNode& child(const std::string& key) {
        MappingEntry* entry = find_entry(root(), key);
        if (entry == nullptr) throw std::logic_error("missing key: " + key);
        MappingNode* node = as_mapping(entry->value.get());
        if (node == nullptr) throw std::logic_error("not a mapping: " + key);
        return *node;
    }

    std::string print() {
        Printer printer;
        return printer.print(*file_);
    }

private:
    std::unique_ptr<File> file_;
};

} // anonymous namespace

// ============================================================================
// find_entry
// ============================================================================

TEST(FindEntry, FirstMatch) {
    Tree tree("a: 1\nb: 2\na: 3\n");
    MappingEntry* entry = find_entry(tree.root(), "a");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(as_scalar(entry->value.get())->value(), "1");
    EXPECT_EQ(find_entry(tree.root(), "missing"), nullptr);
}

TEST(FindEntry, ComparesDecodedKeys) {
    Tree tree("'quoted key': 1\n\"aws:region\": x\n");
    EXPECT_NE(find_entry(tree.root(), "quoted key"), nullptr);
    EXPECT_NE(find_entry(tree.root(), "aws:region"), nullptr);
}

// ============================================================================
// set_value
// ============================================================================

TEST(SetValue, UpdatePlainScalar) {
    Tree tree("foo: bar");
    set_value(tree.root(), "foo", ConfigValue::plain("baz"), 0);
    EXPECT_EQ(tree.print(), "foo: baz");
}

TEST(SetValue, UpdateKeepsPositionAndNeighbours) {
    Tree tree("config:\n  a: 1\n  b: 2\n  c: 3\n");
    set_value(tree.child("config"), "b", ConfigValue::plain("two"), 2);
    EXPECT_EQ(tree.print(), "config:\n  a: 1\n  b: two\n  c: 3\n");
}

TEST(SetValue, UpdateKeepsInlineComment) {
    Tree tree("a: old # note\nb: 1\n");
    set_value(tree.root(), "a", ConfigValue::plain("new"), 0);
    EXPECT_EQ(tree.print(), "a: new # note\nb: 1\n");
}

TEST(SetValue, UpdateNullValue) {
    Tree tree("config:\n  a:\n");
    set_value(tree.child("config"), "a", ConfigValue::plain("x"), 2);
    EXPECT_EQ(tree.print(), "config:\n  a: x\n");
}

TEST(SetValue, UpdateSecureToPlainMovesColonComment) {
    Tree tree("a: # note\n  secure: X\n");
    set_value(tree.root(), "a", ConfigValue::plain("v"), 0);
    EXPECT_EQ(tree.print(), "a: v # note\n");
}

TEST(SetValue, UpdatePlainToSecure) {
    Tree tree("config:\n  pw: plain # c\n");
    set_value(tree.child("config"), "pw", ConfigValue::secure("S"), 2);
    EXPECT_EQ(tree.print(), "config:\n  pw:\n    secure: S # c\n");
}

TEST(SetValue, UpdateSecureToSecure) {
    Tree tree("config:\n  pw:\n    secure: OLD\n  next: 1\n");
    set_value(tree.child("config"), "pw", ConfigValue::secure("NEW"), 2);
    EXPECT_EQ(tree.print(), "config:\n  pw:\n    secure: NEW\n  next: 1\n");
}

TEST(SetValue, InsertAppendsLast) {
    Tree tree("config:\n  z: 1\n  a: 2\n");
    set_value(tree.child("config"), "m", ConfigValue::plain("3x"), 2);

    const MappingNode& config = tree.child("config");
    ASSERT_EQ(config.entries.size(), 3u);
    EXPECT_EQ(config.entries[0].key->value(), "z");
    EXPECT_EQ(config.entries[1].key->value(), "a");
    EXPECT_EQ(config.entries[2].key->value(), "m");
}

TEST(SetValue, InsertSecureGeometry) {
    Tree tree("config:\n  a: 1\n");
    set_value(tree.child("config"), "pw", ConfigValue::secure("XYZ"), 2);

    const MappingEntry* entry = find_entry(tree.child("config"), "pw");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->key->token.position.column, 2);

    const MappingNode* secure = as_mapping(entry->value.get());
    ASSERT_NE(secure, nullptr);
    ASSERT_EQ(secure->entries.size(), 1u);
    EXPECT_EQ(secure->entries[0].key->value(), SECURE_TAG);
    EXPECT_EQ(secure->entries[0].key->token.position.column, 4);
    EXPECT_EQ(as_scalar(secure->entries[0].value.get())->token.position.column, 6);
}

TEST(SetValue, InsertIntoEmptyFlowRoot) {
    Tree tree("{}");
    set_value(tree.root(), "secret", ConfigValue::secure("XYZ"), 2);
    EXPECT_EQ(tree.print(), "  secret:\n    secure: XYZ");
}

TEST(SetValue, StoredTextIsVerbatim) {
    Tree tree("a: 1\n");
    set_value(tree.root(), "b", ConfigValue::plain("it's \"x\""), 0);
    auto value = read_value(*find_entry(tree.root(), "b")->value);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->cipher_text(), "it's \"x\"");
}

// ============================================================================
// delete_value
// ============================================================================

TEST(DeleteValue, RemovesMiddleEntryKeepingCommentAbove) {
    Tree tree("config:\n  a: 1\n  # about b\n  b: 2\n  c: 3\n");
    EXPECT_TRUE(delete_value(tree.child("config"), "b"));
    EXPECT_EQ(tree.print(), "config:\n  a: 1\n  # about b\n  c: 3\n");
}

TEST(DeleteValue, RemovesFirstEntry) {
    Tree tree("a: 1\nb: 2\n");
    EXPECT_TRUE(delete_value(tree.root(), "a"));
    EXPECT_EQ(tree.print(), "b: 2\n");
}

TEST(DeleteValue, RemovesFirstEntryAfterHeader) {
    Tree tree("# header\na: 1\nb: 2\n");
    EXPECT_TRUE(delete_value(tree.root(), "a"));
    EXPECT_EQ(tree.print(), "# header\nb: 2\n");
}

TEST(DeleteValue, RemovesLastEntry) {
    Tree tree("a: 1\nb: 2 # gone\n");
    EXPECT_TRUE(delete_value(tree.root(), "b"));
    EXPECT_EQ(tree.print(), "a: 1\n");
}

TEST(DeleteValue, LastEntryKeepsCommentAbove) {
    Tree tree("config:\n  a: 1\n  # about b\n  b: 2\nnext: 1\n");
    EXPECT_TRUE(delete_value(tree.child("config"), "b"));
    EXPECT_EQ(tree.print(), "config:\n  a: 1\n  # about b\nnext: 1\n");

    set_value(tree.child("config"), "c", ConfigValue::plain("x"), 2);
    EXPECT_EQ(tree.print(), "config:\n  a: 1\n  # about b\n  c: x\nnext: 1\n");
}

TEST(DeleteValue, LastEntryThenSet) {
    Tree tree("config:\n  a: 1\n");
    EXPECT_TRUE(delete_value(tree.child("config"), "a"));
    EXPECT_EQ(tree.print(), "config: {}\n");

    Tree reparsed(tree.print());
    set_value(reparsed.child("config"), "b", ConfigValue::plain("x"), 2);
    EXPECT_EQ(reparsed.print(), "config:\n  b: x\n");

    set_value(tree.child("config"), "b", ConfigValue::plain("x"), 2);
    EXPECT_EQ(tree.print(), "config:\n  b: x\n");
}

TEST(DeleteValue, LastEntryCrlf) {
    Tree tree("config:\r\n  a: 1\r\n  # gone soon\r\n  b: 2\r\n");
    EXPECT_TRUE(delete_value(tree.child("config"), "b"));
    EXPECT_EQ(tree.print(), "config:\r\n  a: 1\r\n  # gone soon\r\n");
}

TEST(DeleteValue, RemovesSecureEntry) {
    Tree tree("config:\n  pw:\n    secure: X\n  keep: 1\n");
    EXPECT_TRUE(delete_value(tree.child("config"), "pw"));
    EXPECT_EQ(tree.print(), "config:\n  keep: 1\n");
}

TEST(DeleteValue, FlowEntries) {
    Tree first("{a: 1, b: 2}");
    EXPECT_TRUE(delete_value(first.root(), "a"));
    EXPECT_EQ(first.print(), "{b: 2}");

    Tree last("{a: 1, b: 2}");
    EXPECT_TRUE(delete_value(last.root(), "b"));
    EXPECT_EQ(last.print(), "{a: 1}");
}

TEST(DeleteValue, AbsentKeyIsNoOp) {
    const std::string source = "a: 1 # c\nb: 2\n";
    Tree tree(source);
    EXPECT_FALSE(delete_value(tree.root(), "zzz"));
    EXPECT_EQ(tree.print(), source);
}

TEST(DeleteValue, OnlyFirstDuplicateRemoved) {
    Tree tree("k: 1\nk: 2\n");
    EXPECT_TRUE(delete_value(tree.root(), "k"));
    EXPECT_EQ(tree.print(), "k: 2\n");
}

// ============================================================================
// read_value
// ============================================================================

TEST(ReadValue, Shapes) {
    Tree tree("p: text\ns:\n  secure: CIPHER\nn: {a: 1, b: 2}\nl: [1]\n");

    auto plain = read_value(*find_entry(tree.root(), "p")->value);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, ConfigValue::plain("text"));

    auto secure = read_value(*find_entry(tree.root(), "s")->value);
    ASSERT_TRUE(secure.has_value());
    EXPECT_EQ(*secure, ConfigValue::secure("CIPHER"));

    EXPECT_FALSE(read_value(*find_entry(tree.root(), "n")->value).has_value());
    EXPECT_FALSE(read_value(*find_entry(tree.root(), "l")->value).has_value());
}
