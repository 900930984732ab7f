/**
 * @file Syntax.hpp
 * @brief Mutable syntax tree for YAML-like settings documents
 *
 * The tree keeps every byte of the source: each token carries the
 * whitespace and comments around it, so printing an untouched tree
 * reproduces the input exactly.
 *
 * Token trivia is split in two:
 * - leading: everything between the end of the previous token's line
 *   content and this token (line breaks, comment lines, indentation)
 * - trailing: same-line spaces and an inline comment after the token
 *
 * Tokens created by the editor are marked synthetic; they have no trivia
 * of their own and are laid out by the printer from their column.
 */

#ifndef STACKYAML_SYNTAX_HPP
#define STACKYAML_SYNTAX_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stackyaml {

/**
 * @brief Location of a token
 *
 * line is 1-based. column is the 0-based character offset from the start
 * of the line; for synthetic tokens it is the indentation used on output.
 */
struct Position {
    int line = 0;
    int column = 0;
};

enum class TokenType {
    DocumentStart,   ///< ---
    DocumentEnd,     ///< ...
    SequenceEntry,   ///< - (block)
    MappingValue,    ///< :
    FlowEntry,       ///< ,
    MappingStart,    ///< {
    MappingEnd,      ///< }
    SequenceStart,   ///< [
    SequenceEnd,     ///< ]
    Scalar,
    StreamEnd
};

enum class ScalarStyle {
    Plain,
    SingleQuoted,
    DoubleQuoted,
    Literal,         ///< |
    Folded           ///< >
};

struct Token {
    TokenType type = TokenType::Scalar;
    ScalarStyle style = ScalarStyle::Plain;
    std::string text;       ///< literal source text
    std::string value;      ///< decoded scalar value
    std::string leading;
    std::string trailing;
    Position position;
    bool first_on_line = false;
    bool synthetic = false;
};

/**
 * @brief Human-readable description of a token for diagnostics
 */
std::string describe(const Token& token);

/**
 * @brief Create an editor-owned token placed at a column
 */
Token make_synthetic_token(TokenType type, std::string text, int column);

/**
 * @brief Create an editor-owned scalar token for a string value
 *
 * The value is written as a plain scalar when it would read back as the
 * same string, and double-quoted otherwise.
 */
Token make_scalar_token(const std::string& value, int column);

/**
 * @brief True if text can be emitted as a plain scalar and still read
 *        back as that exact string
 */
bool is_plain_safe(const std::string& text);

/**
 * @brief Double-quoted YAML form of a string, with escapes
 */
std::string quote_scalar(const std::string& value);

// ============================================================================
// Nodes
// ============================================================================

enum class NodeKind {
    Null,
    Scalar,
    Mapping,
    Sequence
};

/**
 * @brief Node kind name used in error messages ("null", "scalar", ...)
 */
const char* kind_name(NodeKind kind);

class Node {
public:
    explicit Node(NodeKind kind) : kind_(kind) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeKind kind() const noexcept { return kind_; }

private:
    NodeKind kind_;
};

/**
 * @brief An absent value (`key:` with nothing after it)
 */
class NullNode : public Node {
public:
    NullNode() : Node(NodeKind::Null) {}
};

class ScalarNode : public Node {
public:
    explicit ScalarNode(Token token)
        : Node(NodeKind::Scalar), token(std::move(token)) {}

    const std::string& value() const noexcept { return token.value; }

    Token token;
};

/**
 * @brief One key/value pair of a mapping
 *
 * value is never null; an absent value is a NullNode. comma is only
 * present inside flow mappings.
 */
struct MappingEntry {
    std::unique_ptr<ScalarNode> key;
    Token colon;
    std::unique_ptr<Node> value;
    std::optional<Token> comma;
};

/**
 * @brief Ordered key/value entries, block or flow style
 *
 * open and close hold the braces of a flow mapping. removed_trivia keeps
 * the comment lines that sat above deleted trailing entries of a block
 * mapping; it is printed after the remaining source entries.
 */
class MappingNode : public Node {
public:
    MappingNode() : Node(NodeKind::Mapping) {}

    bool flow = false;
    std::optional<Token> open;
    std::optional<Token> close;
    std::vector<MappingEntry> entries;
    std::string removed_trivia;
};

struct SequenceItem {
    std::optional<Token> dash;
    std::unique_ptr<Node> value;
    std::optional<Token> comma;
};

class SequenceNode : public Node {
public:
    SequenceNode() : Node(NodeKind::Sequence) {}

    bool flow = false;
    std::optional<Token> open;
    std::optional<Token> close;
    std::vector<SequenceItem> items;
};

struct DocumentNode {
    std::optional<Token> start;
    std::unique_ptr<Node> body;
    std::optional<Token> end;
};

/**
 * @brief A parsed stream: zero or more documents plus trailing trivia
 *
 * line_break is the break style of the source ("\n" or "\r\n") and is
 * used for lines the editor adds.
 */
struct File {
    std::vector<DocumentNode> documents;
    std::string trailing;
    std::string line_break = "\n";
};

inline MappingNode* as_mapping(Node* node) {
    return node != nullptr && node->kind() == NodeKind::Mapping
        ? static_cast<MappingNode*>(node) : nullptr;
}

inline const MappingNode* as_mapping(const Node* node) {
    return node != nullptr && node->kind() == NodeKind::Mapping
        ? static_cast<const MappingNode*>(node) : nullptr;
}

inline ScalarNode* as_scalar(Node* node) {
    return node != nullptr && node->kind() == NodeKind::Scalar
        ? static_cast<ScalarNode*>(node) : nullptr;
}

inline const ScalarNode* as_scalar(const Node* node) {
    return node != nullptr && node->kind() == NodeKind::Scalar
        ? static_cast<const ScalarNode*>(node) : nullptr;
}

} // namespace stackyaml

#endif // STACKYAML_SYNTAX_HPP
