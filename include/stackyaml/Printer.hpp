/**
 * @file Printer.hpp
 * @brief Serialization of syntax trees back to bytes
 *
 * Source tokens are written with their original trivia, so untouched
 * regions come out byte-identical. Synthetic tokens are laid out from
 * their column:
 * - a block mapping entry starts on a fresh line, indented by the key's
 *   column
 * - a scalar value follows its ':' after a single space
 * - inside flow collections, entries are separated by ", " and a
 *   synthetic mapping is written as {key: value}
 *
 * A flow mapping whose entries are all synthetic (typically `{}` that
 * gained keys) is rewritten in block style when it sits in block context.
 * A block mapping with no entries left prints as `{}` so that it still
 * reads back as a mapping.
 *
 * Lines added by the printer end with the file's own line break style.
 */

#ifndef STACKYAML_PRINTER_HPP
#define STACKYAML_PRINTER_HPP

#include "stackyaml/Syntax.hpp"
#include <string>

namespace stackyaml {

class Printer {
public:
    /**
     * @brief Print every document of a file followed by its trailing trivia
     */
    std::string print(const File& file);

    /**
     * @brief Print a single document
     */
    std::string print(const DocumentNode& document);

    /**
     * @brief Print a single node in block context
     */
    std::string print(const Node& node);

private:
    enum class Context { Block, Flow };

    std::string out_;
    std::string line_break_ = "\n";
    bool comment_open_ = false;  ///< last line written ends in a comment
    size_t trailing_at_ = 0;     ///< where the last token's trailing trivia starts
    size_t token_end_ = 0;       ///< out_ size right after the last token

    void reset(const std::string& line_break);
    void write_token(const Token& token);
    void write_document(const DocumentNode& document);
    void write_node(const Node& node, Context context);
    void write_value(const Node& node, Context context);
    void write_scalar(const ScalarNode& node, Context context);
    void write_mapping(const MappingNode& mapping, Context context);
    void write_block_entries(const MappingNode& mapping);
    void write_empty_block(const MappingNode& mapping);
    void write_flow_entries(const MappingNode& mapping);
    void write_sequence(const SequenceNode& seq, Context context);
    void begin_line(int column);
    void close_comment();
};

} // namespace stackyaml

#endif // STACKYAML_PRINTER_HPP
