/**
 * @file Parser.hpp
 * @brief Comment-retaining parser for YAML-like settings documents
 *
 * Supported subset:
 * - Block mappings and block sequences (a sequence may sit at the same
 *   indentation as its parent key)
 * - Flow mappings `{a: b}` and flow sequences `[a, b]`
 * - Plain, single-quoted and double-quoted scalars; plain and quoted
 *   scalars may continue on deeper-indented lines
 * - Literal `|` and folded `>` block scalars with chomping and
 *   indentation indicators
 * - Comments anywhere whitespace is allowed
 * - Multiple documents separated by `---` and `...`
 *
 * Rejected with ParseError: anchors, aliases, tags, directives, complex
 * `?` keys, multi-line keys, tab indentation, and collections nested
 * deeper than 256 levels.
 */

#ifndef STACKYAML_PARSER_HPP
#define STACKYAML_PARSER_HPP

#include "stackyaml/Syntax.hpp"
#include <memory>
#include <string>
#include <vector>

namespace stackyaml {

/**
 * @brief Split source bytes into tokens with their trivia attached
 *
 * The last token is always StreamEnd; its leading trivia is whatever
 * follows the final content token.
 *
 * @throws ParseError on invalid or unsupported syntax
 */
std::vector<Token> scan_tokens(const std::string& source);

/**
 * @brief Parse source bytes into a syntax tree
 *
 * Empty input, or input holding only comments and whitespace, gives a
 * File with zero documents whose trailing trivia is the whole input.
 *
 * @throws ParseError on invalid or unsupported syntax
 */
std::unique_ptr<File> parse_file(const std::string& source);

} // namespace stackyaml

#endif // STACKYAML_PARSER_HPP
