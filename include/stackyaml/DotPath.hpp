/**
 * @file DotPath.hpp
 * @brief Dot-notation path resolution over mapping nodes
 *
 * Resolves paths like "config" or "config.database" to the innermost
 * mapping node an edit applies to.
 *
 * Rules:
 * - An empty path has zero segments and resolves to the root itself
 * - Each segment matches the first entry whose key equals it literally
 * - Every resolved value must itself be a mapping
 * - Segments implying list indexing, and empty segments, are rejected
 */

#ifndef STACKYAML_DOTPATH_HPP
#define STACKYAML_DOTPATH_HPP

#include "stackyaml/Syntax.hpp"
#include "stackyaml/Errors.hpp"
#include <string>
#include <vector>

namespace stackyaml {

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Empty segments are kept so that resolution can reject them.
 *
 * Examples:
 * - "config.db" → ["config", "db"]
 * - "" → []
 * - "a..b" → ["a", "", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Check whether a segment uses list-index syntax ("[0]", "items[2]")
 */
bool is_index_segment(const std::string& segment);

/**
 * @brief Resolve a dot-path to the mapping it names
 *
 * @param root Mapping to start from
 * @param path Dot-separated path ("" returns root)
 * @return Reference to the resolved mapping inside root's tree
 * @throws KeyNotFoundError if a segment has no matching entry
 * @throws TypeMismatchError if a segment's value is not a mapping
 * @throws UnsupportedPathError if a segment is empty or indexes a list
 *
 * Examples:
 * ```cpp
 * // config:
 * //   db:
 * //     host: localhost
 * MappingNode& db = resolve_mapping(root, "config.db");       // OK
 * resolve_mapping(root, "config.cache");     // Throws KeyNotFoundError
 * resolve_mapping(root, "config.db.host");   // Throws TypeMismatchError
 * resolve_mapping(root, "config.items[0]");  // Throws UnsupportedPathError
 * ```
 */
MappingNode& resolve_mapping(MappingNode& root, const std::string& path);

/**
 * @brief Const overload of resolve_mapping()
 */
const MappingNode& resolve_mapping(const MappingNode& root, const std::string& path);

} // namespace stackyaml

#endif // STACKYAML_DOTPATH_HPP
