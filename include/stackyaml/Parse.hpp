/**
 * @file Parse.hpp
 * @brief Scalar resolution and JSON export of syntax nodes
 *
 * Plain scalars are resolved with a subset of the YAML core schema
 * (first match wins):
 * - R1: Null ("null", "Null", "NULL", "~")
 * - R2: Boolean ("true"/"false" in lower, Title or UPPER case)
 * - R3: Integer (matches ^[-+]?[0-9]+$)
 * - R4: Float (decimal or exponent form, ".inf", "-.inf", ".nan")
 * - R5: String (fallback)
 *
 * Quoted and block scalars are always strings.
 */

#ifndef STACKYAML_PARSE_HPP
#define STACKYAML_PARSE_HPP

#include "stackyaml/Value.hpp"
#include "stackyaml/Syntax.hpp"
#include <string>

namespace stackyaml {

/**
 * @brief Resolve the text of a plain scalar to a typed value
 *
 * Examples:
 * ```cpp
 * resolve_plain_scalar("true")      // → true (boolean)
 * resolve_plain_scalar("~")         // → null
 * resolve_plain_scalar("42")        // → 42 (integer)
 * resolve_plain_scalar("-2.5e10")   // → -2.5e10 (float)
 * resolve_plain_scalar("us-west-2") // → "us-west-2" (string)
 * ```
 */
Json resolve_plain_scalar(const std::string& text);

/**
 * @brief Resolve a scalar node according to its style
 */
Json resolve_scalar(const ScalarNode& node);

/**
 * @brief Convert a subtree to JSON
 *
 * Mappings keep their entry order; on duplicate keys the first entry
 * wins, matching path resolution. Secure values stay in their on-disk
 * shape ({"secure": "..."}).
 */
Json node_to_json(const Node& node);

} // namespace stackyaml

#endif // STACKYAML_PARSE_HPP
