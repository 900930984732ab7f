/**
 * @file Mutator.hpp
 * @brief Leaf operations on a resolved mapping node
 *
 * A config value is stored in one of two shapes:
 *
 * ```yaml
 * plain: text              # ConfigValue::plain("text")
 * secret:
 *   secure: AAABAMbc1M=     # ConfigValue::secure("AAABAMbc1M=")
 * ```
 *
 * The shape written by set_value() depends only on the incoming value's
 * secure flag, never on what the entry held before.
 */

#ifndef STACKYAML_MUTATOR_HPP
#define STACKYAML_MUTATOR_HPP

#include "stackyaml/Syntax.hpp"
#include "stackyaml/Value.hpp"
#include <memory>
#include <optional>
#include <string>

namespace stackyaml {

/// Key of the one-entry mapping that marks a secure value
constexpr const char* SECURE_TAG = "secure";

/// Column offset of the `secure` key from the base column
constexpr int SECURE_KEY_OFFSET = 2;

/// Column offset of the ciphertext token from the base column
constexpr int SECURE_VALUE_OFFSET = 4;

/**
 * @brief Find the first entry whose key equals key
 * @return Pointer into node's entries, or nullptr if absent
 */
MappingEntry* find_entry(MappingNode& node, const std::string& key);
const MappingEntry* find_entry(const MappingNode& node, const std::string& key);

/**
 * @brief Update or append a config value
 *
 * Existing key: only the value subtree is replaced; the key node and the
 * entry's position are kept, as is an inline comment that followed the
 * old scalar value.
 *
 * New key: an entry is appended after all existing entries, with the key
 * token at base_column and either a plain scalar at base_column or a
 * `secure` mapping whose key sits at base_column + 2 and whose value
 * token sits at base_column + 4.
 *
 * Example:
 * ```cpp
 * // config:
 * //   aws:region: us-west-2
 * set_value(config, "dbPassword", ConfigValue::secure("AAAB="), 2);
 * // config:
 * //   aws:region: us-west-2
 * //   dbPassword:
 * //     secure: AAAB=
 * ```
 */
void set_value(MappingNode& node, const std::string& key,
               const ConfigValue& value, int base_column);

/**
 * @brief Remove the first entry whose key equals key
 *
 * Remaining entries keep their relative order. Comment lines above the
 * removed entry are kept. Deleting an absent key changes nothing.
 *
 * @return true if an entry was removed
 */
bool delete_value(MappingNode& node, const std::string& key);

/**
 * @brief Read a value subtree back as a ConfigValue
 * @return nullopt if the subtree is neither a scalar nor a `secure` mapping
 */
std::optional<ConfigValue> read_value(const Node& value);

/**
 * @brief Create a synthetic scalar node at a column
 */
std::unique_ptr<ScalarNode> make_scalar(const std::string& text, int column);

/**
 * @brief Create a synthetic one-entry `secure` mapping
 * @param cipher_text Stored ciphertext
 * @param key_column Column of the `secure` key
 * @param value_column Column of the ciphertext token
 */
std::unique_ptr<MappingNode> make_secure_mapping(const std::string& cipher_text,
                                                 int key_column, int value_column);

} // namespace stackyaml

#endif // STACKYAML_MUTATOR_HPP
