/**
 * @file Mutator.cpp
 * @brief Implementation of leaf operations on mappings
 */

#include "stackyaml/Mutator.hpp"

#include <utility>

namespace stackyaml {

namespace {
    bool has_comment(const std::string& trivia) {
        return trivia.find('#') != std::string::npos;
    }

    ScalarNode* leaf_scalar(Node& node) {
        if (ScalarNode* scalar = as_scalar(&node)) return scalar;
        if (MappingNode* mapping = as_mapping(&node)) {
            if (mapping->entries.size() == 1) return as_scalar(mapping->entries[0].value.get());
        }
        return nullptr;
    }

    /**
     * @brief Swap in a new value, keeping the inline comment of the old one
     *
     * A comment after `key:` moves behind a new scalar so the scalar does
     * not end up inside it.
     */
    void replace_value(MappingNode& node, MappingEntry& entry, std::unique_ptr<Node> value) {
        std::string comment;
        if (const ScalarNode* old = as_scalar(entry.value.get())) {
            if (has_comment(old->token.trailing)) comment = old->token.trailing;
        }

        if (ScalarNode* scalar = as_scalar(value.get())) {
            if (has_comment(entry.colon.trailing)) comment = entry.colon.trailing;
            entry.colon.trailing.clear();
            scalar->token.trailing = comment;
        } else if (!node.flow && !comment.empty()) {
            if (ScalarNode* leaf = leaf_scalar(*value)) leaf->token.trailing = comment;
        }

        entry.value = std::move(value);
    }

    /**
     * @brief Leading trivia for the entry that follows a removed one
     *
     * Keeps the line structure of the removed key (its preceding line
     * break and comment lines) together with the comment lines and
     * indentation that belonged to the next key.
     */
    std::string merge_leading(const Token& removed, const std::string& next) {
        const std::string& prev = removed.leading;
        const size_t next_nl = next.find('\n');
        if (next_nl == std::string::npos) {
            return prev;
        }
        const std::string rest = next.substr(next_nl + 1);

        const size_t prev_nl = prev.rfind('\n');
        if (prev_nl != std::string::npos) {
            return prev.substr(0, prev_nl + 1) + rest;
        }
        if (removed.first_on_line) {
            return prev + rest;
        }
        return prev;
    }

    void remove_entry(MappingNode& node, size_t index) {
        const MappingEntry& removed = node.entries[index];
        const Token& removed_key = removed.key->token;
        if (index + 1 < node.entries.size()) {
            Token& next = node.entries[index + 1].key->token;
            if (!next.synthetic && !removed_key.synthetic) {
                next.leading = merge_leading(removed_key, next.leading);
            }
        } else if (node.flow) {
            if (index > 0 && !removed.comma) node.entries[index - 1].comma.reset();
        } else if (!removed_key.synthetic && has_comment(removed_key.leading)) {
            // Comment lines above the last entry outlive it; its indentation does not
            const std::string& lead = removed_key.leading;
            std::string kept = lead.substr(0, lead.rfind('\n'));
            if (!kept.empty() && kept.back() == '\r') kept.pop_back();
            node.removed_trivia = kept + node.removed_trivia;
        }
        node.entries.erase(node.entries.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

MappingEntry* find_entry(MappingNode& node, const std::string& key) {
    for (auto& entry : node.entries) {
        if (entry.key->value() == key) {
            return &entry;
        }
    }
    return nullptr;
}

const MappingEntry* find_entry(const MappingNode& node, const std::string& key) {
    for (const auto& entry : node.entries) {
        if (entry.key->value() == key) {
            return &entry;
        }
    }
    return nullptr;
}

std::unique_ptr<ScalarNode> make_scalar(const std::string& text, int column) {
    return std::make_unique<ScalarNode>(make_scalar_token(text, column));
}

std::unique_ptr<MappingNode> make_secure_mapping(const std::string& cipher_text,
                                                 int key_column, int value_column) {
    MappingEntry entry;
    entry.key = make_scalar(SECURE_TAG, key_column);
    entry.colon = make_synthetic_token(TokenType::MappingValue, ":", key_column);
    entry.value = make_scalar(cipher_text, value_column);

    auto mapping = std::make_unique<MappingNode>();
    mapping->entries.push_back(std::move(entry));
    return mapping;
}

void set_value(MappingNode& node, const std::string& key,
               const ConfigValue& value, int base_column) {
    auto build = [&]() -> std::unique_ptr<Node> {
        if (value.is_secure()) {
            return make_secure_mapping(value.cipher_text(),
                                       base_column + SECURE_KEY_OFFSET,
                                       base_column + SECURE_VALUE_OFFSET);
        }
        return make_scalar(value.cipher_text(), base_column);
    };

    if (MappingEntry* existing = find_entry(node, key)) {
        replace_value(node, *existing, build());
        return;
    }

    MappingEntry entry;
    entry.key = make_scalar(key, base_column);
    entry.colon = make_synthetic_token(TokenType::MappingValue, ":", base_column);
    entry.value = build();
    node.entries.push_back(std::move(entry));
}

bool delete_value(MappingNode& node, const std::string& key) {
    for (size_t i = 0; i < node.entries.size(); ++i) {
        if (node.entries[i].key->value() == key) {
            remove_entry(node, i);
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> read_value(const Node& value) {
    if (const ScalarNode* scalar = as_scalar(&value)) {
        return ConfigValue::plain(scalar->value());
    }
    if (const MappingNode* mapping = as_mapping(&value)) {
        if (mapping->entries.size() == 1 && mapping->entries[0].key->value() == SECURE_TAG) {
            if (const ScalarNode* cipher = as_scalar(mapping->entries[0].value.get())) {
                return ConfigValue::secure(cipher->value());
            }
        }
    }
    return std::nullopt;
}

} // namespace stackyaml
