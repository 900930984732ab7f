/**
 * @file Document.cpp
 * @brief Implementation of the settings document editor
 */

#include "stackyaml/Document.hpp"
#include "stackyaml/DotPath.hpp"
#include "stackyaml/Errors.hpp"
#include "stackyaml/Mutator.hpp"
#include "stackyaml/Parse.hpp"
#include "stackyaml/Parser.hpp"
#include "stackyaml/Printer.hpp"

namespace stackyaml {

namespace {

template <typename NodeT>
auto checked_root(NodeT* body, const std::string& key_path) {
    auto* root = as_mapping(body);
    if (root == nullptr) {
        throw TypeMismatchError(key_path, "", "mapping",
                                body ? kind_name(body->kind()) : "null");
    }
    return root;
}

} // anonymous namespace

Document Document::parse(const std::optional<std::string>& bytes) {
    if (!bytes.has_value()) {
        return Document();
    }
    return Document(parse_file(*bytes));
}

size_t Document::document_count() const noexcept {
    return file_ ? file_->documents.size() : 0;
}

std::string Document::serialize() const {
    if (!file_) {
        return "";
    }
    Printer printer;
    return printer.print(*file_);
}

const MappingNode* Document::root_mapping(const std::string& key_path) const {
    if (!file_ || file_->documents.empty()) {
        return nullptr;
    }
    const Node* body = file_->documents.front().body.get();
    return checked_root(body, key_path);
}

MappingNode* Document::root_mapping(const std::string& key_path) {
    if (!file_ || file_->documents.empty()) {
        return nullptr;
    }
    return checked_root(file_->documents.front().body.get(), key_path);
}

void Document::set_config(const std::string& key_path, const std::string& key,
                          const ConfigValue& value, int column) {
    MappingNode* root = root_mapping(key_path);
    if (root == nullptr) {
        return;
    }
    MappingNode& node = resolve_mapping(*root, key_path);
    set_value(node, key, value, column);
}

void Document::delete_config(const std::string& key_path, const std::string& key) {
    MappingNode* root = root_mapping(key_path);
    if (root == nullptr) {
        return;
    }
    MappingNode& node = resolve_mapping(*root, key_path);
    delete_value(node, key);
}

std::optional<ConfigValue> Document::get_config(const std::string& key_path,
                                                const std::string& key) const {
    const MappingNode* root = root_mapping(key_path);
    if (root == nullptr) {
        return std::nullopt;
    }

    const MappingEntry* entry = find_entry(resolve_mapping(*root, key_path), key);
    if (entry == nullptr) {
        return std::nullopt;
    }

    auto value = read_value(*entry->value);
    if (!value) {
        std::vector<std::string> segments = split_dot_path(key_path);
        segments.push_back(key);
        throw TypeMismatchError(join_dot_path(segments), key, "scalar or secure value",
                                kind_name(entry->value->kind()));
    }
    return value;
}

Json Document::to_json(const std::string& key_path) const {
    const MappingNode* root = root_mapping(key_path);
    if (root == nullptr) {
        return nullptr;
    }
    return node_to_json(resolve_mapping(*root, key_path));
}

} // namespace stackyaml
