/**
 * @file Document.hpp
 * @brief Format-preserving editor for a stack settings document
 *
 * A Document owns the syntax tree of one settings file. Edits address a
 * mapping by dot-path (resolved from the first document's root mapping)
 * plus a leaf key, and are applied in place; serialize() re-emits the
 * file with every untouched byte intact.
 *
 * Example:
 * ```cpp
 * auto doc = Document::parse(read_file_bytes("Pulumi.dev.yaml"));
 * doc.set_config("config", "aws:region", ConfigValue::plain("us-east-1"), 2);
 * doc.delete_config("config", "legacyFlag");
 * if (!doc.is_empty()) write_file_bytes("Pulumi.dev.yaml", doc.serialize());
 * ```
 *
 * A Document is not safe for concurrent use; edit and serialize from one
 * thread at a time.
 */

#ifndef STACKYAML_DOCUMENT_HPP
#define STACKYAML_DOCUMENT_HPP

#include "stackyaml/Syntax.hpp"
#include "stackyaml/Value.hpp"
#include <memory>
#include <optional>
#include <string>

namespace stackyaml {

class Document {
public:
    Document() = default;

    /**
     * @brief Parse document bytes
     *
     * @param bytes File contents, or nullopt when the file does not exist
     * @return Empty Document for nullopt, parsed Document otherwise
     * @throws ParseError if bytes are malformed
     */
    static Document parse(const std::optional<std::string>& bytes);

    /**
     * @brief True if no tree was parsed (absent input)
     *
     * A parsed file with zero documents (empty text or only comments)
     * is not empty.
     */
    bool is_empty() const noexcept { return file_ == nullptr; }

    /**
     * @brief Number of parsed documents (0 when empty)
     */
    size_t document_count() const noexcept;

    /**
     * @brief Re-emit the document
     *
     * An empty Document serializes to an empty string.
     */
    std::string serialize() const;

    /**
     * @brief Set a config value under a mapping
     *
     * @param key_path Dot-path of the mapping holding key ("" for the root)
     * @param key Leaf key
     * @param value Plain or secure value; its stored text is written as is
     * @param column Base column for newly created tokens
     * @throws KeyNotFoundError, TypeMismatchError, UnsupportedPathError
     *
     * Silently does nothing on an empty Document or one with zero documents.
     */
    void set_config(const std::string& key_path, const std::string& key,
                    const ConfigValue& value, int column);

    /**
     * @brief Remove a config value from a mapping
     *
     * Removing an absent key is not an error. Silently does nothing on an
     * empty Document or one with zero documents.
     *
     * @throws KeyNotFoundError, TypeMismatchError, UnsupportedPathError
     */
    void delete_config(const std::string& key_path, const std::string& key);

    /**
     * @brief Read a config value back
     *
     * @return nullopt if the Document is empty, has zero documents, or key
     *         is absent
     * @throws TypeMismatchError if the value is neither a scalar nor a
     *         `secure` mapping, or the path does not lead to a mapping
     * @throws KeyNotFoundError, UnsupportedPathError for bad paths
     */
    std::optional<ConfigValue> get_config(const std::string& key_path,
                                          const std::string& key) const;

    /**
     * @brief Export the mapping at key_path as JSON
     *
     * @return null for an empty Document or one with zero documents
     */
    Json to_json(const std::string& key_path = "") const;

    /**
     * @brief Direct access to the tree (nullptr when empty)
     */
    File* file() noexcept { return file_.get(); }
    const File* file() const noexcept { return file_.get(); }

private:
    explicit Document(std::unique_ptr<File> file) : file_(std::move(file)) {}

    MappingNode* root_mapping(const std::string& key_path);
    const MappingNode* root_mapping(const std::string& key_path) const;

    std::unique_ptr<File> file_;
};

} // namespace stackyaml

#endif // STACKYAML_DOCUMENT_HPP
