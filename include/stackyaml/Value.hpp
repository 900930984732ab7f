/**
 * @file Value.hpp
 * @brief Value types handled by the editor
 *
 * Two value models live here:
 * - ConfigValue: a configuration leaf, either Plain or Secure, whose
 *   payload is always the stored (already encrypted) text
 * - Json: nlohmann::ordered_json, used when a subtree is exported for inspection
 */

#ifndef STACKYAML_VALUE_HPP
#define STACKYAML_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace stackyaml {

/**
 * @brief JSON value type used for exporting document subtrees
 *
 * ordered_json keeps mapping entries in document order.
 */
using Json = nlohmann::ordered_json;

/**
 * @brief A configuration leaf value: Plain(text) or Secure(ciphertext)
 *
 * The editor never encrypts or decrypts. A secure value's payload is the
 * ciphertext exactly as it is stored on disk, and the secure flag only
 * decides which of the two tree shapes is written:
 *
 * ```yaml
 * plain-key: some-text
 * secret-key:
 *   secure: AAABAGVuY3J5cHRlZA==
 * ```
 */
class ConfigValue {
public:
    ConfigValue() = default;

    ConfigValue(std::string cipher_text, bool secure)
        : cipher_text_(std::move(cipher_text)), secure_(secure) {}

    static ConfigValue plain(std::string text) {
        return ConfigValue(std::move(text), false);
    }

    static ConfigValue secure(std::string cipher_text) {
        return ConfigValue(std::move(cipher_text), true);
    }

    /**
     * @brief True if the value is stored under a nested `secure` tag
     */
    bool is_secure() const noexcept { return secure_; }

    /**
     * @brief The stored text (ciphertext for secure values)
     */
    const std::string& cipher_text() const noexcept { return cipher_text_; }

    bool operator==(const ConfigValue& other) const {
        return secure_ == other.secure_ && cipher_text_ == other.cipher_text_;
    }

    bool operator!=(const ConfigValue& other) const {
        return !(*this == other);
    }

private:
    std::string cipher_text_;
    bool secure_ = false;
};

/**
 * @brief JSON representation of a config value
 *
 * Plain values become strings; secure values become {"secure": "..."},
 * mirroring their on-disk shape.
 */
inline Json to_json(const ConfigValue& value) {
    if (value.is_secure()) {
        return Json{{"secure", value.cipher_text()}};
    }
    return Json(value.cipher_text());
}

} // namespace stackyaml

#endif // STACKYAML_VALUE_HPP
