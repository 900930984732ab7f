/**
 * @file Settings.hpp
 * @brief Editor settings and file I/O helpers
 *
 * Settings are layered, lowest precedence first:
 * 1. Built-in defaults (EditorSettings{})
 * 2. TOML settings file ([editor] and [output] tables)
 * 3. Environment variables (STACKYAML_COLUMN, STACKYAML_KEY_PATH)
 * 4. Command-line flags (applied by the CLI)
 *
 * Example settings file:
 * ```toml
 * [editor]
 * column = 4
 * key_path = "config"
 *
 * [output]
 * json_indent = 2
 * ```
 */

#ifndef STACKYAML_SETTINGS_HPP
#define STACKYAML_SETTINGS_HPP

#include <optional>
#include <string>

namespace stackyaml {

/// Environment variable overriding EditorSettings::column
constexpr const char* ENV_COLUMN = "STACKYAML_COLUMN";

/// Environment variable overriding EditorSettings::key_path
constexpr const char* ENV_KEY_PATH = "STACKYAML_KEY_PATH";

/**
 * @brief Tunables for the command-line editor
 */
struct EditorSettings {
    /// Base column for keys created under key_path
    int column = 2;

    /// Dot-path of the mapping holding config entries
    std::string key_path = "config";

    /// Indentation used when printing JSON output
    int json_indent = 2;
};

/**
 * @brief Load settings from a TOML file
 *
 * @param path Path to the settings file
 * @return Defaults overlaid with the file's values; plain defaults if the
 *         file does not exist
 * @throws SettingsError if the file is not valid TOML or a value has the
 *         wrong type
 */
EditorSettings load_settings(const std::string& path);

/**
 * @brief Overlay environment variables onto settings
 *
 * @throws SettingsError if STACKYAML_COLUMN is not a non-negative integer
 */
void apply_env_overrides(EditorSettings& settings);

/**
 * @brief Get environment variable value
 *
 * @return Value if set, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

/**
 * @brief Read a whole file as raw bytes
 *
 * @return File contents, or nullopt if the file does not exist
 * @throws std::runtime_error if the file exists but cannot be read
 */
std::optional<std::string> read_file_bytes(const std::string& path);

/**
 * @brief Replace a file's contents with bytes
 *
 * @throws std::runtime_error if the file cannot be written
 */
void write_file_bytes(const std::string& path, const std::string& bytes);

} // namespace stackyaml

#endif // STACKYAML_SETTINGS_HPP
