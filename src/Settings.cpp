/**
 * @file Settings.cpp
 * @brief Settings loading and file I/O
 */

#include "stackyaml/Settings.hpp"
#include "stackyaml/Errors.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace stackyaml {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

int parse_column(const std::string& source, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw SettingsError(source, "column must be a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoi(text);
    } catch (const std::out_of_range&) {
        throw SettingsError(source, "column out of range: " + text);
    }
}

int checked_int(const std::string& path, const char* name, int64_t value) {
    if (value < 0 || value > std::numeric_limits<int>::max()) {
        throw SettingsError(path, std::string(name) + " out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

} // anonymous namespace

EditorSettings load_settings(const std::string& path) {
    EditorSettings settings;
    if (!file_exists(path)) {
        return settings;
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line << ", column "
                << e.source().begin.column << ": " << e.description();
        throw SettingsError(path, details.str());
    }

    if (auto node = table["editor"]["column"]) {
        auto value = node.value<int64_t>();
        if (!value) throw SettingsError(path, "[editor] column must be an integer");
        settings.column = checked_int(path, "[editor] column", *value);
    }
    if (auto node = table["editor"]["key_path"]) {
        auto value = node.value<std::string>();
        if (!value) throw SettingsError(path, "[editor] key_path must be a string");
        settings.key_path = *value;
    }
    if (auto node = table["output"]["json_indent"]) {
        auto value = node.value<int64_t>();
        if (!value) throw SettingsError(path, "[output] json_indent must be an integer");
        settings.json_indent = checked_int(path, "[output] json_indent", *value);
    }

    return settings;
}

void apply_env_overrides(EditorSettings& settings) {
    if (auto column = get_env_var(ENV_COLUMN)) {
        settings.column = parse_column(ENV_COLUMN, *column);
    }
    if (auto key_path = get_env_var(ENV_KEY_PATH)) {
        settings.key_path = *key_path;
    }
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::string> read_file_bytes(const std::string& path) {
    if (!file_exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file for reading: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_file_bytes(const std::string& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot open file for writing: " + path);
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("failed to write file: " + path);
    }
}

} // namespace stackyaml
