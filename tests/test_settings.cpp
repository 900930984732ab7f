/**
 * @file test_settings.cpp
 * @brief Tests for settings loading and file helpers (GoogleTest)
 *
 * Tests cover:
 * - TOML settings over built-in defaults
 * - Missing and malformed settings files
 * - STACKYAML_COLUMN / STACKYAML_KEY_PATH overrides
 * - read_file_bytes / write_file_bytes
 */

#include <gtest/gtest.h>
#include "stackyaml/Settings.hpp"
#include "stackyaml/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace stackyaml;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".toml")
        : path_(fs::temp_directory_path() /
                ("stackyaml_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for setting/restoring environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name), had_original_(false) {
        const char* original = std::getenv(name.c_str());
        if (original) {
            had_original_ = true;
            original_value_ = original;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (had_original_) {
            setenv(name_.c_str(), original_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string original_value_;
    bool had_original_;
};

std::string missing_path() {
    return (fs::temp_directory_path() /
            ("stackyaml_missing_" + std::to_string(std::rand()) + ".yaml")).string();
}

} // anonymous namespace

// ============================================================================
// load_settings
// ============================================================================

TEST(LoadSettings, MissingFileGivesDefaults) {
    EditorSettings s = load_settings(missing_path());
    EXPECT_EQ(s.column, 2);
    EXPECT_EQ(s.key_path, "config");
    EXPECT_EQ(s.json_indent, 2);
}

TEST(LoadSettings, ReadsAllKeys) {
    TempFile file(
        "[editor]\n"
        "column = 4\n"
        "key_path = \"values.app\"\n"
        "\n"
        "[output]\n"
        "json_indent = 0\n");

    EditorSettings s = load_settings(file.path());
    EXPECT_EQ(s.column, 4);
    EXPECT_EQ(s.key_path, "values.app");
    EXPECT_EQ(s.json_indent, 0);
}

TEST(LoadSettings, PartialFileKeepsDefaults) {
    TempFile file("[editor]\ncolumn = 6\n");
    EditorSettings s = load_settings(file.path());
    EXPECT_EQ(s.column, 6);
    EXPECT_EQ(s.key_path, "config");
    EXPECT_EQ(s.json_indent, 2);
}

TEST(LoadSettings, SyntaxErrorThrows) {
    TempFile file("[editor\ncolumn = \n");
    try {
        load_settings(file.path());
        FAIL() << "Expected SettingsError";
    } catch (const SettingsError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_NE(std::string(e.what()).find("line"), std::string::npos);
    }
}

TEST(LoadSettings, WrongTypeThrows) {
    TempFile file("[editor]\ncolumn = \"four\"\n");
    EXPECT_THROW(load_settings(file.path()), SettingsError);
}

TEST(LoadSettings, NegativeColumnThrows) {
    TempFile file("[editor]\ncolumn = -2\n");
    EXPECT_THROW(load_settings(file.path()), SettingsError);
}

// ============================================================================
// apply_env_overrides
// ============================================================================

TEST(EnvOverrides, OverridesFileValues) {
    ScopedEnvVar column(ENV_COLUMN, "8");
    ScopedEnvVar key_path(ENV_KEY_PATH, "other");

    EditorSettings s;
    s.column = 4;
    apply_env_overrides(s);
    EXPECT_EQ(s.column, 8);
    EXPECT_EQ(s.key_path, "other");
}

TEST(EnvOverrides, UnsetVariablesLeaveSettings) {
    unsetenv(ENV_COLUMN);
    unsetenv(ENV_KEY_PATH);

    EditorSettings s;
    s.key_path = "kept";
    apply_env_overrides(s);
    EXPECT_EQ(s.column, 2);
    EXPECT_EQ(s.key_path, "kept");
}

TEST(EnvOverrides, InvalidColumnThrows) {
    ScopedEnvVar column(ENV_COLUMN, "wide");
    EditorSettings s;
    EXPECT_THROW(apply_env_overrides(s), SettingsError);
}

TEST(EnvOverrides, EmptyKeyPathMeansRoot) {
    ScopedEnvVar key_path(ENV_KEY_PATH, "");
    EditorSettings s;
    apply_env_overrides(s);
    EXPECT_EQ(s.key_path, "");
}

TEST(GetEnvVar, SetAndUnset) {
    {
        ScopedEnvVar var("STACKYAML_TEST_VAR", "value");
        EXPECT_EQ(get_env_var("STACKYAML_TEST_VAR"), std::optional<std::string>("value"));
    }
    EXPECT_FALSE(get_env_var("STACKYAML_TEST_VAR").has_value());
}

// ============================================================================
// File helpers
// ============================================================================

TEST(FileBytes, MissingFileIsNullopt) {
    EXPECT_FALSE(read_file_bytes(missing_path()).has_value());
}

TEST(FileBytes, ReadsExactBytes) {
    const std::string content = "config:\r\n  a: 1\r\n# no newline";
    TempFile file(content, ".yaml");
    auto bytes = read_file_bytes(file.path());
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, content);
}

TEST(FileBytes, WriteThenRead) {
    TempFile file("old", ".yaml");
    write_file_bytes(file.path(), "new: value\n");
    EXPECT_EQ(read_file_bytes(file.path()), std::optional<std::string>("new: value\n"));
}

TEST(FileBytes, WriteToMissingDirectoryThrows) {
    const std::string path =
        (fs::temp_directory_path() / "stackyaml_no_such_dir" / "f.yaml").string();
    EXPECT_THROW(write_file_bytes(path, "x"), std::runtime_error);
}
