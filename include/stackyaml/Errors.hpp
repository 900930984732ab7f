/**
 * @file Errors.hpp
 * @brief Exception types for stackyaml editing errors
 *
 * Error taxonomy:
 * - EditError: Base class
 * - ParseError: Malformed document bytes
 * - KeyNotFoundError: Dot-path segment not found
 * - TypeMismatchError: Traversal into a non-mapping value
 * - UnsupportedPathError: Path syntax the navigator cannot interpret
 * - SettingsError: Malformed settings file
 *
 * Deleting a missing key and mutating an empty document are not errors.
 */

#ifndef STACKYAML_ERRORS_HPP
#define STACKYAML_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stackyaml {

/**
 * @brief Base class for all stackyaml exceptions
 */
class EditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document bytes could not be parsed
 */
class ParseError : public EditError {
public:
    /**
     * @brief Construct with source location and parser diagnostic
     * @param line 1-based line of the offending character
     * @param column 1-based column of the offending character
     * @param details Diagnostic message from the parser
     */
    ParseError(int line, int column, std::string details)
        : EditError("failed to parse YAML document: line " + std::to_string(line) +
                    ", column " + std::to_string(column) + ": " + details)
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    /**
     * @brief Get the parser diagnostic without location prefix
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    int line_;
    int column_;
    std::string details_;
};

/**
 * @brief Key not found during dot-path traversal
 *
 * Raised when a segment in a dot-path has no matching mapping entry.
 * No partial mutation happens before this is thrown.
 */
class KeyNotFoundError : public EditError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being resolved (e.g., "config.db")
     * @param segment The specific segment that doesn't exist (e.g., "db")
     */
    KeyNotFoundError(std::string path, std::string segment)
        : EditError("config key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when a segment resolves to something other than a mapping
 * (e.g., trying to descend through "db.host" when db is a scalar).
 */
class TypeMismatchError : public EditError {
public:
    /**
     * @brief Construct with path, offending segment, expected and actual kinds
     * @param path Full dot-path being resolved
     * @param segment Segment whose value has the wrong kind ("" for the root)
     * @param expected Expected node kind (e.g., "mapping")
     * @param actual Node kind encountered (e.g., "scalar")
     */
    TypeMismatchError(std::string path, std::string segment,
                      std::string expected, std::string actual)
        : EditError("cannot traverse into " + actual + " (expected " + expected +
                    ") at '" + (segment.empty() ? std::string("<root>") : segment) +
                    "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string segment_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Path syntax that cannot be resolved against mappings
 *
 * Raised for segments implying list indexing ("items[0]") and for
 * empty segments ("a..b").
 */
class UnsupportedPathError : public EditError {
public:
    UnsupportedPathError(std::string path, std::string segment, std::string reason)
        : EditError("unsupported config path '" + path + "' at segment '" +
                    segment + "': " + reason)
        , path_(std::move(path))
        , segment_(std::move(segment))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string path_;
    std::string segment_;
    std::string reason_;
};

/**
 * @brief Editor settings file could not be parsed
 */
class SettingsError : public EditError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the settings file
     * @param details Detailed error message from the TOML parser
     */
    SettingsError(std::string file, std::string details)
        : EditError("Settings error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

} // namespace stackyaml

#endif // STACKYAML_ERRORS_HPP
