/**
 * @file Cli.hpp
 * @brief Command dispatch behind stackyaml-cli
 *
 * main() only turns command-line flags into CliOptions; everything after
 * that lives here so it can be driven from tests with string streams.
 *
 * Commands:
 * - get KEY: print the value as JSON ("x" or {"secure": "x"})
 * - set KEY VALUE [--secure]: create or update an entry
 * - rm KEY: delete an entry (absent keys are fine)
 * - list: print the mapping at the key path as JSON
 * - fmt: parse and re-emit the file unchanged
 */

#ifndef STACKYAML_CLI_HPP
#define STACKYAML_CLI_HPP

#include "stackyaml/Settings.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stackyaml {

/// Settings file read when --settings is not given
constexpr const char* DEFAULT_SETTINGS_FILE = ".stackyaml.toml";

/**
 * @brief Parsed command line
 *
 * key_path and column are only set when given as flags; they take
 * precedence over the settings file and the environment.
 */
struct CliOptions {
    std::string file;
    std::string settings_file = DEFAULT_SETTINGS_FILE;
    std::optional<std::string> key_path;
    std::optional<int> column;
    bool secure = false;
    bool to_stdout = false;
    bool verbose = false;
    std::vector<std::string> command;   ///< command name followed by its arguments
};

/**
 * @brief Layer defaults, settings file, environment and flags
 *
 * @throws SettingsError for a bad settings file, a bad STACKYAML_COLUMN,
 *         or a negative --column
 */
EditorSettings resolve_settings(const CliOptions& options);

/**
 * @brief Run one command
 *
 * Results go to out; diagnostics and verbose progress go to err.
 *
 * @return Process exit code: 0 on success, 1 on any error
 */
int run_cli(const CliOptions& options, std::ostream& out, std::ostream& err);

} // namespace stackyaml

#endif // STACKYAML_CLI_HPP
