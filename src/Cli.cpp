/**
 * @file Cli.cpp
 * @brief Implementation of the stackyaml-cli commands
 */

#include "stackyaml/Cli.hpp"
#include "stackyaml/Document.hpp"
#include "stackyaml/Errors.hpp"

namespace stackyaml {

EditorSettings resolve_settings(const CliOptions& options) {
    // defaults -> settings file -> environment -> flags
    EditorSettings settings = load_settings(options.settings_file);
    apply_env_overrides(settings);

    if (options.key_path) settings.key_path = *options.key_path;
    if (options.column) {
        if (*options.column < 0) {
            throw SettingsError("--column", "must not be negative, got " +
                                            std::to_string(*options.column));
        }
        settings.column = *options.column;
    }
    return settings;
}

int run_cli(const CliOptions& options, std::ostream& out, std::ostream& err) {
    try {
        if (options.command.empty()) {
            err << "Error: no command given\n";
            return 1;
        }
        if (options.file.empty()) {
            err << "Error: --file must be provided\n";
            return 1;
        }

        const EditorSettings settings = resolve_settings(options);
        const std::vector<std::string>& cmdv = options.command;
        const std::string& cmd = cmdv[0];
        const std::string& path = options.file;

        auto expect_args = [&](size_t want) {
            if (cmdv.size() != want) {
                err << "Error: wrong number of arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        Document doc = Document::parse(read_file_bytes(path));
        if (options.verbose) {
            if (doc.is_empty()) {
                err << "No file at " << path << "\n";
            } else {
                err << "Parsed " << path << " (" << doc.document_count() << " document(s))\n";
            }
        }

        // Writes the result back, or prints it with --stdout
        auto emit = [&]() {
            if (options.to_stdout) {
                out << doc.serialize();
                return;
            }
            if (doc.is_empty()) {
                err << "Nothing to do: " << path << " does not exist\n";
                return;
            }
            write_file_bytes(path, doc.serialize());
            if (options.verbose) err << "Wrote " << path << "\n";
        };

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return 1;
            const std::string& key = cmdv[1];
            auto value = doc.get_config(settings.key_path, key);
            if (!value) {
                err << "Key not found: " << key << "\n";
                return 1;
            }
            out << to_json(*value).dump(settings.json_indent) << "\n";
            return 0;
        }

        // SET
        if (cmd == "set") {
            if (!expect_args(3)) return 1;
            const std::string& key = cmdv[1];
            const ConfigValue value(cmdv[2], options.secure);
            doc.set_config(settings.key_path, key, value, settings.column);
            if (options.verbose) {
                err << "Set " << key << " = " << to_json(value).dump() << "\n";
            }
            emit();
            return 0;
        }

        // RM
        if (cmd == "rm") {
            if (!expect_args(2)) return 1;
            const std::string& key = cmdv[1];
            doc.delete_config(settings.key_path, key);
            if (options.verbose) err << "Removed " << key << "\n";
            emit();
            return 0;
        }

        // LIST
        if (cmd == "list") {
            if (!expect_args(1)) return 1;
            Json data = doc.to_json(settings.key_path);
            if (data.is_null()) data = Json::object();
            out << data.dump(settings.json_indent) << "\n";
            return 0;
        }

        // FMT: re-emit unchanged; fails on malformed input
        if (cmd == "fmt") {
            if (!expect_args(1)) return 1;
            emit();
            return 0;
        }

        err << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace stackyaml
