#include <cxxopts.hpp>
#include <iostream>
#include "stackyaml/Cli.hpp"

using namespace stackyaml;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("stackyaml-cli", "Edit stack settings files in place, keeping comments and layout");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "Stack settings file to edit", cxxopts::value<std::string>())
            ("p,path", "Dot-path of the mapping holding config keys", cxxopts::value<std::string>())
            ("column", "Base column for newly created keys", cxxopts::value<int>())
            ("settings", "Editor settings TOML file", cxxopts::value<std::string>()->default_value(DEFAULT_SETTINGS_FILE))
            ("secure", "Store the value under a nested `secure` key (set)")
            ("stdout", "Print the edited document instead of writing the file")
            ("v,verbose", "Report each step on stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get KEY | set KEY VALUE [--secure] | rm KEY | list | fmt\n";
            return 0;
        }

        CliOptions cli;
        if (result.count("file")) cli.file = result["file"].as<std::string>();
        cli.settings_file = result["settings"].as<std::string>();
        if (result.count("path")) cli.key_path = result["path"].as<std::string>();
        if (result.count("column")) cli.column = result["column"].as<int>();
        cli.secure = result.count("secure") > 0;
        cli.to_stdout = result.count("stdout") > 0;
        cli.verbose = result.count("verbose") > 0;
        cli.command = result["command"].as<std::vector<std::string>>();

        return run_cli(cli, std::cout, std::cerr);

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
