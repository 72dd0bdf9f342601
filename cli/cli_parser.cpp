//
// Created by gregorian-rayne on 02/03/26.
//

#include "cli_parser.hpp"
#include "janitor/version.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace janitor::cli {

    Command CliParser::parse_command(const std::string& cmd) {
        if (cmd == "analyze") return Command::ANALYZE;
        if (cmd == "incremental" || cmd == "inc") return Command::INCREMENTAL;
        if (cmd == "help" || cmd == "--help" || cmd == "-h") return Command::HELP;
        if (cmd == "version" || cmd == "--version" || cmd == "-v") return Command::VERSION;
        return Command::UNKNOWN;
    }

    std::vector<std::string> CliParser::split_list(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    Options CliParser::parse(const int argc, char** argv) {
        if (argc < 2) {
            return Options{.command = Command::HELP};
        }

        const std::string cmd_str = argv[1];
        const Command cmd = parse_command(cmd_str);

        if (cmd == Command::HELP || cmd == Command::VERSION) {
            return Options{.command = cmd};
        }

        if (cmd == Command::UNKNOWN) {
            std::cerr << "Unknown command: " << cmd_str << "\n";
            return Options{.command = Command::HELP};
        }

        // Check for command-specific help
        if (argc >= 3 && (std::string(argv[2]) == "--help" || std::string(argv[2]) == "-h")) {
            print_command_help(cmd);
            Options opts;
            opts.command = Command::HELP;
            opts.help_shown = true;
            return opts;
        }

        int index = 2;
        return parse_run_options(cmd, argc, argv, index);
    }

    Options CliParser::parse_run_options(const Command cmd, const int argc, char** argv, int& index) {
        Options opts;
        opts.command = cmd;
        bool root_seen = false;

        auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (index < argc) {
                return std::string(argv[index++]);
            }
            opts.error = "Missing value for " + flag;
            return std::nullopt;
        };

        while (index < argc && !opts.error) {
            if (std::string arg = argv[index++]; arg == "--ast-dir" || arg == "-a") {
                if (auto value = next_value(arg)) opts.ast_dir = *value;
            } else if (arg == "--config" || arg == "-c") {
                if (auto value = next_value(arg)) opts.config_path = *value;
            } else if (arg == "--workers" || arg == "-j") {
                if (auto value = next_value(arg)) {
                    try {
                        const int workers = std::stoi(*value);
                        if (workers < 0) {
                            opts.error = "--workers must not be negative";
                        } else {
                            opts.workers = static_cast<unsigned int>(workers);
                        }
                    } catch (const std::exception&) {
                        opts.error = "Invalid worker count: " + *value;
                    }
                }
            } else if (arg == "--changed") {
                if (auto value = next_value(arg)) {
                    for (auto& file : split_list(*value)) {
                        opts.changed_files.push_back(std::move(file));
                    }
                }
            } else if (arg == "--min-certainty") {
                if (auto value = next_value(arg)) opts.min_certainty = *value;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (arg == "--quiet" || arg == "-q") {
                opts.quiet = true;
            } else if (arg == "--no-color") {
                opts.no_color = true;
            } else if (!arg.empty() && arg[0] != '-' && !root_seen) {
                opts.root = arg;
                root_seen = true;
            } else {
                opts.error = "Unexpected argument: " + arg;
            }
        }

        if (!opts.error && opts.ast_dir.empty()) {
            opts.error = "--ast-dir is required";
        }
        if (!opts.error && cmd == Command::INCREMENTAL && opts.changed_files.empty()) {
            opts.error = "--changed is required for incremental analysis";
        }
        if (!opts.error && opts.verbose && opts.quiet) {
            opts.error = "--verbose and --quiet are mutually exclusive";
        }
        return opts;
    }

    void CliParser::print_help() {
        std::cout << R"(janitor - dead code and structure analysis for JavaScript/TypeScript workspaces

USAGE:
    janitor <command> [options]

COMMANDS:
    analyze        Analyze every source file of a workspace
    incremental    Re-analyze only the modules affected by a set of changed files
    help           Show this help
    version        Show version information

Run 'janitor <command> --help' for command options.
)";
    }

    void CliParser::print_version() {
        std::cout << janitor::PROJECT_NAME << " " << janitor::VERSION_STRING << "\n";
    }

    void CliParser::print_command_help(const Command cmd) {
        switch (cmd) {
            case Command::ANALYZE:
                std::cout << R"(janitor analyze - Analyze a whole workspace

USAGE:
    janitor analyze [root] --ast-dir <dir> [OPTIONS]

OPTIONS:
    [root]                    Workspace root (default: current directory)
    -a, --ast-dir <dir>       Directory holding <file>.json syntax exports
    -c, --config <file>       TOML configuration file
    -j, --workers <n>         Worker threads (0 = one per core)
    --min-certainty <level>   Only print findings at or above high|medium|low
    --no-color                Disable colored output
    --verbose                 Debug logging
    -q, --quiet               Only log warnings and errors

EXAMPLES:
    janitor analyze src --ast-dir build/ast
    janitor analyze . --ast-dir build/ast --config janitor.toml --min-certainty high
)";
                break;

            case Command::INCREMENTAL:
                std::cout << R"(janitor incremental - Analyze the modules affected by a change

USAGE:
    janitor incremental [root] --ast-dir <dir> --changed <f1,f2,...> [OPTIONS]

OPTIONS:
    [root]                    Workspace root (default: current directory)
    -a, --ast-dir <dir>       Directory holding <file>.json syntax exports
    --changed <files>         Comma separated workspace-relative paths
    -c, --config <file>       TOML configuration file
    -j, --workers <n>         Worker threads (0 = one per core)
    --min-certainty <level>   Only print findings at or above high|medium|low
    --no-color                Disable colored output
    --verbose                 Debug logging
    -q, --quiet               Only log warnings and errors

DESCRIPTION:
    Module boundaries come from the [[modules]] tables of the configuration;
    without them every file is its own module.
)";
                break;

            default:
                print_help();
                break;
        }
    }

}  // namespace janitor::cli
