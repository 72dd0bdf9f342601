//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CLI_PARSER_HPP
#define JANITOR_CLI_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

namespace janitor::cli {

    enum class Command {
        ANALYZE,
        INCREMENTAL,
        HELP,
        VERSION,
        UNKNOWN
    };

    struct Options {
        Command command = Command::UNKNOWN;

        std::string root = ".";
        std::string ast_dir;
        std::optional<std::string> config_path;
        std::optional<unsigned int> workers;
        std::vector<std::string> changed_files;
        std::optional<std::string> min_certainty;

        bool verbose = false;
        bool quiet = false;
        bool no_color = false;
        bool help_shown = false;

        /// Set when an argument could not be understood.
        std::optional<std::string> error;
    };

    class CliParser {
    public:
        static Options parse(int argc, char** argv);
        static void print_help();
        static void print_command_help(Command cmd);
        static void print_version();

    private:
        static Command parse_command(const std::string& cmd);
        static Options parse_run_options(Command cmd, int argc, char** argv, int& index);
        static std::vector<std::string> split_list(const std::string& value);
    };

}  // namespace janitor::cli

#endif //JANITOR_CLI_PARSER_HPP
