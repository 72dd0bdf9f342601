//
// Created by gregorian-rayne on 02/03/26.
//

#include "cli_parser.hpp"
#include "app.hpp"
#include <iostream>
#include <exception>

int main(const int argc, char** argv) {
    try {
        const janitor::cli::Options options = janitor::cli::CliParser::parse(argc, argv);

        if (options.command == janitor::cli::Command::HELP) {
            if (!options.help_shown) {
                janitor::cli::CliParser::print_help();
            }
            return 0;
        }

        if (options.command == janitor::cli::Command::VERSION) {
            janitor::cli::CliParser::print_version();
            return 0;
        }

        janitor::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
