//
// Created by gregorian-rayne on 02/03/26.
//

#include "app.hpp"
#include "formatter.hpp"
#include "janitor/logging.hpp"
#include "janitor/syntax/json_symbol_provider.hpp"

#include <iostream>

namespace janitor::cli {

    App::App(Options options)
        : options_(std::move(options)) {}

    int App::run() {
        if (options_.error) {
            std::cerr << "Error: " << *options_.error << "\n";
            CliParser::print_command_help(options_.command);
            return 2;
        }

        if (options_.verbose) {
            log::set_level(spdlog::level::debug);
        } else if (options_.quiet) {
            log::set_level(spdlog::level::warn);
        }
        if (options_.no_color) {
            colors::set_enabled(false);
        }

        if (auto prepared = prepare(); prepared.is_err()) {
            std::cerr << "Error: " << prepared.error().to_string() << "\n";
            return 1;
        }

        switch (options_.command) {
            case Command::ANALYZE:
                return run_analyze();
            case Command::INCREMENTAL:
                return run_incremental();
            default:
                CliParser::print_help();
                return 1;
        }
    }

    Result<AnalyzerConfig, Error> App::load_config() const {
        if (!options_.config_path) {
            return Result<AnalyzerConfig, Error>::success(AnalyzerConfig{});
        }
        return AnalyzerConfig::load_from_file(*options_.config_path);
    }

    Certainty App::min_certainty() const {
        if (!options_.min_certainty) {
            return Certainty::Low;
        }
        if (const auto parsed = certainty_from_string(*options_.min_certainty)) {
            return *parsed;
        }
        log::logger()->warn("Unknown certainty '{}', showing every finding", *options_.min_certainty);
        return Certainty::Low;
    }

    Result<void, Error> App::prepare() {
        auto config = load_config();
        if (config.is_err()) {
            return Result<void, Error>::failure(config.error());
        }
        if (options_.workers) {
            config.value().engine.workers = *options_.workers;
        }

        auto provider = std::make_shared<syntax::JsonSymbolProvider>(options_.ast_dir, options_.root);
        orchestrator_ = std::make_unique<workspace::WorkspaceOrchestrator>(provider, std::move(config).value());

        auto scanned = orchestrator_->scan(options_.root);
        if (scanned.is_err()) {
            return Result<void, Error>::failure(scanned.error());
        }
        if (scanned.value().empty()) {
            log::logger()->warn("No source files found under {}", options_.root);
        }
        return Result<void, Error>::success();
    }

    int App::run_analyze() {
        auto result = orchestrator_->analyze_workspace();
        if (result.is_err()) {
            std::cerr << "Analysis failed: " << result.error().to_string() << "\n";
            return 1;
        }

        print_file_results(std::cout, result.value().file_results, min_certainty());
        print_summary(std::cout, result.value().summary);
        return result.value().summary.failed_files > 0 ? 1 : 0;
    }

    int App::run_incremental() {
        orchestrator_->detect_module_structure();

        const ChangeSet changes{
            .files = options_.changed_files,
            .change_id = "cli",
            .timestamp = Clock::now(),
        };
        auto result = orchestrator_->analyze_incremental(changes);
        if (result.is_err()) {
            std::cerr << "Incremental analysis failed: " << result.error().to_string() << "\n";
            return 1;
        }

        print_affected(std::cout, result.value().affected);
        std::cout << "\n";
        print_file_results(std::cout, result.value().file_results, min_certainty());
        print_summary(std::cout, result.value().summary);
        return result.value().summary.failed_files > 0 ? 1 : 0;
    }

}  // namespace janitor::cli
