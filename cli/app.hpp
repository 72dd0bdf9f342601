//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_APP_HPP
#define JANITOR_APP_HPP

#include "cli_parser.hpp"
#include "janitor/config.hpp"
#include "janitor/result.hpp"
#include "janitor/workspace/orchestrator.hpp"

#include <memory>

namespace janitor::cli {

    class App {
    public:
        explicit App(Options options);
        ~App() = default;

        int run();

    private:
        int run_analyze();
        int run_incremental();

        Result<AnalyzerConfig, Error> load_config() const;
        Result<void, Error> prepare();
        [[nodiscard]] Certainty min_certainty() const;

        Options options_;
        std::unique_ptr<workspace::WorkspaceOrchestrator> orchestrator_{};
    };

}  // namespace janitor::cli

#endif //JANITOR_APP_HPP
