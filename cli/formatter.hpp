//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_FORMATTER_HPP
#define JANITOR_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal rendering of findings and run summaries.
 */

#include "janitor/scope/change_scope_resolver.hpp"
#include "janitor/types.hpp"

#include <ostream>
#include <string>

namespace janitor::cli {

    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    bool is_tty();

    [[nodiscard]] std::string colorize_certainty(Certainty certainty);

    /**
     * "src/a.ts:3:10  high  unused-import  Import 'x' from 'm' is never used [fixable]"
     */
    [[nodiscard]] std::string format_finding(const Finding& finding);

    [[nodiscard]] std::string format_duration(Duration d);

    void print_file_results(std::ostream& out, const std::vector<FileAnalysisResult>& results,
                            Certainty min_certainty);

    void print_summary(std::ostream& out, const AnalysisSummary& summary);

    void print_affected(std::ostream& out, const scope::AffectedSet& affected);

}  // namespace janitor::cli

#endif //JANITOR_FORMATTER_HPP
