//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_ANALYSIS_CONTEXT_HPP
#define JANITOR_ANALYSIS_CONTEXT_HPP

/**
 * @file context.hpp
 * @brief Immutable snapshot handed to every detector call.
 *
 * A context is built between passes and never modified afterwards; the
 * orchestrator publishes a fresh one after each structural change. Worker
 * threads share it through shared_ptr<const AnalysisContext>, so a task
 * can never observe the graph changing under it.
 */

#include "janitor/analysis/reference_index.hpp"
#include "janitor/config.hpp"
#include "janitor/graph/cycle_detection.hpp"
#include "janitor/graph/dependency_graph.hpp"
#include "janitor/syntax/symbol_provider.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace janitor::analysis {

    class AnalysisContext {
    public:
        using TreeMap = std::map<std::string, std::shared_ptr<const syntax::SyntaxTree>>;

        struct Parts {
            AnalyzerConfig config;
            std::shared_ptr<const syntax::ISymbolProvider> provider;
            std::shared_ptr<const graph::DependencyGraph> graph;
            std::vector<graph::Cycle> cycles;
            /// Null restricts classification to file-only scope.
            std::shared_ptr<const ReferenceIndex> references;
            TreeMap trees;
            std::uint64_t generation = 0;
        };

        explicit AnalysisContext(Parts parts);

        /**
         * A context for analysing one file without workspace knowledge.
         */
        static std::shared_ptr<const AnalysisContext> file_only(
            AnalyzerConfig config,
            std::shared_ptr<const syntax::ISymbolProvider> provider
        );

        [[nodiscard]] const AnalyzerConfig& config() const noexcept { return parts_.config; }
        [[nodiscard]] const syntax::ISymbolProvider& provider() const noexcept { return *parts_.provider; }
        [[nodiscard]] const graph::DependencyGraph& graph() const noexcept { return *parts_.graph; }
        [[nodiscard]] const std::vector<graph::Cycle>& cycles() const noexcept { return parts_.cycles; }
        [[nodiscard]] const ReferenceIndex* references() const noexcept { return parts_.references.get(); }
        [[nodiscard]] std::uint64_t generation() const noexcept { return parts_.generation; }

        [[nodiscard]] bool workspace_scope() const noexcept { return parts_.references != nullptr; }

        /**
         * The tree parsed during the structure pass, or null when the file
         * was not part of it (or failed to parse there).
         */
        [[nodiscard]] std::shared_ptr<const syntax::SyntaxTree> tree(const std::string& file) const;

        [[nodiscard]] std::vector<const graph::Cycle*> cycles_containing(std::string_view file) const;

        /**
         * The files whose content can change the findings of @p file: the
         * file, its direct dependents, the members of every cycle it is
         * part of, and in workspace scope every file that mentions one of
         * its exported names, classes or methods.
         */
        [[nodiscard]] std::vector<std::string> covering_files(const std::string& file) const;

    private:
        Parts parts_;
    };

}  // namespace janitor::analysis

#endif //JANITOR_ANALYSIS_CONTEXT_HPP
