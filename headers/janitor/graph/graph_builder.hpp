//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_GRAPH_BUILDER_HPP
#define JANITOR_GRAPH_BUILDER_HPP

/**
 * @file graph_builder.hpp
 * @brief Builds the file-level dependency graph from import declarations.
 */

#include "janitor/error.hpp"
#include "janitor/graph/cycle_detection.hpp"
#include "janitor/graph/dependency_graph.hpp"
#include "janitor/syntax/symbol_provider.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace janitor::graph {

    struct GraphBuildResult {
        DependencyGraph graph;
        std::vector<Cycle> cycles;
        /// Parsed trees by path, for files that parsed.
        std::map<std::string, std::shared_ptr<const syntax::SyntaxTree>> trees;
        /// Files whose parse failed; they stay in the graph as isolated nodes.
        std::map<std::string, Error> failures;
    };

    class GraphBuilder {
    public:
        explicit GraphBuilder(const syntax::ISymbolProvider& provider);

        /**
         * Parses every file and registers one node per file plus an edge for
         * each import or re-export that resolves to a workspace file.
         */
        [[nodiscard]] GraphBuildResult build(const std::vector<std::string>& files) const;

        /**
         * Same as build() for trees that are already parsed.
         */
        [[nodiscard]] DependencyGraph build_from_trees(
            const std::vector<std::shared_ptr<const syntax::SyntaxTree>>& trees
        ) const;

        /**
         * Replaces the outgoing edges of @p tree's file in @p graph.
         */
        void register_file(DependencyGraph& graph, const syntax::SyntaxTree& tree) const;

        /**
         * Workspace files @p tree depends on, in declaration order, without
         * duplicates.
         */
        [[nodiscard]] std::vector<std::string> resolve_dependencies(const syntax::SyntaxTree& tree) const;

    private:
        const syntax::ISymbolProvider& provider_;
    };

}  // namespace janitor::graph

#endif //JANITOR_GRAPH_BUILDER_HPP
