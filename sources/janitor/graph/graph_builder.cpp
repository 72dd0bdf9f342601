//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/graph/graph_builder.hpp"
#include "janitor/logging.hpp"
#include "janitor/utils/path_utils.hpp"

#include <algorithm>
#include <ranges>

namespace janitor::graph {

    GraphBuilder::GraphBuilder(const syntax::ISymbolProvider& provider)
        : provider_(provider) {}

    std::vector<std::string> GraphBuilder::resolve_dependencies(const syntax::SyntaxTree& tree) const {
        std::vector<std::string> targets;

        auto add = [&](const std::string& specifier) {
            auto target = provider_.resolve_module(tree.path, specifier);
            if (!target) {
                if (path_utils::is_relative_specifier(specifier)) {
                    log::logger()->debug("[graph] unresolved import '{}' in {}", specifier, tree.path);
                }
                return;
            }
            if (std::ranges::find(targets, *target) == targets.end()) {
                targets.push_back(std::move(*target));
            }
        };

        for (const auto& import : tree.imports) {
            add(import.specifier);
        }
        for (const auto& reexport : tree.reexports) {
            add(reexport.specifier);
        }
        return targets;
    }

    void GraphBuilder::register_file(DependencyGraph& graph, const syntax::SyntaxTree& tree) const {
        graph.add_module(tree.path);
        graph.clear_dependencies(tree.path);
        for (const auto& target : resolve_dependencies(tree)) {
            graph.add_edge(tree.path, target);
        }
    }

    DependencyGraph GraphBuilder::build_from_trees(
        const std::vector<std::shared_ptr<const syntax::SyntaxTree>>& trees
    ) const {
        DependencyGraph graph;
        for (const auto& tree : trees) {
            graph.add_module(tree->path);
        }
        for (const auto& tree : trees) {
            register_file(graph, *tree);
        }
        return graph;
    }

    GraphBuildResult GraphBuilder::build(const std::vector<std::string>& files) const {
        GraphBuildResult result;
        std::vector<std::shared_ptr<const syntax::SyntaxTree>> parsed;
        parsed.reserve(files.size());

        for (const auto& file : files) {
            auto tree = provider_.parse(file);
            if (tree.is_err()) {
                log::logger()->debug("[graph] {} left without edges: {}", file, tree.error().to_string());
                result.failures.emplace(file, tree.error());
                continue;
            }
            auto shared = std::make_shared<const syntax::SyntaxTree>(std::move(tree).value());
            result.trees.emplace(file, shared);
            parsed.push_back(std::move(shared));
        }

        result.graph = build_from_trees(parsed);
        for (const auto& file : result.failures | std::views::keys) {
            result.graph.add_module(file);
        }
        result.cycles = find_cycles(result.graph);

        log::logger()->debug("[graph] {} modules, {} edges, {} cycles",
                             result.graph.module_count(), result.graph.edge_count(), result.cycles.size());
        return result;
    }

}  // namespace janitor::graph
