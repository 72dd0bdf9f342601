//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CHANGE_SCOPE_RESOLVER_HPP
#define JANITOR_CHANGE_SCOPE_RESOLVER_HPP

/**
 * @file change_scope_resolver.hpp
 * @brief Computes which modules need re-analysis after a set of edits.
 */

#include "janitor/error.hpp"
#include "janitor/graph/dependency_graph.hpp"
#include "janitor/result.hpp"
#include "janitor/scope/module_index.hpp"

#include <map>
#include <string>
#include <vector>

namespace janitor::scope {

    struct AffectedSet {
        /// Modules owning at least one changed file, sorted.
        std::vector<std::string> directly_affected;
        /// Modules reached through dependent edges, in discovery order.
        std::vector<std::string> indirectly_affected;
        /// directly_affected followed by indirectly_affected.
        std::vector<std::string> all_affected;
        /// Discovery path of every affected module, starting at a directly
        /// affected module and ending at the module itself.
        std::map<std::string, std::vector<std::string>> chains;
        /// Changed files no module owns.
        std::vector<std::string> unowned_files;

        [[nodiscard]] bool contains(const std::string& module) const { return chains.contains(module); }
    };

    /**
     * Maps every changed file to its owning module and walks the
     * dependents of those modules breadth first.
     *
     * @param changed_files Workspace-relative paths.
     * @param module_graph  Graph whose nodes are module names (see
     *                      ModuleIndex::lift).
     * @param modules       Module boundaries.
     * @return The affected set, or ScopeResolutionError when no module
     *         structure has been established.
     */
    Result<AffectedSet, Error> resolve_affected(
        const std::vector<std::string>& changed_files,
        const graph::DependencyGraph& module_graph,
        const ModuleIndex& modules
    );

}  // namespace janitor::scope

#endif //JANITOR_CHANGE_SCOPE_RESOLVER_HPP
