//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/scope/change_scope_resolver.hpp"

#include <deque>
#include <set>

namespace janitor::scope {

    Result<AffectedSet, Error> resolve_affected(
        const std::vector<std::string>& changed_files,
        const graph::DependencyGraph& module_graph,
        const ModuleIndex& modules
    ) {
        if (modules.empty()) {
            return Result<AffectedSet, Error>::failure(
                Error::scope_error("module structure not detected",
                                   "run detect_module_structure() before incremental analysis"));
        }

        AffectedSet affected;
        std::set<std::string> direct;
        std::set<std::string> unowned;
        for (const auto& file : changed_files) {
            if (auto module = modules.owning_module(file)) {
                direct.insert(std::move(*module));
            } else {
                unowned.insert(file);
            }
        }
        affected.directly_affected.assign(direct.begin(), direct.end());
        affected.unowned_files.assign(unowned.begin(), unowned.end());

        std::set<std::string> visited(direct.begin(), direct.end());
        std::deque<std::string> queue;
        for (const auto& module : affected.directly_affected) {
            affected.chains[module] = {module};
            queue.push_back(module);
        }

        while (!queue.empty()) {
            const auto current = std::move(queue.front());
            queue.pop_front();

            for (auto& dependent : module_graph.dependents_of(current)) {
                if (!visited.insert(dependent).second) {
                    continue;
                }
                auto chain = affected.chains.at(current);
                chain.push_back(dependent);
                affected.chains[dependent] = std::move(chain);
                affected.indirectly_affected.push_back(dependent);
                queue.push_back(std::move(dependent));
            }
        }

        affected.all_affected = affected.directly_affected;
        affected.all_affected.insert(affected.all_affected.end(),
                                     affected.indirectly_affected.begin(),
                                     affected.indirectly_affected.end());
        return Result<AffectedSet, Error>::success(std::move(affected));
    }

}  // namespace janitor::scope
