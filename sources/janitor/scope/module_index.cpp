//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/scope/module_index.hpp"
#include "janitor/utils/path_utils.hpp"

#include <algorithm>

namespace janitor::scope {

    ModuleIndex::ModuleIndex(std::vector<ModuleDefinition> modules) {
        for (auto& module : modules) {
            add(std::move(module));
        }
    }

    ModuleIndex ModuleIndex::per_file(const std::vector<std::string>& files) {
        ModuleIndex index;
        for (const auto& file : files) {
            index.add(ModuleDefinition{.name = file, .path = file, .dependencies = {}});
        }
        return index;
    }

    void ModuleIndex::add(ModuleDefinition module) {
        module.path = path_utils::normalize(module.path);
        const auto it = std::ranges::find_if(modules_, [&module](const ModuleDefinition& existing) {
            return existing.name == module.name;
        });
        if (it != modules_.end()) {
            *it = std::move(module);
        } else {
            modules_.push_back(std::move(module));
        }
    }

    std::optional<std::string> ModuleIndex::owning_module(const std::string_view file) const {
        const auto normalized = path_utils::normalize(file);

        const ModuleDefinition* best = nullptr;
        for (const auto& module : modules_) {
            if (!path_utils::has_path_prefix(normalized, module.path)) {
                continue;
            }
            if (best == nullptr || module.path.size() > best->path.size()) {
                best = &module;
            }
        }
        if (best == nullptr) {
            return std::nullopt;
        }
        return best->name;
    }

    const ModuleDefinition* ModuleIndex::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(modules_, [name](const ModuleDefinition& module) {
            return module.name == name;
        });
        return it == modules_.end() ? nullptr : &*it;
    }

    graph::DependencyGraph ModuleIndex::lift(const graph::DependencyGraph& file_graph) const {
        graph::DependencyGraph modules;
        for (const auto& module : modules_) {
            modules.add_module(module.name);
        }
        for (const auto& module : modules_) {
            for (const auto& dependency : module.dependencies) {
                if (find(dependency) != nullptr && dependency != module.name) {
                    modules.add_edge(module.name, dependency);
                }
            }
        }

        for (const auto id : file_graph.modules()) {
            const auto from = owning_module(file_graph.name(id));
            if (!from) {
                continue;
            }
            for (const auto target : file_graph.successors(id)) {
                const auto to = owning_module(file_graph.name(target));
                // edges inside one module do not cross a boundary
                if (to && *to != *from) {
                    modules.add_edge(*from, *to);
                }
            }
        }
        return modules;
    }

}  // namespace janitor::scope
