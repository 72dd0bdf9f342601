//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/graph/dependency_graph.hpp"

#include <algorithm>
#include <stdexcept>

namespace janitor::graph {

    ModuleId DependencyGraph::add_module(const std::string_view name) {
        if (const auto it = index_.find(std::string(name)); it != index_.end()) {
            return it->second;
        }
        const auto id = static_cast<ModuleId>(nodes_.size());
        nodes_.push_back(Node{.name = std::string(name), .successors = {}, .dependents = {}, .live = true});
        index_.emplace(std::string(name), id);
        ++live_count_;
        return id;
    }

    bool DependencyGraph::add_edge(const std::string_view from, const std::string_view to) {
        const auto from_id = add_module(from);
        const auto to_id = add_module(to);
        return add_edge(from_id, to_id);
    }

    bool DependencyGraph::add_edge(const ModuleId from, const ModuleId to) {
        if (!is_live(from) || !is_live(to)) {
            throw std::out_of_range("add_edge on a removed or unknown module");
        }
        auto& forward = nodes_[from].successors;
        if (std::ranges::find(forward, to) != forward.end()) {
            return false;
        }
        forward.push_back(to);
        nodes_[to].dependents.push_back(from);
        ++edge_count_;
        return true;
    }

    void DependencyGraph::erase_id(std::vector<ModuleId>& ids, const ModuleId id) {
        std::erase(ids, id);
    }

    void DependencyGraph::clear_dependencies(const std::string_view name) {
        const auto id = find(name);
        if (!id) {
            return;
        }
        auto& node = nodes_[*id];
        for (const auto target : node.successors) {
            erase_id(nodes_[target].dependents, *id);
            --edge_count_;
        }
        node.successors.clear();
    }

    bool DependencyGraph::remove_module(const std::string_view name) {
        const auto it = index_.find(std::string(name));
        if (it == index_.end()) {
            return false;
        }
        const auto id = it->second;
        auto& node = nodes_[id];

        for (const auto target : node.successors) {
            if (target != id) {
                erase_id(nodes_[target].dependents, id);
            }
            --edge_count_;
        }
        for (const auto source : node.dependents) {
            if (source != id) {
                erase_id(nodes_[source].successors, id);
                --edge_count_;
            }
        }

        node.successors.clear();
        node.dependents.clear();
        node.live = false;
        index_.erase(it);
        --live_count_;
        return true;
    }

    std::optional<ModuleId> DependencyGraph::find(const std::string_view name) const {
        if (const auto it = index_.find(std::string(name)); it != index_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool DependencyGraph::is_live(const ModuleId id) const noexcept {
        return id < nodes_.size() && nodes_[id].live;
    }

    const std::string& DependencyGraph::name(const ModuleId id) const {
        return nodes_.at(id).name;
    }

    bool DependencyGraph::has_edge(const std::string_view from, const std::string_view to) const {
        const auto from_id = find(from);
        const auto to_id = find(to);
        if (!from_id || !to_id) {
            return false;
        }
        const auto& forward = nodes_[*from_id].successors;
        return std::ranges::find(forward, *to_id) != forward.end();
    }

    const std::vector<ModuleId>& DependencyGraph::successors(const ModuleId id) const {
        return nodes_.at(id).successors;
    }

    const std::vector<ModuleId>& DependencyGraph::dependents(const ModuleId id) const {
        return nodes_.at(id).dependents;
    }

    std::vector<std::string> DependencyGraph::sorted_names(const std::vector<ModuleId>& ids) const {
        std::vector<std::string> names;
        names.reserve(ids.size());
        for (const auto id : ids) {
            names.push_back(nodes_[id].name);
        }
        std::ranges::sort(names);
        return names;
    }

    std::vector<std::string> DependencyGraph::dependencies_of(const std::string_view name) const {
        const auto id = find(name);
        return id ? sorted_names(nodes_[*id].successors) : std::vector<std::string>{};
    }

    std::vector<std::string> DependencyGraph::dependents_of(const std::string_view name) const {
        const auto id = find(name);
        return id ? sorted_names(nodes_[*id].dependents) : std::vector<std::string>{};
    }

    std::vector<ModuleId> DependencyGraph::modules() const {
        std::vector<ModuleId> ids;
        ids.reserve(live_count_);
        for (ModuleId id = 0; id < nodes_.size(); ++id) {
            if (nodes_[id].live) {
                ids.push_back(id);
            }
        }
        return ids;
    }

    std::vector<std::string> DependencyGraph::module_names() const {
        return sorted_names(modules());
    }

    bool DependencyGraph::is_consistent() const {
        std::size_t forward_edges = 0;
        std::size_t reverse_edges = 0;

        for (ModuleId id = 0; id < nodes_.size(); ++id) {
            const auto& node = nodes_[id];
            if (!node.live) {
                if (!node.successors.empty() || !node.dependents.empty()) {
                    return false;
                }
                continue;
            }
            for (const auto target : node.successors) {
                if (!is_live(target)) {
                    return false;
                }
                const auto& back = nodes_[target].dependents;
                if (std::ranges::count(back, id) != 1) {
                    return false;
                }
            }
            for (const auto source : node.dependents) {
                if (!is_live(source)) {
                    return false;
                }
                const auto& forward = nodes_[source].successors;
                if (std::ranges::count(forward, id) != 1) {
                    return false;
                }
            }
            forward_edges += node.successors.size();
            reverse_edges += node.dependents.size();
        }

        return forward_edges == reverse_edges && forward_edges == edge_count_;
    }

}  // namespace janitor::graph
