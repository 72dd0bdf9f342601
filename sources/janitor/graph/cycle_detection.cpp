//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/graph/cycle_detection.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace janitor::graph {

    std::vector<std::string> Cycle::node_set() const {
        std::vector<std::string> members = nodes;
        std::ranges::sort(members);
        const auto [first, last] = std::ranges::unique(members);
        members.erase(first, last);
        return members;
    }

    bool Cycle::contains(const std::string_view module) const {
        return std::ranges::find(nodes, module) != nodes.end();
    }

    std::string Cycle::format() const {
        std::string text;
        for (const auto& node : nodes) {
            text += node;
            text += " → ";
        }
        if (!nodes.empty()) {
            text += nodes.front();
        }
        return text;
    }

    std::vector<std::vector<ModuleId>> strongly_connected_components(const DependencyGraph& graph) {
        constexpr auto unvisited = std::numeric_limits<std::size_t>::max();

        const std::size_t n = graph.capacity();
        std::vector<std::size_t> index(n, unvisited);
        std::vector<std::size_t> lowlink(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<ModuleId> stack;
        std::vector<std::vector<ModuleId>> components;
        std::size_t counter = 0;

        struct Frame {
            ModuleId node;
            std::size_t next_child;
        };

        for (const auto root : graph.modules()) {
            if (index[root] != unvisited) {
                continue;
            }

            std::vector<Frame> call_stack;
            call_stack.push_back({root, 0});
            index[root] = lowlink[root] = counter++;
            stack.push_back(root);
            on_stack[root] = true;

            while (!call_stack.empty()) {
                auto& frame = call_stack.back();
                const auto& children = graph.successors(frame.node);

                if (frame.next_child < children.size()) {
                    const auto child = children[frame.next_child++];
                    if (index[child] == unvisited) {
                        index[child] = lowlink[child] = counter++;
                        stack.push_back(child);
                        on_stack[child] = true;
                        call_stack.push_back({child, 0});
                    } else if (on_stack[child]) {
                        lowlink[frame.node] = std::min(lowlink[frame.node], index[child]);
                    }
                    continue;
                }

                const auto node = frame.node;
                call_stack.pop_back();
                if (!call_stack.empty()) {
                    const auto parent = call_stack.back().node;
                    lowlink[parent] = std::min(lowlink[parent], lowlink[node]);
                }

                if (lowlink[node] == index[node]) {
                    std::vector<ModuleId> component;
                    ModuleId member;
                    do {
                        member = stack.back();
                        stack.pop_back();
                        on_stack[member] = false;
                        component.push_back(member);
                    } while (member != node);
                    components.push_back(std::move(component));
                }
            }
        }

        return components;
    }

    namespace {

        /**
         * Shortest path from -> to using only nodes in @p allowed. Neighbours
         * are visited in name order so the walk is deterministic.
         */
        std::vector<ModuleId> shortest_path_within(const DependencyGraph& graph,
                                                   const ModuleId from,
                                                   const ModuleId to,
                                                   const std::unordered_set<ModuleId>& allowed) {
            std::unordered_map<ModuleId, ModuleId> parent;
            std::deque<ModuleId> queue{from};
            std::unordered_set<ModuleId> seen{from};

            while (!queue.empty()) {
                const auto current = queue.front();
                queue.pop_front();

                auto next = graph.successors(current);
                std::ranges::sort(next, [&graph](const ModuleId a, const ModuleId b) {
                    return graph.name(a) < graph.name(b);
                });

                for (const auto succ : next) {
                    if (!allowed.contains(succ)) {
                        continue;
                    }
                    if (succ == to) {
                        std::vector<ModuleId> path{to};
                        for (auto node = current; node != from; node = parent.at(node)) {
                            path.push_back(node);
                        }
                        path.push_back(from);
                        std::ranges::reverse(path);
                        return path;
                    }
                    if (seen.insert(succ).second) {
                        parent.emplace(succ, current);
                        queue.push_back(succ);
                    }
                }
            }
            return {};
        }

        Cycle walk_component(const DependencyGraph& graph, std::vector<ModuleId> members) {
            std::ranges::sort(members, [&graph](const ModuleId a, const ModuleId b) {
                return graph.name(a) < graph.name(b);
            });
            const std::unordered_set<ModuleId> allowed(members.begin(), members.end());

            const auto start = members.front();
            std::vector<ModuleId> walk{start};
            std::unordered_set<ModuleId> covered{start};
            auto current = start;

            for (const auto member : members) {
                if (covered.contains(member)) {
                    continue;
                }
                const auto path = shortest_path_within(graph, current, member, allowed);
                for (std::size_t i = 1; i < path.size(); ++i) {
                    walk.push_back(path[i]);
                    covered.insert(path[i]);
                }
                current = member;
            }

            const auto back = shortest_path_within(graph, current, start, allowed);
            for (std::size_t i = 1; i + 1 < back.size(); ++i) {
                walk.push_back(back[i]);
            }

            Cycle cycle;
            cycle.nodes.reserve(walk.size());
            for (const auto id : walk) {
                cycle.nodes.push_back(graph.name(id));
            }
            cycle.is_direct = cycle.nodes.size() == 2;
            return cycle;
        }

    }  // namespace

    std::vector<Cycle> find_cycles(const DependencyGraph& graph) {
        std::vector<Cycle> cycles;
        std::set<std::vector<std::string>> reported;

        auto report = [&](Cycle cycle) {
            if (reported.insert(cycle.node_set()).second) {
                cycles.push_back(std::move(cycle));
            }
        };

        for (auto& component : strongly_connected_components(graph)) {
            if (component.size() > 1) {
                report(walk_component(graph, std::move(component)));
                continue;
            }
            const auto only = component.front();
            if (std::ranges::find(graph.successors(only), only) != graph.successors(only).end()) {
                report(Cycle{.nodes = {graph.name(only)}, .is_direct = false});
            }
        }

        for (const auto id : graph.modules()) {
            const auto& name = graph.name(id);
            for (const auto succ : graph.successors(id)) {
                const auto& other = graph.name(succ);
                if (succ != id && name < other && graph.has_edge(other, name)) {
                    report(Cycle{.nodes = {name, other}, .is_direct = true});
                }
            }
        }

        std::ranges::sort(cycles, [](const Cycle& a, const Cycle& b) { return a.nodes < b.nodes; });
        return cycles;
    }

    bool is_closed_walk(const DependencyGraph& graph, const Cycle& cycle) {
        if (cycle.nodes.empty()) {
            return false;
        }
        for (std::size_t i = 0; i < cycle.nodes.size(); ++i) {
            const auto& from = cycle.nodes[i];
            const auto& to = cycle.nodes[(i + 1) % cycle.nodes.size()];
            if (!graph.has_edge(from, to)) {
                return false;
            }
        }
        return true;
    }

}  // namespace janitor::graph
