//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CYCLE_DETECTION_HPP
#define JANITOR_CYCLE_DETECTION_HPP

/**
 * @file cycle_detection.hpp
 * @brief Strongly connected components and canonical cycle reporting.
 */

#include "janitor/graph/dependency_graph.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace janitor::graph {

    /**
     * A closed walk through the graph.
     *
     * @ref nodes lists the walk without repeating the start at the end, and
     * always starts at the lexicographically smallest module, so the same
     * cycle found from different starting points compares equal.
     */
    struct Cycle {
        std::vector<std::string> nodes;
        bool is_direct = false;

        /// Distinct members, sorted.
        [[nodiscard]] std::vector<std::string> node_set() const;
        [[nodiscard]] bool contains(std::string_view module) const;

        /// "a.ts → b.ts → a.ts"
        [[nodiscard]] std::string format() const;

        bool operator==(const Cycle&) const = default;
    };

    /**
     * Tarjan's algorithm, iterative so deep import chains cannot overflow
     * the stack. Components come out in reverse topological order.
     */
    [[nodiscard]] std::vector<std::vector<ModuleId>> strongly_connected_components(const DependencyGraph& graph);

    /**
     * Reports every SCC with more than one member as a closed walk covering
     * all of its members, plus every mutual pair A->B->A, plus self-imports
     * as single-node cycles. No two returned cycles share a node set.
     */
    [[nodiscard]] std::vector<Cycle> find_cycles(const DependencyGraph& graph);

    /**
     * True when consecutive nodes of @p cycle, including last -> first, are
     * edges of @p graph.
     */
    [[nodiscard]] bool is_closed_walk(const DependencyGraph& graph, const Cycle& cycle);

}  // namespace janitor::graph

#endif //JANITOR_CYCLE_DETECTION_HPP
