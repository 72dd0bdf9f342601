//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_DEPENDENCY_GRAPH_HPP
#define JANITOR_DEPENDENCY_GRAPH_HPP

/**
 * @file dependency_graph.hpp
 * @brief Directed "imports" graph over modules.
 *
 * Nodes live in an arena and are addressed by integer ModuleId handles.
 * Each node keeps a forward adjacency list (what it imports) and a reverse
 * list (its dependents). Every mutation updates both lists together, so
 * an edge A->B exists iff B is in successors(A) and A is in dependents(B).
 *
 * Removed modules leave a tombstone slot behind; their ids are never
 * reused, which keeps handles held by a previous snapshot meaningful.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace janitor::graph {

    using ModuleId = std::uint32_t;

    class DependencyGraph {
    public:
        /**
         * Returns the id of @p name, creating the node if needed.
         */
        ModuleId add_module(std::string_view name);

        /**
         * Adds from -> to. Both nodes are created if missing.
         *
         * @return false if the edge was already present.
         */
        bool add_edge(std::string_view from, std::string_view to);
        bool add_edge(ModuleId from, ModuleId to);

        /**
         * Drops every outgoing edge of @p name, keeping the node and its
         * dependents. Used before re-registering a changed file's imports.
         */
        void clear_dependencies(std::string_view name);

        /**
         * Removes the node and every edge touching it.
         */
        bool remove_module(std::string_view name);

        [[nodiscard]] std::optional<ModuleId> find(std::string_view name) const;
        [[nodiscard]] bool contains(std::string_view name) const { return find(name).has_value(); }
        [[nodiscard]] bool is_live(ModuleId id) const noexcept;
        [[nodiscard]] const std::string& name(ModuleId id) const;

        [[nodiscard]] bool has_edge(std::string_view from, std::string_view to) const;

        [[nodiscard]] const std::vector<ModuleId>& successors(ModuleId id) const;
        [[nodiscard]] const std::vector<ModuleId>& dependents(ModuleId id) const;

        /// Names of the modules @p name imports, sorted.
        [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view name) const;
        /// Names of the modules importing @p name, sorted.
        [[nodiscard]] std::vector<std::string> dependents_of(std::string_view name) const;

        [[nodiscard]] std::vector<ModuleId> modules() const;
        [[nodiscard]] std::vector<std::string> module_names() const;

        [[nodiscard]] std::size_t module_count() const noexcept { return live_count_; }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }
        [[nodiscard]] std::size_t capacity() const noexcept { return nodes_.size(); }

        /**
         * Verifies the forward/reverse pairing and the edge counter.
         */
        [[nodiscard]] bool is_consistent() const;

    private:
        struct Node {
            std::string name;
            std::vector<ModuleId> successors;
            std::vector<ModuleId> dependents;
            bool live = true;
        };

        static void erase_id(std::vector<ModuleId>& ids, ModuleId id);
        [[nodiscard]] std::vector<std::string> sorted_names(const std::vector<ModuleId>& ids) const;

        std::vector<Node> nodes_;
        std::unordered_map<std::string, ModuleId> index_;
        std::size_t live_count_ = 0;
        std::size_t edge_count_ = 0;
    };

}  // namespace janitor::graph

#endif //JANITOR_DEPENDENCY_GRAPH_HPP
