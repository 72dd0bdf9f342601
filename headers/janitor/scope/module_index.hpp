//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_MODULE_INDEX_HPP
#define JANITOR_MODULE_INDEX_HPP

/**
 * @file module_index.hpp
 * @brief Maps source files onto module (package) boundaries.
 *
 * A module is a named path prefix. A file belongs to the module with the
 * longest prefix containing it, matched on whole path components, so
 * "packages/core-utils/x.ts" never lands in a "packages/core" module.
 */

#include "janitor/config.hpp"
#include "janitor/graph/dependency_graph.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace janitor::scope {

    class ModuleIndex {
    public:
        ModuleIndex() = default;
        explicit ModuleIndex(std::vector<ModuleDefinition> modules);

        /**
         * One module per file, named after the file itself. Used when the
         * workspace declares no module boundaries.
         */
        static ModuleIndex per_file(const std::vector<std::string>& files);

        /**
         * Adds or replaces the module called @p module.name.
         */
        void add(ModuleDefinition module);

        [[nodiscard]] std::optional<std::string> owning_module(std::string_view file) const;

        [[nodiscard]] bool empty() const noexcept { return modules_.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return modules_.size(); }
        [[nodiscard]] const std::vector<ModuleDefinition>& modules() const noexcept { return modules_; }
        [[nodiscard]] const ModuleDefinition* find(std::string_view name) const;

        /**
         * Collapses a file-level graph onto modules: an edge between two
         * files in different modules becomes an edge between the modules.
         * Declared module dependencies are added as edges too. Files
         * outside every module are dropped.
         */
        [[nodiscard]] graph::DependencyGraph lift(const graph::DependencyGraph& file_graph) const;

    private:
        std::vector<ModuleDefinition> modules_;
    };

}  // namespace janitor::scope

#endif //JANITOR_MODULE_INDEX_HPP
