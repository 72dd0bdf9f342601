//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CONFIG_HPP
#define JANITOR_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analyzer configuration loaded from TOML.
 *
 * Example `janitor.toml`:
 * @code
 *     [detectors]
 *     unused_imports = true
 *     dead_exports = false
 *
 *     [analysis]
 *     ignore_patterns = ["vendor/**", "generated/**"]
 *     respect_underscore_convention = true
 *
 *     [complexity]
 *     cyclomatic = 10
 *
 *     [engine]
 *     workers = 4
 *     task_timeout_ms = 0
 *
 *     [[modules]]
 *     name = "core"
 *     path = "packages/core"
 *     dependencies = []
 * @endcode
 */

#include "janitor/error.hpp"
#include "janitor/result.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace janitor {

    struct DetectorToggles {
        bool unused_imports = true;
        bool unused_variables = true;
        bool dead_functions = true;
        bool dead_exports = true;
        bool circular_dependencies = true;
        bool complexity = true;
    };

    struct ComplexityThresholds {
        int cyclomatic = 10;
        int cognitive = 15;
        int nesting_depth = 4;
    };

    struct EngineOptions {
        /// 0 selects the hardware concurrency.
        unsigned int workers = 0;
        /// 0 disables the per-task deadline.
        std::chrono::milliseconds task_timeout{0};
        std::chrono::milliseconds error_cooldown{1000};
        std::chrono::milliseconds cache_ttl{std::chrono::hours(24)};
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    /**
     * A package or module boundary. Files under @ref path belong to it.
     */
    struct ModuleDefinition {
        std::string name;
        std::string path;
        std::vector<std::string> dependencies;

        bool operator==(const ModuleDefinition&) const = default;
    };

    struct AnalyzerConfig {
        DetectorToggles detectors;
        ComplexityThresholds complexity;
        EngineOptions engine;

        std::vector<std::string> ignore_patterns = {"**/node_modules/**", "**/*.d.ts"};
        std::vector<std::string> source_extensions = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"};
        bool respect_underscore_convention = true;

        std::vector<ModuleDefinition> modules;

        static Result<AnalyzerConfig, Error> load_from_file(const std::string& path);
        static Result<AnalyzerConfig, Error> load_from_string(std::string_view content);

        /**
         * Whether the detector registered under @p name should run.
         * Names this configuration does not know about are enabled.
         */
        [[nodiscard]] bool is_detector_enabled(std::string_view name) const noexcept;

        [[nodiscard]] bool is_ignored(std::string_view path) const;
        [[nodiscard]] bool is_source_file(std::string_view path) const;

        /**
         * SHA-256 over every option that changes findings. Engine options
         * (workers, timeouts) are excluded.
         */
        [[nodiscard]] std::string fingerprint() const;
    };

}  // namespace janitor

#endif //JANITOR_CONFIG_HPP
