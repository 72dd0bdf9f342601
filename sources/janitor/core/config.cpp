//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/config.hpp"
#include "janitor/utils/file_utils.hpp"
#include "janitor/utils/hash_utils.hpp"
#include "janitor/utils/path_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace janitor {

    namespace {

        std::vector<std::string> string_array(const toml::node_view<toml::node> node) {
            std::vector<std::string> values;
            if (const auto* array = node.as_array()) {
                for (const auto& element : *array) {
                    values.emplace_back(element.value_or(std::string{}));
                }
            }
            return values;
        }

        std::chrono::milliseconds millis(const toml::node_view<toml::node> node,
                                         const std::chrono::milliseconds fallback) {
            return std::chrono::milliseconds(node.value_or(static_cast<std::int64_t>(fallback.count())));
        }

    }  // namespace

    Result<AnalyzerConfig, Error> AnalyzerConfig::load_from_file(const std::string& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<AnalyzerConfig, Error>::failure(
                Error::config_error("Configuration file not readable", path)
            );
        }
        return load_from_string(content.value());
    }

    Result<AnalyzerConfig, Error> AnalyzerConfig::load_from_string(const std::string_view content) {
        try {
            auto tbl = toml::parse(content);
            AnalyzerConfig config;

            if (auto* detectors_table = tbl["detectors"].as_table()) {
                auto& detectors = *detectors_table;
                auto& toggles = config.detectors;
                toggles.unused_imports = detectors["unused_imports"].value_or(toggles.unused_imports);
                toggles.unused_variables = detectors["unused_variables"].value_or(toggles.unused_variables);
                toggles.dead_functions = detectors["dead_functions"].value_or(toggles.dead_functions);
                toggles.dead_exports = detectors["dead_exports"].value_or(toggles.dead_exports);
                toggles.circular_dependencies =
                    detectors["circular_dependencies"].value_or(toggles.circular_dependencies);
                toggles.complexity = detectors["complexity"].value_or(toggles.complexity);
            }

            if (auto* analysis_table = tbl["analysis"].as_table()) {
                auto& analysis = *analysis_table;
                if (analysis["ignore_patterns"] && analysis["ignore_patterns"].is_array()) {
                    config.ignore_patterns = string_array(analysis["ignore_patterns"]);
                }
                if (analysis["source_extensions"] && analysis["source_extensions"].is_array()) {
                    config.source_extensions = string_array(analysis["source_extensions"]);
                }
                config.respect_underscore_convention =
                    analysis["respect_underscore_convention"].value_or(config.respect_underscore_convention);
            }

            if (auto* complexity_table = tbl["complexity"].as_table()) {
                auto& complexity = *complexity_table;
                config.complexity.cyclomatic = complexity["cyclomatic"].value_or(config.complexity.cyclomatic);
                config.complexity.cognitive = complexity["cognitive"].value_or(config.complexity.cognitive);
                config.complexity.nesting_depth =
                    complexity["nesting_depth"].value_or(config.complexity.nesting_depth);
            }

            if (auto* engine_table = tbl["engine"].as_table()) {
                auto& engine = *engine_table;
                const auto workers = engine["workers"].value_or(static_cast<std::int64_t>(config.engine.workers));
                if (workers < 0) {
                    return Result<AnalyzerConfig, Error>::failure(
                        Error::config_error("engine.workers must not be negative")
                    );
                }
                config.engine.workers = static_cast<unsigned int>(workers);
                config.engine.task_timeout = millis(engine["task_timeout_ms"], config.engine.task_timeout);
                config.engine.error_cooldown = millis(engine["error_cooldown_ms"], config.engine.error_cooldown);
                config.engine.shutdown_timeout =
                    millis(engine["shutdown_timeout_ms"], config.engine.shutdown_timeout);
                if (engine["cache_ttl_hours"]) {
                    config.engine.cache_ttl = std::chrono::hours(engine["cache_ttl_hours"].value_or(24));
                }
            }

            if (const auto* modules = tbl["modules"].as_array()) {
                for (const auto& node : *modules) {
                    const auto* table = node.as_table();
                    if (!table) {
                        return Result<AnalyzerConfig, Error>::failure(
                            Error::config_error("[[modules]] entries must be tables")
                        );
                    }
                    ModuleDefinition module;
                    module.name = (*table)["name"].value_or(std::string{});
                    module.path = (*table)["path"].value_or(std::string{});
                    if (module.name.empty()) {
                        return Result<AnalyzerConfig, Error>::failure(
                            Error::config_error("module entry without a name")
                        );
                    }
                    if (const auto* deps = (*table)["dependencies"].as_array()) {
                        for (const auto& dep : *deps) {
                            module.dependencies.emplace_back(dep.value_or(std::string{}));
                        }
                    }
                    config.modules.push_back(std::move(module));
                }
            }

            return Result<AnalyzerConfig, Error>::success(std::move(config));

        } catch (const toml::parse_error& e) {
            std::ostringstream where;
            where << "line " << e.source().begin.line << ", column " << e.source().begin.column;
            return Result<AnalyzerConfig, Error>::failure(
                Error::config_error(std::string("Failed to parse TOML: ") + std::string(e.description()),
                                    where.str())
            );
        }
    }

    bool AnalyzerConfig::is_detector_enabled(const std::string_view name) const noexcept {
        if (name == "unused-imports") return detectors.unused_imports;
        if (name == "unused-variables") return detectors.unused_variables;
        if (name == "dead-functions") return detectors.dead_functions;
        if (name == "dead-exports") return detectors.dead_exports;
        if (name == "circular-dependencies") return detectors.circular_dependencies;
        if (name == "complexity") return detectors.complexity;
        return true;
    }

    bool AnalyzerConfig::is_ignored(const std::string_view path) const {
        return std::ranges::any_of(ignore_patterns, [path](const std::string& pattern) {
            return path_utils::matches_glob(path, pattern);
        });
    }

    bool AnalyzerConfig::is_source_file(const std::string_view path) const {
        return std::ranges::any_of(source_extensions, [path](const std::string& ext) {
            return path.ends_with(ext);
        });
    }

    std::string AnalyzerConfig::fingerprint() const {
        std::ostringstream ss;
        ss << "detectors:" << detectors.unused_imports << detectors.unused_variables
           << detectors.dead_functions << detectors.dead_exports
           << detectors.circular_dependencies << detectors.complexity << ';';
        ss << "complexity:" << complexity.cyclomatic << ',' << complexity.cognitive
           << ',' << complexity.nesting_depth << ';';
        ss << "underscore:" << respect_underscore_convention << ';';
        ss << "ignore:";
        for (const auto& pattern : ignore_patterns) {
            ss << pattern << ',';
        }
        ss << ";ext:";
        for (const auto& ext : source_extensions) {
            ss << ext << ',';
        }
        ss << ";modules:";
        for (const auto& module : modules) {
            ss << module.name << '=' << module.path << '[';
            for (const auto& dep : module.dependencies) {
                ss << dep << ',';
            }
            ss << ']';
        }
        return hash_utils::sha256(ss.str());
    }

}  // namespace janitor
