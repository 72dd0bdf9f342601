//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/analysis/certainty_classifier.hpp"
#include "janitor/utils/path_utils.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace janitor::analysis {

    namespace {

        const std::vector<std::regex>& lifecycle_patterns() {
            static const std::vector<std::regex> patterns = {
                // React
                std::regex("^(componentDidMount|componentDidUpdate|componentWillUnmount|shouldComponentUpdate|"
                           "getDerivedStateFromProps|getSnapshotBeforeUpdate|componentDidCatch|render)$"),
                std::regex("^use[A-Z]"),
                // Angular
                std::regex("^(ngOnInit|ngOnDestroy|ngOnChanges|ngDoCheck|ngAfterContentInit|"
                           "ngAfterContentChecked|ngAfterViewInit|ngAfterViewChecked)$"),
                // Vue
                std::regex("^(beforeCreate|created|beforeMount|mounted|beforeUpdate|updated|beforeDestroy|"
                           "destroyed|activated|deactivated|beforeUnmount|unmounted)$"),
                std::regex("^(setup|teardown|init|initialize|dispose|cleanup|destroy)$", std::regex::icase),
            };
            return patterns;
        }

        const std::vector<std::regex>& entry_point_patterns() {
            static const std::vector<std::regex> patterns = {
                std::regex("^main$", std::regex::icase),
                std::regex("^(activate|deactivate)$"),
                std::regex("^(handler|run|execute|start|bootstrap)$", std::regex::icase),
            };
            return patterns;
        }

        bool any_match(const std::vector<std::regex>& patterns, const std::string_view text) {
            const std::string value(text);
            return std::ranges::any_of(patterns, [&value](const std::regex& pattern) {
                return std::regex_search(value, pattern);
            });
        }

        bool follows_underscore_convention(const Candidate& candidate) {
            if (!candidate.symbol_name.starts_with('_') || !candidate.declaration_kind) {
                return false;
            }
            switch (*candidate.declaration_kind) {
                case syntax::DeclarationKind::Variable:
                case syntax::DeclarationKind::Parameter:
                case syntax::DeclarationKind::CatchParameter:
                case syntax::DeclarationKind::Function:
                case syntax::DeclarationKind::Method:
                    return true;
                default:
                    return false;
            }
        }

        bool is_dead_code_kind(const FindingKind kind) {
            return kind == FindingKind::DeadFunction || kind == FindingKind::DeadExport;
        }

        Finding make_finding(const Candidate& candidate, const Certainty certainty) {
            Finding finding;
            finding.id = make_finding_id(candidate.kind, candidate.file, candidate.symbol_name, candidate.span.line);
            finding.kind = candidate.kind;
            finding.certainty = certainty;
            finding.symbol_name = candidate.symbol_name;
            finding.message = candidate.message;
            finding.tags = candidate.tags;
            finding.safe_fix_available = certainty == Certainty::High &&
                (candidate.kind == FindingKind::UnusedImport || candidate.kind == FindingKind::UnusedVariable);

            finding.locations.push_back(SourceLocation{
                .file = candidate.file,
                .line = candidate.span.line,
                .column = candidate.span.column,
                .end_line = candidate.span.end_line,
                .end_column = candidate.span.end_column,
            });
            finding.locations.insert(finding.locations.end(), candidate.related.begin(), candidate.related.end());
            return finding;
        }

    }  // namespace

    std::string_view to_string(const ExclusionRule rule) noexcept {
        switch (rule) {
            case ExclusionRule::None:             return "none";
            case ExclusionRule::IgnoreDirective:  return "ignore-directive";
            case ExclusionRule::NamingConvention: return "naming-convention";
            case ExclusionRule::FrameworkPattern: return "framework-pattern";
            case ExclusionRule::ExportedSymbol:   return "exported-symbol";
        }
        return "unknown";
    }

    bool CertaintyClassifier::is_lifecycle_name(const std::string_view name) {
        return any_match(lifecycle_patterns(), name);
    }

    bool CertaintyClassifier::is_entry_point_name(const std::string_view name) {
        return any_match(entry_point_patterns(), name);
    }

    bool CertaintyClassifier::is_entry_point_file(const std::string_view path) {
        const auto name = path_utils::stem(path);
        return name == "index" || name == "main" || name == "lib" || name == "types";
    }

    bool CertaintyClassifier::is_handler_or_accessor_name(const std::string_view name) {
        static const std::regex pattern("^((handle|on)|(get|set))[A-Z]");
        return std::regex_search(std::string(name), pattern);
    }

    Classification CertaintyClassifier::evaluate(const Candidate& candidate, const ClassificationScope& scope) const {
        // 1. ignore directives
        if (scope.directives && scope.directives->suppresses(candidate.kind, candidate.span.line)) {
            return {std::nullopt, ExclusionRule::IgnoreDirective};
        }

        // 2. naming convention
        if (scope.respect_underscore_convention && follows_underscore_convention(candidate)) {
            return {std::nullopt, ExclusionRule::NamingConvention};
        }

        // 3. framework patterns
        bool reduce_to_low = false;
        if (is_dead_code_kind(candidate.kind)) {
            if (is_lifecycle_name(candidate.symbol_name) || is_entry_point_name(candidate.symbol_name)) {
                return {std::nullopt, ExclusionRule::FrameworkPattern};
            }
            if (candidate.exported && is_entry_point_file(candidate.file)) {
                return {std::nullopt, ExclusionRule::FrameworkPattern};
            }
            reduce_to_low = is_handler_or_accessor_name(candidate.symbol_name) || !candidate.decorators.empty();
        }

        // 4. default rule
        Certainty certainty = Certainty::High;
        switch (candidate.kind) {
            case FindingKind::UnusedImport:
            case FindingKind::UnusedVariable:
            case FindingKind::CircularDependency:
                certainty = Certainty::High;
                break;

            case FindingKind::DeadFunction:
            case FindingKind::DeadExport:
                if (!scope.workspace_available()) {
                    if (candidate.exported) {
                        return {std::nullopt, ExclusionRule::ExportedSymbol};
                    }
                    certainty = Certainty::Medium;
                } else if (candidate.exported) {
                    const auto& index = *scope.workspace;
                    if (index.is_referenced_externally(candidate.symbol_name, candidate.file) ||
                        (candidate.default_export && index.is_referenced_externally("default", candidate.file))) {
                        return {std::nullopt, ExclusionRule::ExportedSymbol};
                    }
                }
                break;

            case FindingKind::HighComplexity:
                certainty = Certainty::Medium;
                break;
        }

        if (reduce_to_low) {
            certainty = Certainty::Low;
        }
        return {make_finding(candidate, certainty), ExclusionRule::None};
    }

}  // namespace janitor::analysis
