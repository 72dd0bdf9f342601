//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CERTAINTY_CLASSIFIER_HPP
#define JANITOR_CERTAINTY_CLASSIFIER_HPP

/**
 * @file certainty_classifier.hpp
 * @brief Turns detector candidates into confidence-tagged findings.
 *
 * Exclusion rules are evaluated in order and the first that applies wins:
 * 1. an ignore directive on the line or for the file
 * 2. the leading-underscore naming convention
 * 3. framework lifecycle hooks, entry points and entry-point files
 * 4. the default rule for the candidate kind
 *
 * Default certainty:
 * | kind                         | workspace scope             | file-only scope |
 * |------------------------------|-----------------------------|-----------------|
 * | unused import / variable     | high                        | high            |
 * | dead function/export, local  | high                        | medium          |
 * | dead function/export, export | high unless used elsewhere  | suppressed      |
 * | circular dependency          | high                        | high            |
 * | high complexity              | medium                      | medium          |
 *
 * Handler and accessor names ("handleClick", "onSave", "getName") and
 * decorated members survive rule 3 at low certainty. Only high-certainty
 * unused imports and variables are marked safe to fix.
 *
 * Classification is a pure function of the candidate and the scope.
 */

#include "janitor/analysis/candidate.hpp"
#include "janitor/analysis/reference_index.hpp"
#include "janitor/syntax/ignore_directives.hpp"
#include "janitor/types.hpp"

#include <optional>
#include <string_view>

namespace janitor::analysis {

    struct ClassificationScope {
        /// Workspace reference index; null means file-only scope.
        const ReferenceIndex* workspace = nullptr;
        const syntax::IgnoreDirectives* directives = nullptr;
        bool respect_underscore_convention = true;

        [[nodiscard]] bool workspace_available() const noexcept { return workspace != nullptr; }
    };

    enum class ExclusionRule {
        None,
        IgnoreDirective,
        NamingConvention,
        FrameworkPattern,
        ExportedSymbol
    };

    [[nodiscard]] std::string_view to_string(ExclusionRule rule) noexcept;

    struct Classification {
        std::optional<Finding> finding;
        ExclusionRule excluded_by = ExclusionRule::None;
    };

    class CertaintyClassifier {
    public:
        [[nodiscard]] Classification evaluate(const Candidate& candidate, const ClassificationScope& scope) const;

        [[nodiscard]] std::optional<Finding> classify(const Candidate& candidate,
                                                      const ClassificationScope& scope) const {
            return evaluate(candidate, scope).finding;
        }

        /// React, Angular and Vue lifecycle hooks, React hooks, setup/teardown.
        [[nodiscard]] static bool is_lifecycle_name(std::string_view name);
        /// main, activate/deactivate, handler, run, execute, start, bootstrap.
        [[nodiscard]] static bool is_entry_point_name(std::string_view name);
        /// index, main, lib and types modules.
        [[nodiscard]] static bool is_entry_point_file(std::string_view path);
        /// handleX, onX, getX, setX.
        [[nodiscard]] static bool is_handler_or_accessor_name(std::string_view name);
    };

}  // namespace janitor::analysis

#endif //JANITOR_CERTAINTY_CLASSIFIER_HPP
