//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_UNUSED_IMPORTS_DETECTOR_HPP
#define JANITOR_UNUSED_IMPORTS_DETECTOR_HPP

/**
 * @file unused_imports_detector.hpp
 * @brief Import bindings that are never referenced.
 *
 * Side-effect imports ("import './setup'") have no bindings and are never
 * reported. Type-only bindings are reported with a "type-only" tag.
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class UnusedImportsDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "unused-imports";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds import bindings that are never referenced";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::UnusedImport;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_UNUSED_IMPORTS_DETECTOR_HPP
