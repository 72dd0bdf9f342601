//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_DEAD_EXPORTS_DETECTOR_HPP
#define JANITOR_DEAD_EXPORTS_DETECTOR_HPP

/**
 * @file dead_exports_detector.hpp
 * @brief Exported classes, variables, types and enums no other file uses.
 *
 * Every exported non-function declaration becomes a candidate; whether
 * another file uses it is decided by the classifier against the workspace
 * reference index. Exported functions belong to dead-functions.
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class DeadExportsDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "dead-exports";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds exported symbols no other file imports";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::DeadExport;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_DEAD_EXPORTS_DETECTOR_HPP
