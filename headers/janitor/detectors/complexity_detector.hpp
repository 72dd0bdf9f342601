//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_COMPLEXITY_DETECTOR_HPP
#define JANITOR_COMPLEXITY_DETECTOR_HPP

/**
 * @file complexity_detector.hpp
 * @brief Functions over the configured complexity thresholds.
 *
 * A function is reported when its cyclomatic complexity, cognitive
 * complexity or nesting depth is strictly greater than the threshold.
 * Functions the provider supplied no metrics for are skipped.
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class ComplexityDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "complexity";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds functions whose complexity exceeds the configured thresholds";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::HighComplexity;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_COMPLEXITY_DETECTOR_HPP
