//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_UNUSED_VARIABLES_DETECTOR_HPP
#define JANITOR_UNUSED_VARIABLES_DETECTOR_HPP

/**
 * @file unused_variables_detector.hpp
 * @brief Variables, parameters and catch bindings that are never read.
 *
 * Parameters are matched against references inside their own function
 * only. Exported variables are left to the dead-exports detector.
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class UnusedVariablesDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "unused-variables";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds variables and parameters that are never read";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::UnusedVariable;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_UNUSED_VARIABLES_DETECTOR_HPP
