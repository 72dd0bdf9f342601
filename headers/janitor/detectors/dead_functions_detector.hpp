//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_DEAD_FUNCTIONS_DETECTOR_HPP
#define JANITOR_DEAD_FUNCTIONS_DETECTOR_HPP

/**
 * @file dead_functions_detector.hpp
 * @brief Functions and class methods that are never referenced.
 *
 * Rules:
 * - recursive calls count as references
 * - constructors are never reported
 * - static methods must be reached through their class name
 * - instance methods are alive if any property access uses their name,
 *   in this file or, with workspace scope, in any other file
 * - methods of an exported class nobody uses are skipped; the class
 *   itself is the dead export
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class DeadFunctionsDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "dead-functions";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds functions and methods that are never referenced";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::DeadFunction;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_DEAD_FUNCTIONS_DETECTOR_HPP
