//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CIRCULAR_DEPENDENCY_DETECTOR_HPP
#define JANITOR_CIRCULAR_DEPENDENCY_DETECTOR_HPP

/**
 * @file circular_dependency_detector.hpp
 * @brief Import cycles the file is part of.
 *
 * Cycles come precomputed from the analysis context. Each member file of
 * a cycle gets its own candidate, anchored at line 1, whose symbol is the
 * formatted cycle ("a.ts → b.ts → a.ts").
 */

#include "janitor/detectors/detector.hpp"

namespace janitor::detectors {

    class CircularDependencyDetector : public IDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "circular-dependencies";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Reports import cycles the file takes part in";
        }

        [[nodiscard]] FindingKind kind() const noexcept override {
            return FindingKind::CircularDependency;
        }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree,
            const analysis::AnalysisContext& context
        ) const override;
    };

}  // namespace janitor::detectors

#endif //JANITOR_CIRCULAR_DEPENDENCY_DETECTOR_HPP
