//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/complexity_detector.hpp"

#include <sstream>

namespace janitor::detectors {

    std::vector<analysis::Candidate> ComplexityDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& context
    ) const {
        std::vector<analysis::Candidate> candidates;
        const auto& limits = context.config().complexity;

        for (const auto& decl : tree.declarations) {
            if (!decl.is_callable() || !decl.complexity) {
                continue;
            }
            const auto& metrics = *decl.complexity;
            const bool too_complex = metrics.cyclomatic > limits.cyclomatic ||
                                     metrics.cognitive > limits.cognitive ||
                                     metrics.nesting_depth > limits.nesting_depth;
            if (!too_complex) {
                continue;
            }

            analysis::Candidate candidate;
            candidate.kind = kind();
            candidate.file = tree.path;
            candidate.symbol_name = decl.name;
            candidate.span = decl.span;
            candidate.declaration_kind = decl.kind;
            std::ostringstream ss;
            ss << "'" << decl.name << "' is too complex (cyclomatic " << metrics.cyclomatic
               << ", cognitive " << metrics.cognitive << ", nesting depth " << metrics.nesting_depth << ")";
            candidate.message = ss.str();
            candidate.tags.emplace_back("complexity");
            if (metrics.cyclomatic > limits.cyclomatic) {
                candidate.tags.emplace_back("cyclomatic");
            }
            if (metrics.cognitive > limits.cognitive) {
                candidate.tags.emplace_back("cognitive");
            }
            if (metrics.nesting_depth > limits.nesting_depth) {
                candidate.tags.emplace_back("nesting");
            }
            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }

}  // namespace janitor::detectors
