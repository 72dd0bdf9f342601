//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/circular_dependency_detector.hpp"

namespace janitor::detectors {

    std::vector<analysis::Candidate> CircularDependencyDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& context
    ) const {
        std::vector<analysis::Candidate> candidates;

        for (const auto* cycle : context.cycles_containing(tree.path)) {
            analysis::Candidate candidate;
            candidate.kind = kind();
            candidate.file = tree.path;
            candidate.symbol_name = cycle->format();
            candidate.span = syntax::Span{.line = 1, .column = 1, .end_line = 1, .end_column = 1};
            candidate.message = "Circular dependency: " + cycle->format();
            candidate.tags.emplace_back(cycle->is_direct ? "direct" : "transitive");
            candidate.tags.emplace_back("architecture");

            for (const auto& member : cycle->node_set()) {
                if (member == tree.path) {
                    continue;
                }
                candidate.related.push_back(SourceLocation{.file = member, .line = 1, .column = 1});
            }
            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }

}  // namespace janitor::detectors
