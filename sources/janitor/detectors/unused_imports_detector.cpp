//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/unused_imports_detector.hpp"

namespace janitor::detectors {

    std::vector<analysis::Candidate> UnusedImportsDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& /*context*/
    ) const {
        std::vector<analysis::Candidate> candidates;

        for (const auto& import : tree.imports) {
            if (import.side_effect_only()) {
                continue;
            }
            for (const auto& binding : import.bindings) {
                if (tree.count_identifier_uses(binding.local_name) > 0) {
                    continue;
                }

                analysis::Candidate candidate;
                candidate.kind = kind();
                candidate.file = tree.path;
                candidate.symbol_name = binding.local_name;
                candidate.span = binding.span;
                candidate.message = "Import '" + binding.local_name + "' from '" + import.specifier +
                                    "' is never used";
                candidate.tags.emplace_back("import");
                if (binding.kind == syntax::BindingKind::Namespace) {
                    candidate.tags.emplace_back("namespace");
                } else if (binding.kind == syntax::BindingKind::Default) {
                    candidate.tags.emplace_back("default");
                }
                if (binding.type_only || import.type_only) {
                    candidate.tags.emplace_back("type-only");
                }
                candidates.push_back(std::move(candidate));
            }
        }

        return candidates;
    }

}  // namespace janitor::detectors
