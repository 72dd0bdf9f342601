//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/unused_variables_detector.hpp"

#include <algorithm>

namespace janitor::detectors {

    namespace {

        bool is_read(const syntax::SyntaxTree& tree, const syntax::Declaration& decl) {
            if (decl.kind == syntax::DeclarationKind::Variable) {
                return tree.count_identifier_uses(decl.name) > 0;
            }
            // parameters and catch bindings are only visible in their function
            return std::ranges::any_of(tree.references, [&decl](const syntax::Reference& ref) {
                const bool named = (ref.object.empty() && ref.name == decl.name) || ref.object == decl.name;
                return named && (decl.container.empty() || ref.enclosing == decl.container);
            });
        }

        std::string describe(const syntax::Declaration& decl) {
            switch (decl.kind) {
                case syntax::DeclarationKind::Parameter:
                    return "Parameter '" + decl.name + "' is never used";
                case syntax::DeclarationKind::CatchParameter:
                    return "Catch binding '" + decl.name + "' is never used";
                default:
                    return "Variable '" + decl.name + "' is declared but never read";
            }
        }

    }  // namespace

    std::vector<analysis::Candidate> UnusedVariablesDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& /*context*/
    ) const {
        std::vector<analysis::Candidate> candidates;

        for (const auto& decl : tree.declarations) {
            const bool variable_like = decl.kind == syntax::DeclarationKind::Variable ||
                                       decl.kind == syntax::DeclarationKind::Parameter ||
                                       decl.kind == syntax::DeclarationKind::CatchParameter;
            if (!variable_like || decl.exported || decl.default_export) {
                continue;
            }
            if (is_read(tree, decl)) {
                continue;
            }

            analysis::Candidate candidate;
            candidate.kind = kind();
            candidate.file = tree.path;
            candidate.symbol_name = decl.name;
            candidate.span = decl.span;
            candidate.declaration_kind = decl.kind;
            candidate.message = describe(decl);
            candidate.tags.emplace_back(syntax::to_string(decl.kind));
            if (decl.destructured) {
                candidate.tags.emplace_back("destructured");
            }
            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }

}  // namespace janitor::detectors
