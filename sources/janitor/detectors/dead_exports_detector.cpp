//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/dead_exports_detector.hpp"

namespace janitor::detectors {

    namespace {

        bool is_export_kind(const syntax::DeclarationKind kind) {
            switch (kind) {
                case syntax::DeclarationKind::Class:
                case syntax::DeclarationKind::Variable:
                case syntax::DeclarationKind::Interface:
                case syntax::DeclarationKind::TypeAlias:
                case syntax::DeclarationKind::Enum:
                    return true;
                default:
                    return false;
            }
        }

    }  // namespace

    std::vector<analysis::Candidate> DeadExportsDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& /*context*/
    ) const {
        std::vector<analysis::Candidate> candidates;

        // Functions are covered by the dead-functions detector. Whether an
        // export is actually imported is decided during classification.
        for (const auto& decl : tree.declarations) {
            if (!(decl.exported || decl.default_export) || !is_export_kind(decl.kind)) {
                continue;
            }

            analysis::Candidate candidate;
            candidate.kind = kind();
            candidate.file = tree.path;
            candidate.symbol_name = decl.name;
            candidate.span = decl.span;
            candidate.declaration_kind = decl.kind;
            candidate.exported = true;
            candidate.default_export = decl.default_export;
            candidate.decorators = decl.decorators;
            candidate.message = "Export '" + decl.name + "' is not imported by any other file";
            candidate.tags.emplace_back("export");
            candidate.tags.emplace_back(syntax::to_string(decl.kind));
            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }

}  // namespace janitor::detectors
