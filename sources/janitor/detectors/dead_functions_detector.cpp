//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/dead_functions_detector.hpp"

#include <algorithm>

namespace janitor::detectors {

    namespace {

        bool is_method_referenced(const syntax::SyntaxTree& tree, const syntax::Declaration& method) {
            return std::ranges::any_of(tree.references, [&method](const syntax::Reference& ref) {
                if (ref.name != method.name) {
                    return false;
                }
                if (method.is_static) {
                    return ref.object == method.container;
                }
                return true;
            });
        }

        const syntax::Declaration* find_class(const syntax::SyntaxTree& tree, const std::string& name) {
            const auto it = std::ranges::find_if(tree.declarations, [&name](const syntax::Declaration& decl) {
                return decl.kind == syntax::DeclarationKind::Class && decl.name == name;
            });
            return it == tree.declarations.end() ? nullptr : &*it;
        }

        analysis::Candidate make_candidate(const syntax::SyntaxTree& tree,
                                           const syntax::Declaration& decl,
                                           const bool exported,
                                           const bool workspace) {
            const bool is_method = decl.kind == syntax::DeclarationKind::Method;
            const std::string label = is_method ? "Method" : "Function";
            const std::string scope = workspace ? "workspace" : "file";

            analysis::Candidate candidate;
            candidate.kind = FindingKind::DeadFunction;
            candidate.file = tree.path;
            candidate.symbol_name = decl.name;
            candidate.span = decl.span;
            candidate.declaration_kind = decl.kind;
            candidate.exported = exported;
            candidate.default_export = decl.default_export;
            candidate.decorators = decl.decorators;
            candidate.message = label + " '" + decl.name + "' appears to be unused (no references found in this " +
                                scope + ")";
            candidate.tags.emplace_back(is_method ? "method" : "function");
            candidate.tags.emplace_back("requires-review");
            return candidate;
        }

    }  // namespace

    std::vector<analysis::Candidate> DeadFunctionsDetector::analyze(
        const syntax::SyntaxTree& tree,
        const analysis::AnalysisContext& context
    ) const {
        std::vector<analysis::Candidate> candidates;
        const auto* index = context.references();

        for (const auto& decl : tree.declarations) {
            if (decl.kind == syntax::DeclarationKind::Function) {
                if (decl.name.empty() || tree.count_identifier_uses(decl.name) > 0) {
                    continue;
                }
                candidates.push_back(make_candidate(tree, decl, decl.exported || decl.default_export, index != nullptr));
                continue;
            }

            if (decl.kind != syntax::DeclarationKind::Method || decl.name == "constructor") {
                continue;
            }
            if (is_method_referenced(tree, decl)) {
                continue;
            }

            const auto* owner = find_class(tree, decl.container);
            const bool class_exported = owner && (owner->exported || owner->default_export);

            if (index) {
                if (index->is_name_used_elsewhere(decl.name, tree.path)) {
                    continue;
                }
                if (class_exported && tree.count_identifier_uses(owner->name) == 0 &&
                    !index->is_referenced_externally(owner->name, tree.path) &&
                    !(owner->default_export && index->is_referenced_externally("default", tree.path))) {
                    continue;
                }
                candidates.push_back(make_candidate(tree, decl, false, true));
                continue;
            }

            candidates.push_back(make_candidate(tree, decl, class_exported, false));
        }

        return candidates;
    }

}  // namespace janitor::detectors
