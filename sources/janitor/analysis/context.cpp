//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/analysis/context.hpp"

#include <iterator>
#include <set>
#include <stdexcept>

namespace janitor::analysis {

    AnalysisContext::AnalysisContext(Parts parts)
        : parts_(std::move(parts)) {
        if (!parts_.provider) {
            throw std::invalid_argument("AnalysisContext requires a symbol provider");
        }
        if (!parts_.graph) {
            parts_.graph = std::make_shared<const graph::DependencyGraph>();
        }
    }

    std::shared_ptr<const AnalysisContext> AnalysisContext::file_only(
        AnalyzerConfig config,
        std::shared_ptr<const syntax::ISymbolProvider> provider
    ) {
        Parts parts;
        parts.config = std::move(config);
        parts.provider = std::move(provider);
        return std::make_shared<const AnalysisContext>(std::move(parts));
    }

    std::shared_ptr<const syntax::SyntaxTree> AnalysisContext::tree(const std::string& file) const {
        const auto it = parts_.trees.find(file);
        return it == parts_.trees.end() ? nullptr : it->second;
    }

    std::vector<const graph::Cycle*> AnalysisContext::cycles_containing(const std::string_view file) const {
        std::vector<const graph::Cycle*> result;
        for (const auto& cycle : parts_.cycles) {
            if (cycle.contains(file)) {
                result.push_back(&cycle);
            }
        }
        return result;
    }

    std::vector<std::string> AnalysisContext::covering_files(const std::string& file) const {
        std::set<std::string> files{file};
        for (auto& dependent : parts_.graph->dependents_of(file)) {
            files.insert(std::move(dependent));
        }
        for (const auto* cycle : cycles_containing(file)) {
            files.insert(cycle->nodes.begin(), cycle->nodes.end());
        }

        // files whose occurrences decide whether this file's exports and
        // members count as used, including the unresolved ones
        const auto parsed = tree(file);
        if (parts_.references && parsed) {
            const auto& index = *parts_.references;
            auto add = [&files](std::vector<std::string> more) {
                files.insert(std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
            };

            bool has_default = false;
            for (const auto& decl : parsed->declarations) {
                has_default |= decl.default_export;
                if (decl.exported || decl.default_export ||
                    decl.kind == syntax::DeclarationKind::Class || decl.kind == syntax::DeclarationKind::Method) {
                    add(index.files_mentioning(decl.name, file));
                }
            }
            if (has_default) {
                add(index.referencing_files("default", file));
            }
            add(index.referencing_files("*", file));
        }
        return {files.begin(), files.end()};
    }

}  // namespace janitor::analysis
