//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/analysis/reference_index.hpp"
#include "janitor/utils/path_utils.hpp"

#include <algorithm>

namespace janitor::analysis {

    namespace {

        constexpr std::string_view kWholeModule = "*";

        std::set<std::string> module_targets(const syntax::ISymbolProvider& provider,
                                             const std::string& from_file,
                                             const std::string& specifier) {
            if (auto module = provider.resolve_module(from_file, specifier)) {
                return {std::move(*module)};
            }
            if (!path_utils::is_relative_specifier(specifier)) {
                return {specifier};
            }
            return {};
        }

    }  // namespace

    void ReferenceIndex::add_file(const syntax::SyntaxTree& tree, const syntax::ISymbolProvider& provider) {
        remove_file(tree.path);
        auto& names = by_file_[tree.path];

        auto record = [&](const std::string& name, const syntax::Span& span, std::set<std::string> targets) {
            by_name_[name].push_back(Occurrence{.file = tree.path, .span = span, .targets = std::move(targets)});
            names.insert(name);
        };

        auto resolved_targets = [&](const syntax::Reference& ref) {
            std::set<std::string> targets;
            for (auto& site : provider.resolve_symbol(tree, ref)) {
                targets.insert(std::move(site.file));
            }
            return targets;
        };

        for (const auto& ref : tree.references) {
            record(ref.name, ref.span, resolved_targets(ref));
            if (!ref.object.empty()) {
                const syntax::Reference receiver{.name = ref.object, .span = ref.span, .object = {}, .enclosing = ref.enclosing};
                record(receiver.name, receiver.span, resolved_targets(receiver));
            }
        }

        for (const auto& import : tree.imports) {
            for (const auto& binding : import.bindings) {
                const std::string name = binding.kind == syntax::BindingKind::Namespace
                    ? std::string(kWholeModule)
                    : binding.kind == syntax::BindingKind::Default ? std::string("default") : binding.imported_name;
                record(name, binding.span, module_targets(provider, tree.path, import.specifier));
            }
        }

        for (const auto& reexport : tree.reexports) {
            const auto targets = module_targets(provider, tree.path, reexport.specifier);
            if (reexport.names.empty()) {
                record(std::string(kWholeModule), reexport.span, targets);
            }
            for (const auto& name : reexport.names) {
                record(name, reexport.span, targets);
            }
        }
    }

    void ReferenceIndex::remove_file(const std::string& file) {
        const auto it = by_file_.find(file);
        if (it == by_file_.end()) {
            return;
        }
        for (const auto& name : it->second) {
            if (const auto occurrences = by_name_.find(name); occurrences != by_name_.end()) {
                std::erase_if(occurrences->second, [&file](const Occurrence& occ) { return occ.file == file; });
                if (occurrences->second.empty()) {
                    by_name_.erase(occurrences);
                }
            }
        }
        by_file_.erase(it);
    }

    bool ReferenceIndex::counts_for(const Occurrence& occurrence, const std::string_view declaring_file) {
        if (occurrence.file == declaring_file) {
            return false;
        }
        return occurrence.targets.empty() || occurrence.targets.contains(std::string(declaring_file));
    }

    bool ReferenceIndex::is_referenced_externally(const std::string_view name,
                                                  const std::string_view declaring_file) const {
        for (const auto key : {name, kWholeModule}) {
            const auto it = by_name_.find(key);
            if (it == by_name_.end()) {
                continue;
            }
            if (std::ranges::any_of(it->second, [declaring_file](const Occurrence& occ) {
                    return counts_for(occ, declaring_file);
                })) {
                return true;
            }
        }
        return false;
    }

    bool ReferenceIndex::is_name_used_elsewhere(const std::string_view name, const std::string_view file) const {
        const auto it = by_name_.find(name);
        return it != by_name_.end() && std::ranges::any_of(it->second, [file](const Occurrence& occ) {
            return occ.file != file;
        });
    }

    std::vector<std::string> ReferenceIndex::referencing_files(const std::string_view name,
                                                               const std::string_view declaring_file) const {
        std::set<std::string> files;
        for (const auto key : {name, kWholeModule}) {
            if (const auto it = by_name_.find(key); it != by_name_.end()) {
                for (const auto& occ : it->second) {
                    if (counts_for(occ, declaring_file)) {
                        files.insert(occ.file);
                    }
                }
            }
        }
        return {files.begin(), files.end()};
    }

    std::vector<std::string> ReferenceIndex::files_mentioning(const std::string_view name,
                                                              const std::string_view file) const {
        std::set<std::string> files;
        if (const auto it = by_name_.find(name); it != by_name_.end()) {
            for (const auto& occ : it->second) {
                if (occ.file != file) {
                    files.insert(occ.file);
                }
            }
        }
        return {files.begin(), files.end()};
    }

    bool ReferenceIndex::contains_file(const std::string_view file) const {
        return by_file_.find(file) != by_file_.end();
    }

    std::size_t ReferenceIndex::occurrence_count(const std::string_view name) const {
        const auto it = by_name_.find(name);
        return it == by_name_.end() ? 0 : it->second.size();
    }

}  // namespace janitor::analysis
