//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/syntax/symbol_provider.hpp"
#include "janitor/utils/path_utils.hpp"

#include <ranges>

namespace janitor::syntax {

    const std::vector<std::string>& default_module_extensions() {
        static const std::vector<std::string> extensions = {".ts", ".tsx", ".js", ".jsx"};
        return extensions;
    }

    namespace {

        std::optional<DeclarationSite> site_through_import(const ISymbolProvider& provider,
                                                           const SyntaxTree& tree,
                                                           const ImportDeclaration& import,
                                                           const std::string& name) {
            if (auto module = provider.resolve_module(tree.path, import.specifier)) {
                return DeclarationSite{.file = std::move(*module), .name = name, .span = {}};
            }
            if (!path_utils::is_relative_specifier(import.specifier)) {
                return DeclarationSite{.file = import.specifier, .name = name, .span = {}};
            }
            return std::nullopt;
        }

    }  // namespace

    std::vector<DeclarationSite> resolve_by_scope(const ISymbolProvider& provider,
                                                  const SyntaxTree& tree,
                                                  const Reference& reference) {
        std::vector<DeclarationSite> sites;

        if (!reference.object.empty()) {
            const ImportDeclaration* owner = nullptr;
            if (tree.find_import_binding(reference.object, &owner) && owner) {
                if (auto site = site_through_import(provider, tree, *owner, reference.name)) {
                    sites.push_back(std::move(*site));
                }
                return sites;
            }
            if (const auto* decl = tree.find_declaration(reference.object)) {
                sites.push_back({.file = tree.path, .name = reference.name, .span = decl->span});
            }
            return sites;
        }

        if (const auto* decl = tree.find_declaration(reference.name)) {
            sites.push_back({.file = tree.path, .name = decl->name, .span = decl->span});
            return sites;
        }

        const ImportDeclaration* owner = nullptr;
        if (const auto* binding = tree.find_import_binding(reference.name, &owner); binding && owner) {
            if (auto site = site_through_import(provider, tree, *owner, binding->imported_name)) {
                sites.push_back(std::move(*site));
            }
        }
        return sites;
    }

    void InMemorySymbolProvider::upsert(SyntaxTree tree) {
        std::lock_guard lock(mutex_);
        parse_failures_.erase(tree.path);
        auto path = tree.path;
        trees_.insert_or_assign(std::move(path), std::move(tree));
    }

    void InMemorySymbolProvider::remove(const std::string& file) {
        std::lock_guard lock(mutex_);
        trees_.erase(file);
        parse_failures_.erase(file);
    }

    void InMemorySymbolProvider::fail_parse(const std::string& file, std::string message) {
        std::lock_guard lock(mutex_);
        parse_failures_.insert_or_assign(file, std::move(message));
    }

    bool InMemorySymbolProvider::contains(const std::string& file) const {
        std::lock_guard lock(mutex_);
        return trees_.contains(file) || parse_failures_.contains(file);
    }

    std::vector<std::string> InMemorySymbolProvider::files() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(trees_.size());
        for (const auto& path : trees_ | std::views::keys) {
            result.push_back(path);
        }
        return result;
    }

    Result<SyntaxTree, Error> InMemorySymbolProvider::parse(const std::string& file) const {
        std::lock_guard lock(mutex_);
        if (const auto it = parse_failures_.find(file); it != parse_failures_.end()) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error(it->second, file));
        }
        const auto it = trees_.find(file);
        if (it == trees_.end()) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("No syntax tree registered", file)
            );
        }
        return Result<SyntaxTree, Error>::success(it->second);
    }

    std::vector<DeclarationSite> InMemorySymbolProvider::resolve_symbol(
        const SyntaxTree& tree,
        const Reference& reference
    ) const {
        return resolve_by_scope(*this, tree, reference);
    }

    std::optional<std::string> InMemorySymbolProvider::resolve_module(
        const std::string& from_file,
        const std::string& specifier
    ) const {
        return path_utils::resolve_relative_specifier(
            from_file, specifier, default_module_extensions(),
            [this](const std::string& candidate) { return contains(candidate); });
    }

}  // namespace janitor::syntax
