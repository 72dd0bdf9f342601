//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_SYMBOL_PROVIDER_HPP
#define JANITOR_SYMBOL_PROVIDER_HPP

/**
 * @file symbol_provider.hpp
 * @brief Boundary to the external parser and symbol resolver.
 *
 * Providers are shared by every worker thread, so all three operations
 * must be safe to call concurrently.
 */

#include "janitor/result.hpp"
#include "janitor/error.hpp"
#include "janitor/syntax/syntax_tree.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace janitor::syntax {

    /// Extensions probed when resolving "./foo" style specifiers.
    const std::vector<std::string>& default_module_extensions();

    class ISymbolProvider {
    public:
        virtual ~ISymbolProvider() = default;

        /**
         * Parses a workspace file.
         *
         * @return The syntax tree or a ParseError.
         */
        [[nodiscard]] virtual Result<SyntaxTree, Error> parse(const std::string& file) const = 0;

        /**
         * Resolves a reference made inside @p tree to its declaration
         * site(s). Sites for symbols of external packages carry the package
         * specifier as their file. An empty result means the provider could
         * not tell.
         */
        [[nodiscard]] virtual std::vector<DeclarationSite> resolve_symbol(
            const SyntaxTree& tree,
            const Reference& reference
        ) const = 0;

        /**
         * Maps an import specifier written in @p from_file to a workspace
         * file, or nullopt for external packages and unknown targets.
         */
        [[nodiscard]] virtual std::optional<std::string> resolve_module(
            const std::string& from_file,
            const std::string& specifier
        ) const = 0;
    };

    /**
     * Scope-based resolution shared by the shipped providers: local
     * declarations first, then import bindings (following namespace and
     * member access through the import), otherwise unresolved.
     */
    std::vector<DeclarationSite> resolve_by_scope(const ISymbolProvider& provider,
                                                  const SyntaxTree& tree,
                                                  const Reference& reference);

    /**
     * Provider over syntax trees registered in memory. Used by embedders
     * that run their own parser, and by the tests.
     */
    class InMemorySymbolProvider : public ISymbolProvider {
    public:
        InMemorySymbolProvider() = default;

        void upsert(SyntaxTree tree);
        void remove(const std::string& file);

        /**
         * Makes subsequent parse() calls for @p file fail with @p message.
         */
        void fail_parse(const std::string& file, std::string message);

        [[nodiscard]] bool contains(const std::string& file) const;
        [[nodiscard]] std::vector<std::string> files() const;

        [[nodiscard]] Result<SyntaxTree, Error> parse(const std::string& file) const override;

        [[nodiscard]] std::vector<DeclarationSite> resolve_symbol(
            const SyntaxTree& tree,
            const Reference& reference
        ) const override;

        [[nodiscard]] std::optional<std::string> resolve_module(
            const std::string& from_file,
            const std::string& specifier
        ) const override;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, SyntaxTree> trees_;
        std::map<std::string, std::string> parse_failures_;
    };

}  // namespace janitor::syntax

#endif //JANITOR_SYMBOL_PROVIDER_HPP
