//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_JSON_SYMBOL_PROVIDER_HPP
#define JANITOR_JSON_SYMBOL_PROVIDER_HPP

/**
 * @file json_symbol_provider.hpp
 * @brief Symbol provider reading syntax trees exported by an external parser.
 *
 * For a workspace file "src/a.ts" the tree is read from
 * "<ast_dir>/src/a.ts.json":
 * @code
 *     {
 *       "imports": [{"specifier": "./b", "line": 1, "column": 1,
 *                    "bindings": [{"local": "x", "imported": "x", "kind": "named"}]}],
 *       "reexports": [{"specifier": "./c", "names": ["y"], "line": 2}],
 *       "declarations": [{"name": "run", "kind": "function", "line": 4, "column": 1,
 *                         "exported": true,
 *                         "complexity": {"cyclomatic": 3, "cognitive": 2, "nesting_depth": 1}}],
 *       "references": [{"name": "x", "line": 5, "column": 3, "enclosing": "run"}]
 *     }
 * @endcode
 *
 * Source lines (needed for ignore directives) come from the optional
 * "lines" array, or from "<source_root>/<file>" when a source root is set.
 */

#include "janitor/syntax/symbol_provider.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace janitor::syntax {

    class JsonSymbolProvider : public ISymbolProvider {
    public:
        explicit JsonSymbolProvider(std::filesystem::path ast_dir,
                                    std::optional<std::filesystem::path> source_root = std::nullopt);

        /**
         * Builds a tree from an already decoded document.
         */
        [[nodiscard]] static Result<SyntaxTree, Error> from_json(const std::string& file,
                                                                 const nlohmann::json& document);

        [[nodiscard]] Result<SyntaxTree, Error> parse(const std::string& file) const override;

        [[nodiscard]] std::vector<DeclarationSite> resolve_symbol(
            const SyntaxTree& tree,
            const Reference& reference
        ) const override;

        [[nodiscard]] std::optional<std::string> resolve_module(
            const std::string& from_file,
            const std::string& specifier
        ) const override;

        [[nodiscard]] const std::filesystem::path& ast_dir() const noexcept { return ast_dir_; }

    private:
        [[nodiscard]] std::filesystem::path document_path(const std::string& file) const;

        std::filesystem::path ast_dir_;
        std::optional<std::filesystem::path> source_root_;
    };

}  // namespace janitor::syntax

#endif //JANITOR_JSON_SYMBOL_PROVIDER_HPP
