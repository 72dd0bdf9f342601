//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_SYNTAX_TREE_HPP
#define JANITOR_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief Parsed view of one source file, as delivered by a symbol provider.
 *
 * The engine does not parse source itself. A provider hands over the parts
 * of the AST that dead-code analysis needs:
 * - import declarations with their bindings
 * - re-exports ("export { x } from './y'")
 * - declarations in AST traversal order
 * - identifier and property-access references
 *
 * References never include declaration sites or import bindings; a name
 * appearing in @ref SyntaxTree::references is a genuine use.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace janitor::syntax {

    struct Span {
        int line = 0;
        int column = 0;
        int end_line = 0;
        int end_column = 0;

        bool operator==(const Span&) const = default;
    };

    enum class BindingKind {
        Default,
        Namespace,
        Named
    };

    struct ImportBinding {
        std::string local_name;
        /// Name exported by the target module ("default" or "*" for the
        /// default and namespace forms).
        std::string imported_name;
        BindingKind kind = BindingKind::Named;
        bool type_only = false;
        Span span;
    };

    struct ImportDeclaration {
        std::string specifier;
        std::vector<ImportBinding> bindings;
        bool type_only = false;
        Span span;

        /// "import './polyfill'" has no bindings and is kept for its effects.
        [[nodiscard]] bool side_effect_only() const noexcept { return bindings.empty(); }
    };

    struct ReExport {
        std::string specifier;
        /// Exported names; empty for "export * from".
        std::vector<std::string> names;
        Span span;
    };

    enum class DeclarationKind {
        Function,
        Method,
        Class,
        Variable,
        Parameter,
        CatchParameter,
        Interface,
        TypeAlias,
        Enum
    };

    [[nodiscard]] std::string_view to_string(DeclarationKind kind) noexcept;
    [[nodiscard]] std::optional<DeclarationKind> declaration_kind_from_string(std::string_view text) noexcept;
    [[nodiscard]] std::optional<BindingKind> binding_kind_from_string(std::string_view text) noexcept;

    struct ComplexityMetrics {
        int cyclomatic = 1;
        int cognitive = 0;
        int nesting_depth = 0;
    };

    struct Declaration {
        std::string name;
        DeclarationKind kind = DeclarationKind::Variable;
        Span span;
        bool exported = false;
        bool default_export = false;
        bool is_static = false;
        bool destructured = false;
        /// Class for methods, function for parameters, empty otherwise.
        std::string container;
        std::vector<std::string> decorators;
        std::optional<ComplexityMetrics> complexity;

        [[nodiscard]] bool is_callable() const noexcept {
            return kind == DeclarationKind::Function || kind == DeclarationKind::Method;
        }
    };

    struct Reference {
        std::string name;
        Span span;
        /// Receiver of a property access ("Foo" in "Foo.bar"), empty for a
        /// plain identifier.
        std::string object;
        /// Name of the function or method the reference appears in.
        std::string enclosing;
    };

    struct SyntaxTree {
        std::string path;
        std::vector<std::string> lines;
        std::vector<ImportDeclaration> imports;
        std::vector<ReExport> reexports;
        std::vector<Declaration> declarations;
        std::vector<Reference> references;

        [[nodiscard]] const Declaration* find_declaration(std::string_view name) const noexcept;
        [[nodiscard]] const ImportBinding* find_import_binding(std::string_view local_name,
                                                               const ImportDeclaration** owner = nullptr) const noexcept;

        /**
         * Count of references to @p name as a plain identifier or as the
         * receiver of a property access.
         */
        [[nodiscard]] std::size_t count_identifier_uses(std::string_view name) const noexcept;
    };

    /**
     * Where a resolved reference points.
     */
    struct DeclarationSite {
        std::string file;
        std::string name;
        Span span;

        bool operator==(const DeclarationSite&) const = default;
    };

}  // namespace janitor::syntax

#endif //JANITOR_SYNTAX_TREE_HPP
