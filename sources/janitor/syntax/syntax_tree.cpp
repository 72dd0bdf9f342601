//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/syntax/syntax_tree.hpp"

#include <algorithm>

namespace janitor::syntax {

    std::string_view to_string(const DeclarationKind kind) noexcept {
        switch (kind) {
            case DeclarationKind::Function:       return "function";
            case DeclarationKind::Method:         return "method";
            case DeclarationKind::Class:          return "class";
            case DeclarationKind::Variable:       return "variable";
            case DeclarationKind::Parameter:      return "parameter";
            case DeclarationKind::CatchParameter: return "catch-parameter";
            case DeclarationKind::Interface:      return "interface";
            case DeclarationKind::TypeAlias:      return "type-alias";
            case DeclarationKind::Enum:           return "enum";
        }
        return "unknown";
    }

    std::optional<DeclarationKind> declaration_kind_from_string(const std::string_view text) noexcept {
        if (text == "function") return DeclarationKind::Function;
        if (text == "method") return DeclarationKind::Method;
        if (text == "class") return DeclarationKind::Class;
        if (text == "variable") return DeclarationKind::Variable;
        if (text == "parameter") return DeclarationKind::Parameter;
        if (text == "catch-parameter") return DeclarationKind::CatchParameter;
        if (text == "interface") return DeclarationKind::Interface;
        if (text == "type-alias") return DeclarationKind::TypeAlias;
        if (text == "enum") return DeclarationKind::Enum;
        return std::nullopt;
    }

    std::optional<BindingKind> binding_kind_from_string(const std::string_view text) noexcept {
        if (text == "default") return BindingKind::Default;
        if (text == "namespace") return BindingKind::Namespace;
        if (text == "named") return BindingKind::Named;
        return std::nullopt;
    }

    const Declaration* SyntaxTree::find_declaration(const std::string_view name) const noexcept {
        const auto it = std::ranges::find_if(declarations, [name](const Declaration& decl) {
            return decl.name == name && decl.kind != DeclarationKind::Parameter &&
                   decl.kind != DeclarationKind::CatchParameter;
        });
        return it == declarations.end() ? nullptr : &*it;
    }

    const ImportBinding* SyntaxTree::find_import_binding(const std::string_view local_name,
                                                         const ImportDeclaration** owner) const noexcept {
        for (const auto& import : imports) {
            for (const auto& binding : import.bindings) {
                if (binding.local_name == local_name) {
                    if (owner) {
                        *owner = &import;
                    }
                    return &binding;
                }
            }
        }
        return nullptr;
    }

    std::size_t SyntaxTree::count_identifier_uses(const std::string_view name) const noexcept {
        return static_cast<std::size_t>(std::ranges::count_if(references, [name](const Reference& ref) {
            return (ref.object.empty() && ref.name == name) || ref.object == name;
        }));
    }

}  // namespace janitor::syntax
