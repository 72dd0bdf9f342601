//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/syntax/json_symbol_provider.hpp"
#include "janitor/utils/file_utils.hpp"
#include "janitor/utils/path_utils.hpp"

#include <stdexcept>

namespace janitor::syntax {

    using json = nlohmann::json;

    namespace {

        Span read_span(const json& node) {
            Span span;
            span.line = node.value("line", 0);
            span.column = node.value("column", 0);
            span.end_line = node.value("end_line", span.line);
            span.end_column = node.value("end_column", span.column);
            return span;
        }

        std::vector<std::string> read_strings(const json& node, const char* key) {
            std::vector<std::string> values;
            if (const auto it = node.find(key); it != node.end() && it->is_array()) {
                for (const auto& element : *it) {
                    values.push_back(element.get<std::string>());
                }
            }
            return values;
        }

        ImportDeclaration read_import(const json& node) {
            ImportDeclaration import;
            import.specifier = node.at("specifier").get<std::string>();
            import.type_only = node.value("type_only", false);
            import.span = read_span(node);

            if (const auto it = node.find("bindings"); it != node.end()) {
                for (const auto& entry : *it) {
                    ImportBinding binding;
                    binding.local_name = entry.at("local").get<std::string>();
                    binding.imported_name = entry.value("imported", binding.local_name);
                    const auto kind_name = entry.value("kind", std::string("named"));
                    const auto kind = binding_kind_from_string(kind_name);
                    if (!kind) {
                        throw std::invalid_argument("unknown import binding kind '" + kind_name + "'");
                    }
                    binding.kind = *kind;
                    binding.type_only = entry.value("type_only", import.type_only);
                    binding.span = entry.contains("line") ? read_span(entry) : import.span;
                    import.bindings.push_back(std::move(binding));
                }
            }
            return import;
        }

        Declaration read_declaration(const json& node) {
            Declaration decl;
            decl.name = node.at("name").get<std::string>();
            const auto kind_name = node.at("kind").get<std::string>();
            const auto kind = declaration_kind_from_string(kind_name);
            if (!kind) {
                throw std::invalid_argument("unknown declaration kind '" + kind_name + "'");
            }
            decl.kind = *kind;
            decl.span = read_span(node);
            decl.exported = node.value("exported", false);
            decl.default_export = node.value("default_export", false);
            decl.is_static = node.value("static", false);
            decl.destructured = node.value("destructured", false);
            decl.container = node.value("container", std::string{});
            decl.decorators = read_strings(node, "decorators");

            if (const auto it = node.find("complexity"); it != node.end() && it->is_object()) {
                ComplexityMetrics metrics;
                metrics.cyclomatic = it->value("cyclomatic", 1);
                metrics.cognitive = it->value("cognitive", 0);
                metrics.nesting_depth = it->value("nesting_depth", 0);
                decl.complexity = metrics;
            }
            return decl;
        }

    }  // namespace

    JsonSymbolProvider::JsonSymbolProvider(std::filesystem::path ast_dir,
                                           std::optional<std::filesystem::path> source_root)
        : ast_dir_(std::move(ast_dir))
        , source_root_(std::move(source_root)) {}

    std::filesystem::path JsonSymbolProvider::document_path(const std::string& file) const {
        return ast_dir_ / (file + ".json");
    }

    Result<SyntaxTree, Error> JsonSymbolProvider::from_json(const std::string& file, const json& document) {
        if (!document.is_object()) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("Syntax tree document is not an object", file)
            );
        }

        try {
            SyntaxTree tree;
            tree.path = file;
            tree.lines = read_strings(document, "lines");

            if (const auto it = document.find("imports"); it != document.end()) {
                for (const auto& node : *it) {
                    tree.imports.push_back(read_import(node));
                }
            }
            if (const auto it = document.find("reexports"); it != document.end()) {
                for (const auto& node : *it) {
                    ReExport reexport;
                    reexport.specifier = node.at("specifier").get<std::string>();
                    reexport.names = read_strings(node, "names");
                    reexport.span = read_span(node);
                    tree.reexports.push_back(std::move(reexport));
                }
            }
            if (const auto it = document.find("declarations"); it != document.end()) {
                for (const auto& node : *it) {
                    tree.declarations.push_back(read_declaration(node));
                }
            }
            if (const auto it = document.find("references"); it != document.end()) {
                for (const auto& node : *it) {
                    Reference ref;
                    ref.name = node.at("name").get<std::string>();
                    ref.span = read_span(node);
                    ref.object = node.value("object", std::string{});
                    ref.enclosing = node.value("enclosing", std::string{});
                    tree.references.push_back(std::move(ref));
                }
            }
            return Result<SyntaxTree, Error>::success(std::move(tree));

        } catch (const json::exception& e) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error(e.what(), file));
        } catch (const std::invalid_argument& e) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error(e.what(), file));
        }
    }

    Result<SyntaxTree, Error> JsonSymbolProvider::parse(const std::string& file) const {
        auto content = file_utils::read_file(document_path(file));
        if (content.is_err()) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("Syntax tree not available: " + content.error().message(), file)
            );
        }

        json document;
        try {
            document = json::parse(content.value());
        } catch (const json::parse_error& e) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error(e.what(), file));
        }

        auto tree = from_json(file, document);
        if (tree.is_ok() && tree.value().lines.empty() && source_root_) {
            if (auto source = file_utils::read_file(*source_root_ / file); source.is_ok()) {
                tree.value().lines = file_utils::split_lines(source.value());
            }
        }
        return tree;
    }

    std::vector<DeclarationSite> JsonSymbolProvider::resolve_symbol(
        const SyntaxTree& tree,
        const Reference& reference
    ) const {
        return resolve_by_scope(*this, tree, reference);
    }

    std::optional<std::string> JsonSymbolProvider::resolve_module(
        const std::string& from_file,
        const std::string& specifier
    ) const {
        return path_utils::resolve_relative_specifier(
            from_file, specifier, default_module_extensions(),
            [this](const std::string& candidate) {
                std::error_code ec;
                return std::filesystem::is_regular_file(document_path(candidate), ec);
            });
    }

}  // namespace janitor::syntax
