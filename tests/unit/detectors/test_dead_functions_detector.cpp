//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/dead_functions_detector.hpp"

#include <gtest/gtest.h>

namespace janitor::detectors
{
    class DeadFunctionsDetectorTest : public ::testing::Test {
    protected:
        static syntax::Declaration function(const std::string& name, bool exported = false) {
            syntax::Declaration d;
            d.name = name;
            d.kind = syntax::DeclarationKind::Function;
            d.exported = exported;
            d.span = {.line = 5, .column = 1, .end_line = 9, .end_column = 2};
            return d;
        }

        static syntax::Declaration method(const std::string& name, const std::string& owner, bool is_static = false) {
            syntax::Declaration d;
            d.name = name;
            d.kind = syntax::DeclarationKind::Method;
            d.container = owner;
            d.is_static = is_static;
            return d;
        }

        static syntax::Declaration klass(const std::string& name, bool exported) {
            syntax::Declaration d;
            d.name = name;
            d.kind = syntax::DeclarationKind::Class;
            d.exported = exported;
            return d;
        }

        static syntax::Reference ref(const std::string& name, const std::string& object = "") {
            return {.name = name, .span = {}, .object = object, .enclosing = ""};
        }

        std::vector<analysis::Candidate> run_file_scope(const syntax::SyntaxTree& tree) const {
            const auto context = analysis::AnalysisContext::file_only(AnalyzerConfig{}, provider_);
            return detector_.analyze(tree, *context);
        }

        std::vector<analysis::Candidate> run_workspace_scope(const syntax::SyntaxTree& tree,
                                                             const std::vector<syntax::SyntaxTree>& others) const {
            auto index = std::make_shared<analysis::ReferenceIndex>();
            index->add_file(tree, *provider_);
            for (const auto& other : others) {
                index->add_file(other, *provider_);
            }

            analysis::AnalysisContext::Parts parts;
            parts.provider = provider_;
            parts.references = std::move(index);
            const analysis::AnalysisContext context(std::move(parts));
            return detector_.analyze(tree, context);
        }

        DeadFunctionsDetector detector_;
        std::shared_ptr<syntax::InMemorySymbolProvider> provider_ = std::make_shared<syntax::InMemorySymbolProvider>();
    };

    TEST_F(DeadFunctionsDetectorTest, UnreferencedFunction) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {function("unused"), function("used")};
        tree.references = {ref("used")};

        const auto candidates = run_file_scope(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates[0].symbol_name, "unused");
        EXPECT_EQ(candidates[0].kind, FindingKind::DeadFunction);
        EXPECT_FALSE(candidates[0].exported);
        EXPECT_EQ(candidates[0].message, "Function 'unused' appears to be unused (no references found in this file)");
        EXPECT_EQ(candidates[0].tags, (std::vector<std::string>{"function", "requires-review"}));
    }

    TEST_F(DeadFunctionsDetectorTest, ExportedFlagCarried) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {function("api", true)};

        const auto candidates = run_workspace_scope(tree, {});
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_TRUE(candidates[0].exported);
        EXPECT_EQ(candidates[0].message, "Function 'api' appears to be unused (no references found in this workspace)");
    }

    TEST_F(DeadFunctionsDetectorTest, AnonymousFunctionSkipped) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {function("")};

        EXPECT_TRUE(run_file_scope(tree).empty());
    }

    TEST_F(DeadFunctionsDetectorTest, MethodReferencedByName) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {klass("Cart", false), method("total", "Cart"), method("unused", "Cart"),
                             method("constructor", "Cart")};
        tree.references = {ref("total", "cart")};

        const auto candidates = run_file_scope(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates[0].symbol_name, "unused");
        EXPECT_EQ(candidates[0].tags.front(), "method");
    }

    TEST_F(DeadFunctionsDetectorTest, StaticMethodNeedsClassReceiver) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {klass("Cart", false), method("create", "Cart", true), method("load", "Cart", true)};
        tree.references = {ref("create", "Cart"), ref("load", "other")};

        const auto candidates = run_file_scope(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates[0].symbol_name, "load");
    }

    TEST_F(DeadFunctionsDetectorTest, MethodOfExportedClassInFileScope) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        tree.declarations = {klass("Cart", true), method("unused", "Cart")};

        const auto candidates = run_file_scope(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_TRUE(candidates[0].exported);
    }

    TEST_F(DeadFunctionsDetectorTest, MethodUsedFromAnotherFile) {
        syntax::SyntaxTree tree;
        tree.path = "cart.ts";
        tree.declarations = {klass("Cart", true), method("total", "Cart"), method("unused", "Cart")};

        syntax::SyntaxTree user;
        user.path = "app.ts";
        syntax::ImportDeclaration import;
        import.specifier = "./cart";
        import.bindings.push_back({.local_name = "Cart", .imported_name = "Cart",
                                   .kind = syntax::BindingKind::Named, .type_only = false, .span = {}});
        user.imports.push_back(import);
        user.references = {ref("total", "cart")};
        provider_->upsert(tree);
        provider_->upsert(user);

        const auto candidates = run_workspace_scope(tree, {user});
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates[0].symbol_name, "unused");
        EXPECT_FALSE(candidates[0].exported);
    }

    TEST_F(DeadFunctionsDetectorTest, MethodsOfUnusedExportedClassLeftToExportCheck) {
        syntax::SyntaxTree tree;
        tree.path = "cart.ts";
        tree.declarations = {klass("Cart", true), method("unused", "Cart")};
        provider_->upsert(tree);

        EXPECT_TRUE(run_workspace_scope(tree, {}).empty());
    }
}
