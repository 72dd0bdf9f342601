//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/detectors/unused_imports_detector.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace janitor::detectors
{
    class UnusedImportsDetectorTest : public ::testing::Test {
    protected:
        static syntax::ImportBinding binding(const std::string& local, syntax::BindingKind kind = syntax::BindingKind::Named) {
            return {.local_name = local, .imported_name = local, .kind = kind, .type_only = false,
                    .span = {.line = 1, .column = 10, .end_line = 1, .end_column = 20}};
        }

        static bool has_tag(const analysis::Candidate& candidate, const std::string& tag) {
            return std::ranges::find(candidate.tags, tag) != candidate.tags.end();
        }

        std::vector<analysis::Candidate> run(const syntax::SyntaxTree& tree) const {
            const auto context = analysis::AnalysisContext::file_only(AnalyzerConfig{}, provider_);
            return detector_.analyze(tree, *context);
        }

        UnusedImportsDetector detector_;
        std::shared_ptr<syntax::InMemorySymbolProvider> provider_ = std::make_shared<syntax::InMemorySymbolProvider>();
    };

    TEST_F(UnusedImportsDetectorTest, Metadata) {
        EXPECT_EQ(detector_.name(), "unused-imports");
        EXPECT_EQ(detector_.kind(), FindingKind::UnusedImport);
    }

    TEST_F(UnusedImportsDetectorTest, ReportsEachUnusedBinding) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        syntax::ImportDeclaration import;
        import.specifier = "./b";
        import.bindings = {binding("x"), binding("y")};
        tree.imports.push_back(import);
        tree.references.push_back({.name = "y", .span = {}, .object = "", .enclosing = ""});

        const auto candidates = run(tree);
        ASSERT_EQ(candidates.size(), 1u);
        EXPECT_EQ(candidates[0].symbol_name, "x");
        EXPECT_EQ(candidates[0].kind, FindingKind::UnusedImport);
        EXPECT_EQ(candidates[0].span.column, 10);
        EXPECT_EQ(candidates[0].message, "Import 'x' from './b' is never used");
        EXPECT_TRUE(has_tag(candidates[0], "import"));
    }

    TEST_F(UnusedImportsDetectorTest, NamespaceUsedThroughMember) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        syntax::ImportDeclaration import;
        import.specifier = "./utils";
        import.bindings = {binding("utils", syntax::BindingKind::Namespace)};
        tree.imports.push_back(import);
        tree.references.push_back({.name = "format", .span = {}, .object = "utils", .enclosing = ""});

        EXPECT_TRUE(run(tree).empty());
    }

    TEST_F(UnusedImportsDetectorTest, KindTags) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        syntax::ImportDeclaration import;
        import.specifier = "react";
        import.bindings = {binding("React", syntax::BindingKind::Default), binding("ns", syntax::BindingKind::Namespace)};
        tree.imports.push_back(import);
        syntax::ImportDeclaration types;
        types.specifier = "./types";
        types.type_only = true;
        types.bindings = {binding("Props")};
        tree.imports.push_back(types);

        const auto candidates = run(tree);
        ASSERT_EQ(candidates.size(), 3u);
        EXPECT_TRUE(has_tag(candidates[0], "default"));
        EXPECT_TRUE(has_tag(candidates[1], "namespace"));
        EXPECT_TRUE(has_tag(candidates[2], "type-only"));
    }

    TEST_F(UnusedImportsDetectorTest, SideEffectImportIgnored) {
        syntax::SyntaxTree tree;
        tree.path = "a.ts";
        syntax::ImportDeclaration polyfill;
        polyfill.specifier = "./polyfill";
        tree.imports.push_back(polyfill);

        EXPECT_TRUE(run(tree).empty());
    }
}
