//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/analysis/reference_index.hpp"

#include <gtest/gtest.h>

namespace janitor::analysis
{
    class ReferenceIndexTest : public ::testing::Test {
    protected:
        static syntax::ImportDeclaration named_import(const std::string& specifier,
                                                      const std::string& name,
                                                      syntax::BindingKind kind = syntax::BindingKind::Named) {
            syntax::ImportDeclaration import;
            import.specifier = specifier;
            import.bindings.push_back({.local_name = name,
                                       .imported_name = kind == syntax::BindingKind::Named ? name : "default",
                                       .kind = kind, .type_only = false, .span = {}});
            return import;
        }

        void SetUp() override {
            // b.ts declares helper and Widget; a.ts imports helper from ./b
            syntax::SyntaxTree b;
            b.path = "b.ts";
            b.declarations.push_back({.name = "helper", .kind = syntax::DeclarationKind::Function, .exported = true});
            b.declarations.push_back({.name = "Widget", .kind = syntax::DeclarationKind::Class, .exported = true});
            b.declarations.push_back({.name = "unused", .kind = syntax::DeclarationKind::Function, .exported = true});
            trees_.push_back(b);

            syntax::SyntaxTree a;
            a.path = "a.ts";
            a.imports.push_back(named_import("./b", "helper"));
            a.references.push_back({.name = "helper", .span = {}, .object = "", .enclosing = "main"});
            trees_.push_back(a);

            syntax::SyntaxTree c;
            c.path = "c.ts";
            c.declarations.push_back({.name = "unused", .kind = syntax::DeclarationKind::Function});
            c.references.push_back({.name = "unused", .span = {}, .object = "", .enclosing = ""});
            trees_.push_back(c);

            for (const auto& tree : trees_) {
                provider_.upsert(tree);
            }
            for (const auto& tree : trees_) {
                index_.add_file(tree, provider_);
            }
        }

        syntax::InMemorySymbolProvider provider_;
        std::vector<syntax::SyntaxTree> trees_;
        ReferenceIndex index_;
    };

    TEST_F(ReferenceIndexTest, ImportedNameIsReferencedExternally) {
        EXPECT_TRUE(index_.is_referenced_externally("helper", "b.ts"));
        EXPECT_EQ(index_.referencing_files("helper", "b.ts"), std::vector<std::string>{"a.ts"});
    }

    TEST_F(ReferenceIndexTest, UnreferencedExport) {
        EXPECT_FALSE(index_.is_referenced_externally("Widget", "b.ts"));
    }

    TEST_F(ReferenceIndexTest, SameNameInAnotherFileDoesNotCount) {
        // c.ts uses its own "unused", which resolves to c.ts
        EXPECT_FALSE(index_.is_referenced_externally("unused", "b.ts"));
        EXPECT_TRUE(index_.is_name_used_elsewhere("unused", "b.ts"));
    }

    TEST_F(ReferenceIndexTest, FilesMentioningIgnoresResolution) {
        EXPECT_EQ(index_.files_mentioning("unused", "b.ts"), std::vector<std::string>{"c.ts"});
        EXPECT_EQ(index_.files_mentioning("helper", "b.ts"), std::vector<std::string>{"a.ts"});
        EXPECT_TRUE(index_.files_mentioning("unused", "c.ts").empty());
        EXPECT_TRUE(index_.files_mentioning("Widget", "b.ts").empty());
    }

    TEST_F(ReferenceIndexTest, OwnFileDoesNotCount) {
        EXPECT_FALSE(index_.is_referenced_externally("unused", "c.ts"));
        EXPECT_FALSE(index_.is_name_used_elsewhere("unused", "c.ts"));
    }

    TEST_F(ReferenceIndexTest, NamespaceImportCoversEveryExport) {
        syntax::SyntaxTree d;
        d.path = "d.ts";
        d.imports.push_back(named_import("./b", "B", syntax::BindingKind::Namespace));
        d.imports.back().bindings.back().imported_name = "*";
        provider_.upsert(d);
        index_.add_file(d, provider_);

        EXPECT_TRUE(index_.is_referenced_externally("Widget", "b.ts"));
        EXPECT_FALSE(index_.is_referenced_externally("Widget", "c.ts"));
    }

    TEST_F(ReferenceIndexTest, DefaultImport) {
        syntax::SyntaxTree d;
        d.path = "d.ts";
        d.imports.push_back(named_import("./b", "Thing", syntax::BindingKind::Default));
        provider_.upsert(d);
        index_.add_file(d, provider_);

        EXPECT_TRUE(index_.is_referenced_externally("default", "b.ts"));
        EXPECT_FALSE(index_.is_referenced_externally("Thing", "b.ts"));
    }

    TEST_F(ReferenceIndexTest, ReExportCountsAsReference) {
        syntax::SyntaxTree barrel;
        barrel.path = "index.ts";
        barrel.reexports.push_back({.specifier = "./b", .names = {"Widget"}, .span = {}});
        provider_.upsert(barrel);
        index_.add_file(barrel, provider_);

        EXPECT_TRUE(index_.is_referenced_externally("Widget", "b.ts"));
    }

    TEST_F(ReferenceIndexTest, RemoveFile) {
        index_.remove_file("a.ts");

        EXPECT_FALSE(index_.contains_file("a.ts"));
        EXPECT_FALSE(index_.is_referenced_externally("helper", "b.ts"));
        EXPECT_EQ(index_.file_count(), 2u);
    }

    TEST_F(ReferenceIndexTest, ReAddingFileReplacesItsOccurrences) {
        const auto before = index_.occurrence_count("helper");
        index_.add_file(trees_[1], provider_);

        EXPECT_EQ(index_.occurrence_count("helper"), before);
    }
}
