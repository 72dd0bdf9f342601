//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/scope/module_index.hpp"

#include <gtest/gtest.h>

namespace janitor::scope
{
    class ModuleIndexTest : public ::testing::Test {
    protected:
        static ModuleDefinition module(const std::string& name, const std::string& path,
                                       std::vector<std::string> dependencies = {}) {
            return ModuleDefinition{.name = name, .path = path, .dependencies = std::move(dependencies)};
        }
    };

    TEST_F(ModuleIndexTest, LongestPrefixWins) {
        const ModuleIndex index({module("packages", "packages"), module("core", "packages/core/")});

        EXPECT_EQ(index.owning_module("packages/core/src/a.ts"), "core");
        EXPECT_EQ(index.owning_module("packages/ui/b.ts"), "packages");
        EXPECT_EQ(index.owning_module("tools/build.ts"), std::nullopt);
    }

    TEST_F(ModuleIndexTest, MatchesWholePathComponents) {
        const ModuleIndex index({module("core", "packages/core")});

        EXPECT_EQ(index.owning_module("packages/core-utils/x.ts"), std::nullopt);
        EXPECT_EQ(index.owning_module("./packages/core/x.ts"), "core");
    }

    TEST_F(ModuleIndexTest, AddReplacesByName) {
        ModuleIndex index;
        index.add(module("core", "old"));
        index.add(module("core", "packages/core"));

        EXPECT_EQ(index.size(), 1u);
        ASSERT_NE(index.find("core"), nullptr);
        EXPECT_EQ(index.find("core")->path, "packages/core");
        EXPECT_EQ(index.find("ui"), nullptr);
    }

    TEST_F(ModuleIndexTest, PerFileModules) {
        const auto index = ModuleIndex::per_file({"a.ts", "src/b.ts"});

        EXPECT_EQ(index.size(), 2u);
        EXPECT_EQ(index.owning_module("src/b.ts"), "src/b.ts");
        EXPECT_EQ(index.owning_module("src/c.ts"), std::nullopt);
    }

    TEST_F(ModuleIndexTest, LiftCollapsesFileEdges) {
        const ModuleIndex index({module("core", "core"), module("ui", "ui"), module("app", "app", {"ui", "missing"})});

        graph::DependencyGraph files;
        files.add_edge("ui/button.ts", "core/theme.ts");
        files.add_edge("core/theme.ts", "core/colors.ts");
        files.add_edge("ui/button.ts", "scripts/gen.ts");

        const auto modules = index.lift(files);
        EXPECT_EQ(modules.module_count(), 3u);
        EXPECT_TRUE(modules.has_edge("ui", "core"));
        EXPECT_TRUE(modules.has_edge("app", "ui"));
        EXPECT_FALSE(modules.has_edge("core", "core"));
        EXPECT_FALSE(modules.contains("missing"));
        EXPECT_EQ(modules.edge_count(), 2u);
    }
}
