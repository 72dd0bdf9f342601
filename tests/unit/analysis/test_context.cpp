//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/analysis/context.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace janitor::analysis
{
    class AnalysisContextTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto graph = std::make_shared<graph::DependencyGraph>();
            graph->add_edge("a.ts", "b.ts");
            graph->add_edge("b.ts", "a.ts");
            graph->add_edge("c.ts", "b.ts");
            graph->add_edge("d.ts", "c.ts");

            AnalysisContext::Parts parts;
            parts.provider = provider_;
            parts.cycles = graph::find_cycles(*graph);
            parts.graph = std::move(graph);
            parts.references = std::make_shared<const ReferenceIndex>();
            parts.generation = 7;

            auto tree = std::make_shared<syntax::SyntaxTree>();
            tree->path = "a.ts";
            parts.trees.emplace("a.ts", std::move(tree));

            context_ = std::make_shared<const AnalysisContext>(std::move(parts));
        }

        std::shared_ptr<syntax::InMemorySymbolProvider> provider_ = std::make_shared<syntax::InMemorySymbolProvider>();
        std::shared_ptr<const AnalysisContext> context_;
    };

    TEST_F(AnalysisContextTest, RequiresProvider) {
        EXPECT_THROW((void)AnalysisContext(AnalysisContext::Parts{}), std::invalid_argument);
    }

    TEST_F(AnalysisContextTest, FileOnlyContext) {
        const auto context = AnalysisContext::file_only(AnalyzerConfig{}, provider_);

        EXPECT_FALSE(context->workspace_scope());
        EXPECT_EQ(context->references(), nullptr);
        EXPECT_EQ(context->graph().module_count(), 0u);
        EXPECT_TRUE(context->cycles().empty());
    }

    TEST_F(AnalysisContextTest, WorkspaceContext) {
        EXPECT_TRUE(context_->workspace_scope());
        EXPECT_EQ(context_->generation(), 7u);
        EXPECT_NE(context_->tree("a.ts"), nullptr);
        EXPECT_EQ(context_->tree("b.ts"), nullptr);
    }

    TEST_F(AnalysisContextTest, CyclesContaining) {
        EXPECT_EQ(context_->cycles_containing("a.ts").size(), 1u);
        EXPECT_EQ(context_->cycles_containing("b.ts").size(), 1u);
        EXPECT_TRUE(context_->cycles_containing("c.ts").empty());
    }

    TEST_F(AnalysisContextTest, CoveringFilesIncludeDirectDependentsAndCycleMembers) {
        EXPECT_EQ(context_->covering_files("b.ts"), (std::vector<std::string>{"a.ts", "b.ts", "c.ts"}));
        EXPECT_EQ(context_->covering_files("c.ts"), (std::vector<std::string>{"c.ts", "d.ts"}));
        EXPECT_EQ(context_->covering_files("d.ts"), std::vector<std::string>{"d.ts"});
    }
}
