//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/graph/dependency_graph.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace janitor::graph
{
    class DependencyGraphTest : public ::testing::Test {
    protected:
        DependencyGraph graph_;
    };

    TEST_F(DependencyGraphTest, EmptyGraph) {
        EXPECT_EQ(graph_.module_count(), 0u);
        EXPECT_EQ(graph_.edge_count(), 0u);
        EXPECT_TRUE(graph_.module_names().empty());
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, AddModuleIsIdempotent) {
        const auto first = graph_.add_module("a.ts");
        const auto second = graph_.add_module("a.ts");

        EXPECT_EQ(first, second);
        EXPECT_EQ(graph_.module_count(), 1u);
        EXPECT_EQ(graph_.name(first), "a.ts");
    }

    TEST_F(DependencyGraphTest, AddEdgeCreatesModules) {
        EXPECT_TRUE(graph_.add_edge("a.ts", "b.ts"));

        EXPECT_EQ(graph_.module_count(), 2u);
        EXPECT_EQ(graph_.edge_count(), 1u);
        EXPECT_TRUE(graph_.has_edge("a.ts", "b.ts"));
        EXPECT_FALSE(graph_.has_edge("b.ts", "a.ts"));
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, DuplicateEdgeIgnored) {
        EXPECT_TRUE(graph_.add_edge("a.ts", "b.ts"));
        EXPECT_FALSE(graph_.add_edge("a.ts", "b.ts"));

        EXPECT_EQ(graph_.edge_count(), 1u);
        EXPECT_EQ(graph_.dependents_of("b.ts").size(), 1u);
    }

    TEST_F(DependencyGraphTest, ForwardAndReverseViewsAgree) {
        graph_.add_edge("a.ts", "c.ts");
        graph_.add_edge("b.ts", "c.ts");
        graph_.add_edge("a.ts", "b.ts");

        EXPECT_EQ(graph_.dependencies_of("a.ts"), (std::vector<std::string>{"b.ts", "c.ts"}));
        EXPECT_EQ(graph_.dependents_of("c.ts"), (std::vector<std::string>{"a.ts", "b.ts"}));
        EXPECT_TRUE(graph_.dependents_of("a.ts").empty());
        EXPECT_TRUE(graph_.dependencies_of("unknown.ts").empty());
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, SelfLoop) {
        EXPECT_TRUE(graph_.add_edge("a.ts", "a.ts"));

        EXPECT_TRUE(graph_.has_edge("a.ts", "a.ts"));
        EXPECT_EQ(graph_.dependents_of("a.ts"), std::vector<std::string>{"a.ts"});
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, ClearDependencies) {
        graph_.add_edge("a.ts", "b.ts");
        graph_.add_edge("a.ts", "c.ts");
        graph_.add_edge("c.ts", "a.ts");

        graph_.clear_dependencies("a.ts");

        EXPECT_TRUE(graph_.dependencies_of("a.ts").empty());
        EXPECT_TRUE(graph_.dependents_of("b.ts").empty());
        EXPECT_EQ(graph_.dependents_of("a.ts"), std::vector<std::string>{"c.ts"});
        EXPECT_EQ(graph_.edge_count(), 1u);
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, RemoveModuleDropsBothDirections) {
        graph_.add_edge("a.ts", "b.ts");
        graph_.add_edge("b.ts", "c.ts");
        graph_.add_edge("b.ts", "b.ts");

        EXPECT_TRUE(graph_.remove_module("b.ts"));
        EXPECT_FALSE(graph_.remove_module("b.ts"));

        EXPECT_FALSE(graph_.contains("b.ts"));
        EXPECT_EQ(graph_.module_count(), 2u);
        EXPECT_EQ(graph_.edge_count(), 0u);
        EXPECT_TRUE(graph_.dependencies_of("a.ts").empty());
        EXPECT_TRUE(graph_.dependents_of("c.ts").empty());
        EXPECT_EQ(graph_.module_names(), (std::vector<std::string>{"a.ts", "c.ts"}));
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, RemovedModuleCanBeReAdded) {
        graph_.add_edge("a.ts", "b.ts");
        graph_.remove_module("b.ts");

        graph_.add_edge("a.ts", "b.ts");
        EXPECT_TRUE(graph_.has_edge("a.ts", "b.ts"));
        EXPECT_EQ(graph_.module_count(), 2u);
        EXPECT_TRUE(graph_.is_consistent());
    }

    TEST_F(DependencyGraphTest, EdgeToRemovedIdThrows) {
        const auto a = graph_.add_module("a.ts");
        const auto b = graph_.add_module("b.ts");
        graph_.remove_module("b.ts");

        EXPECT_FALSE(graph_.is_live(b));
        EXPECT_THROW(graph_.add_edge(a, b), std::out_of_range);
    }
}
