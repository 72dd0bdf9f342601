//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/workspace/orchestrator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace janitor::workspace
{
    class SleepingDetector : public detectors::IDetector {
    public:
        explicit SleepingDetector(Duration delay) : delay_(delay) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "sleeping"; }
        [[nodiscard]] std::string_view description() const noexcept override { return "takes a while on every file"; }
        [[nodiscard]] FindingKind kind() const noexcept override { return FindingKind::HighComplexity; }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree&, const analysis::AnalysisContext&) const override {
            std::this_thread::sleep_for(delay_);
            return {};
        }

    private:
        Duration delay_;
    };

    class MockSymbolProvider : public syntax::ISymbolProvider {
    public:
        MOCK_METHOD((Result<syntax::SyntaxTree, Error>), parse, (const std::string& file), (const, override));
        MOCK_METHOD(std::vector<syntax::DeclarationSite>, resolve_symbol,
                    (const syntax::SyntaxTree& tree, const syntax::Reference& reference), (const, override));
        MOCK_METHOD(std::optional<std::string>, resolve_module,
                    (const std::string& from_file, const std::string& specifier), (const, override));

        void delegate_to(const std::shared_ptr<syntax::InMemorySymbolProvider>& real) {
            using ::testing::_;
            ON_CALL(*this, parse(_)).WillByDefault([real](const std::string& file) {
                return real->parse(file);
            });
            ON_CALL(*this, resolve_symbol(_, _)).WillByDefault(
                [real](const syntax::SyntaxTree& tree, const syntax::Reference& reference) {
                    return real->resolve_symbol(tree, reference);
                });
            ON_CALL(*this, resolve_module(_, _)).WillByDefault(
                [real](const std::string& from_file, const std::string& specifier) {
                    return real->resolve_module(from_file, specifier);
                });
        }
    };

    class OrchestratorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            // a.ts: import { x, y } from './b'; y();
            syntax::SyntaxTree a;
            a.path = "a.ts";
            syntax::ImportDeclaration import;
            import.specifier = "./b";
            import.bindings.push_back(binding("x", 10));
            import.bindings.push_back(binding("y", 13));
            a.imports.push_back(import);
            a.references.push_back({.name = "y", .span = {}, .object = "", .enclosing = ""});
            provider_->upsert(a);

            // b.ts: export const x = 1, y = 2;
            syntax::SyntaxTree b;
            b.path = "b.ts";
            b.declarations.push_back(exported_const("x"));
            b.declarations.push_back(exported_const("y"));
            provider_->upsert(b);

            config_.engine.workers = 2;
            config_.engine.error_cooldown = Duration{1};
        }

        static syntax::ImportBinding binding(const std::string& name, int column) {
            return {.local_name = name, .imported_name = name, .kind = syntax::BindingKind::Named,
                    .type_only = false, .span = {.line = 1, .column = column, .end_line = 1, .end_column = column + 1}};
        }

        static syntax::Declaration exported_const(const std::string& name) {
            syntax::Declaration d;
            d.name = name;
            d.kind = syntax::DeclarationKind::Variable;
            d.exported = true;
            d.span = {.line = 1, .column = 14, .end_line = 1, .end_column = 15};
            return d;
        }

        std::unique_ptr<WorkspaceOrchestrator> make_orchestrator() const {
            auto orchestrator = std::make_unique<WorkspaceOrchestrator>(provider_, config_);
            orchestrator->register_source("a.ts", "hash-a");
            orchestrator->register_source("b.ts", "hash-b");
            return orchestrator;
        }

        static const FileAnalysisResult& result_for(const std::vector<FileAnalysisResult>& results,
                                                    const std::string& file) {
            for (const auto& result : results) {
                if (result.file == file) {
                    return result;
                }
            }
            throw std::out_of_range("no result for " + file);
        }

        std::shared_ptr<syntax::InMemorySymbolProvider> provider_ = std::make_shared<syntax::InMemorySymbolProvider>();
        AnalyzerConfig config_;
    };

    TEST_F(OrchestratorTest, RequiresProvider) {
        EXPECT_THROW((void)WorkspaceOrchestrator(nullptr, AnalyzerConfig{}), std::invalid_argument);
    }

    TEST_F(OrchestratorTest, AnalyzeWorkspaceRunsThroughEveryState) {
        auto orchestrator = make_orchestrator();
        std::vector<RunState> states;
        orchestrator->set_state_observer([&states](RunState state) { states.push_back(state); });

        const auto result = orchestrator->analyze_workspace();
        ASSERT_TRUE(result.is_ok());

        EXPECT_EQ(states, (std::vector<RunState>{RunState::Scanning, RunState::Scheduling,
                                                 RunState::Aggregating, RunState::Done}));
        EXPECT_EQ(orchestrator->state(), RunState::Done);

        const auto& summary = result.value().summary;
        EXPECT_EQ(summary.total_files, 2u);
        EXPECT_EQ(summary.failed_files, 0u);
        EXPECT_EQ(summary.total_issues, 1u);

        const auto& a = result_for(result.value().file_results, "a.ts");
        ASSERT_EQ(a.findings.size(), 1u);
        EXPECT_EQ(a.findings[0].symbol_name, "x");
        EXPECT_EQ(a.findings[0].kind, FindingKind::UnusedImport);
        EXPECT_TRUE(result_for(result.value().file_results, "b.ts").findings.empty());
    }

    TEST_F(OrchestratorTest, SecondRunServedFromCache) {
        auto orchestrator = make_orchestrator();
        ASSERT_TRUE(orchestrator->analyze_workspace().is_ok());

        const auto again = orchestrator->analyze_workspace();
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value().summary.cached_files, 2u);
        EXPECT_EQ(again.value().summary.total_issues, 1u);
        for (const auto& result : again.value().file_results) {
            EXPECT_TRUE(result.from_cache) << result.file;
        }
        EXPECT_EQ(orchestrator->cache_stats().hits, 2u);
    }

    TEST_F(OrchestratorTest, ChangedSourceInvalidatesDependentEntries) {
        auto orchestrator = make_orchestrator();
        ASSERT_TRUE(orchestrator->analyze_workspace().is_ok());

        // b.ts is covered by its own entry only; a.ts entry does not depend on it
        orchestrator->register_source("b.ts", "hash-b2");
        const auto after_b = orchestrator->analyze_workspace();
        ASSERT_TRUE(after_b.is_ok());
        EXPECT_TRUE(result_for(after_b.value().file_results, "a.ts").from_cache);
        EXPECT_FALSE(result_for(after_b.value().file_results, "b.ts").from_cache);

        // a.ts imports b.ts, so it is part of b.ts's covering set
        orchestrator->register_source("a.ts", "hash-a2");
        const auto after_a = orchestrator->analyze_workspace();
        ASSERT_TRUE(after_a.is_ok());
        EXPECT_EQ(after_a.value().summary.cached_files, 0u);

        // re-registering identical content changes nothing
        orchestrator->register_source("a.ts", "hash-a2");
        const auto unchanged = orchestrator->analyze_workspace();
        ASSERT_TRUE(unchanged.is_ok());
        EXPECT_EQ(unchanged.value().summary.cached_files, 2u);
    }

    TEST_F(OrchestratorTest, FreshAnalysisReproducesFindingIds) {
        auto orchestrator = make_orchestrator();
        const auto first = orchestrator->analyze_workspace();
        ASSERT_TRUE(first.is_ok());

        orchestrator->invalidate({"a.ts", "b.ts"});
        const auto second = orchestrator->analyze_workspace();
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(second.value().summary.cached_files, 0u);

        auto ids = [](const WorkspaceAnalysisResult& workspace) {
            std::vector<std::string> result;
            for (const auto& file : workspace.file_results) {
                for (const auto& finding : file.findings) {
                    result.push_back(finding.id);
                }
            }
            std::ranges::sort(result);
            return result;
        };
        EXPECT_FALSE(ids(first.value()).empty());
        EXPECT_EQ(ids(first.value()), ids(second.value()));

        auto other = make_orchestrator();
        const auto third = other->analyze_workspace();
        ASSERT_TRUE(third.is_ok());
        EXPECT_EQ(ids(first.value()), ids(third.value()));
    }

    TEST_F(OrchestratorTest, UnresolvedReferenceHolderCoversExportEntry) {
        // util.ts: export const foo = 1;  caller.ts: foo(); with no import
        syntax::SyntaxTree util;
        util.path = "util.ts";
        util.declarations.push_back(exported_const("foo"));
        provider_->upsert(util);

        syntax::SyntaxTree caller;
        caller.path = "caller.ts";
        caller.references.push_back({.name = "foo", .span = {}, .object = "", .enclosing = ""});
        provider_->upsert(caller);

        auto orchestrator = make_orchestrator();
        orchestrator->register_source("util.ts", "hash-util");
        orchestrator->register_source("caller.ts", "hash-caller");

        const auto first = orchestrator->analyze_workspace();
        ASSERT_TRUE(first.is_ok());
        EXPECT_TRUE(result_for(first.value().file_results, "util.ts").findings.empty());

        const auto covering = orchestrator->context()->covering_files("util.ts");
        EXPECT_NE(std::ranges::find(covering, std::string("caller.ts")), covering.end());

        caller.references.clear();
        provider_->upsert(caller);
        orchestrator->register_source("caller.ts", "hash-caller2");

        const auto second = orchestrator->analyze_workspace();
        ASSERT_TRUE(second.is_ok());
        const auto& after = result_for(second.value().file_results, "util.ts");
        EXPECT_FALSE(after.from_cache);
        ASSERT_EQ(after.findings.size(), 1u);
        EXPECT_EQ(after.findings[0].kind, FindingKind::DeadExport);
        EXPECT_EQ(after.findings[0].symbol_name, "foo");
    }

    TEST_F(OrchestratorTest, NewReferenceHolderMissesExportEntry) {
        syntax::SyntaxTree util;
        util.path = "util.ts";
        util.declarations.push_back(exported_const("foo"));
        provider_->upsert(util);

        syntax::SyntaxTree caller;
        caller.path = "caller.ts";
        provider_->upsert(caller);

        auto orchestrator = make_orchestrator();
        orchestrator->register_source("util.ts", "hash-util");
        orchestrator->register_source("caller.ts", "hash-caller");

        const auto first = orchestrator->analyze_workspace();
        ASSERT_TRUE(first.is_ok());
        EXPECT_EQ(result_for(first.value().file_results, "util.ts").findings.size(), 1u);

        caller.references.push_back({.name = "foo", .span = {}, .object = "", .enclosing = ""});
        provider_->upsert(caller);
        orchestrator->register_source("caller.ts", "hash-caller2");

        const auto second = orchestrator->analyze_workspace();
        ASSERT_TRUE(second.is_ok());
        const auto& after = result_for(second.value().file_results, "util.ts");
        EXPECT_FALSE(after.from_cache);
        EXPECT_TRUE(after.findings.empty());
    }

    TEST_F(OrchestratorTest, InvalidateReturnsRemovedEntries) {
        auto orchestrator = make_orchestrator();
        ASSERT_TRUE(orchestrator->analyze_workspace().is_ok());

        EXPECT_EQ(orchestrator->invalidate({"a.ts"}), 2u);
        EXPECT_EQ(orchestrator->cache_stats().total_entries, 0u);
    }

    TEST_F(OrchestratorTest, ContextReflectsStructure) {
        auto orchestrator = make_orchestrator();
        const auto context = orchestrator->context();

        ASSERT_NE(context, nullptr);
        EXPECT_TRUE(context->workspace_scope());
        EXPECT_TRUE(context->graph().has_edge("a.ts", "b.ts"));
        EXPECT_NE(context->tree("b.ts"), nullptr);
        EXPECT_TRUE(context->cycles().empty());

        // nothing changed, so the snapshot is reused
        EXPECT_EQ(orchestrator->context(), context);
    }

    TEST_F(OrchestratorTest, IncrementalRequiresModuleStructure) {
        auto orchestrator = make_orchestrator();
        EXPECT_FALSE(orchestrator->has_module_structure());

        const auto result = orchestrator->analyze_incremental(ChangeSet{.files = {"b.ts"}, .change_id = "c1"});
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ScopeResolutionError);
        EXPECT_EQ(orchestrator->state(), RunState::Failed);
    }

    TEST_F(OrchestratorTest, IncrementalAnalysesAffectedModules) {
        auto orchestrator = make_orchestrator();
        EXPECT_EQ(orchestrator->detect_module_structure(), 2u);
        EXPECT_TRUE(orchestrator->has_module_structure());

        const auto leaf = orchestrator->analyze_incremental(ChangeSet{.files = {"a.ts"}, .change_id = "c1"});
        ASSERT_TRUE(leaf.is_ok());
        EXPECT_EQ(leaf.value().affected.all_affected, std::vector<std::string>{"a.ts"});
        EXPECT_EQ(leaf.value().file_results.size(), 1u);

        const auto shared = orchestrator->analyze_incremental(ChangeSet{.files = {"b.ts"}, .change_id = "c2"});
        ASSERT_TRUE(shared.is_ok());
        EXPECT_EQ(shared.value().affected.directly_affected, std::vector<std::string>{"b.ts"});
        EXPECT_EQ(shared.value().affected.indirectly_affected, std::vector<std::string>{"a.ts"});
        EXPECT_EQ(shared.value().file_results.size(), 2u);
        EXPECT_EQ(shared.value().summary.total_issues, 1u);
    }

    TEST_F(OrchestratorTest, IncrementalReanalysesImportersOfDeletedFile) {
        auto orchestrator = make_orchestrator();
        orchestrator->detect_module_structure();
        ASSERT_TRUE(orchestrator->analyze_workspace().is_ok());

        provider_->remove("b.ts");
        orchestrator->remove_source("b.ts");

        const auto result = orchestrator->analyze_incremental(ChangeSet{.files = {"b.ts"}, .change_id = "c3"});
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().affected.directly_affected, std::vector<std::string>{"a.ts"});
        ASSERT_EQ(result.value().file_results.size(), 1u);
        EXPECT_EQ(result.value().file_results[0].file, "a.ts");
        EXPECT_TRUE(result.value().file_results[0].success);
    }

    TEST_F(OrchestratorTest, ConfiguredModulesUsed) {
        config_.modules = {ModuleDefinition{.name = "root", .path = ".", .dependencies = {}}};
        auto orchestrator = make_orchestrator();

        EXPECT_EQ(orchestrator->detect_module_structure(), 1u);
        const auto result = orchestrator->analyze_incremental(ChangeSet{.files = {"a.ts"}, .change_id = "c1"});
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().affected.all_affected, std::vector<std::string>{"root"});
        EXPECT_EQ(result.value().file_results.size(), 2u);
    }

    TEST_F(OrchestratorTest, CommitCachedOnSecondAnalysis) {
        auto orchestrator = make_orchestrator();
        const CommitInfo commit{.repository = "web", .sha = "abc123", .branch = "main", .changed_files = {"a.ts"}};

        const auto first = orchestrator->analyze_commit(commit);
        ASSERT_TRUE(first.is_ok());
        ASSERT_EQ(first.value().file_results.size(), 1u);
        EXPECT_FALSE(first.value().file_results[0].from_cache);
        EXPECT_EQ(first.value().summary.total_issues, 1u);

        const auto second = orchestrator->analyze_commit(commit);
        ASSERT_TRUE(second.is_ok());
        ASSERT_EQ(second.value().file_results.size(), 1u);
        EXPECT_TRUE(second.value().file_results[0].from_cache);
        EXPECT_EQ(second.value().file_results[0].findings, first.value().file_results[0].findings);
    }

    TEST_F(OrchestratorTest, AnalyzeFileWithOverriddenConfig) {
        auto orchestrator = make_orchestrator();

        const auto result = orchestrator->analyze_file("a.ts");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().findings.size(), 1u);

        AnalyzerConfig quiet = config_;
        quiet.detectors.unused_imports = false;
        const auto silenced = orchestrator->analyze_file("a.ts", quiet);
        ASSERT_TRUE(silenced.is_ok());
        EXPECT_FALSE(silenced.value().from_cache);
        EXPECT_TRUE(silenced.value().findings.empty());
    }

    TEST_F(OrchestratorTest, ParseFailureReportedPerFile) {
        provider_->fail_parse("c.ts", "unexpected token");
        auto orchestrator = make_orchestrator();
        orchestrator->register_source("c.ts", "hash-c");

        const auto result = orchestrator->analyze_workspace();
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().summary.total_files, 3u);
        EXPECT_EQ(result.value().summary.failed_files, 1u);

        const auto& c = result_for(result.value().file_results, "c.ts");
        EXPECT_FALSE(c.success);
        ASSERT_TRUE(c.error.has_value());
        EXPECT_EQ(c.error->code(), ErrorCode::ParseError);
    }

    TEST_F(OrchestratorTest, TaskTimeoutCountsFromSubmission) {
        // one worker runs the files back to back; the second one finishes
        // after its own deadline even though it was waited on for less
        config_.engine.workers = 1;
        config_.engine.task_timeout = Duration{600};
        auto registry = detectors::DetectorRegistry::with_defaults();
        registry.register_detector(std::make_unique<SleepingDetector>(Duration{400}));

        WorkspaceOrchestrator orchestrator(provider_, config_, std::move(registry));
        orchestrator.register_source("a.ts", "hash-a");
        orchestrator.register_source("b.ts", "hash-b");

        const auto result = orchestrator.analyze_workspace();
        ASSERT_TRUE(result.is_ok());

        EXPECT_TRUE(result_for(result.value().file_results, "a.ts").success);
        const auto& b = result_for(result.value().file_results, "b.ts");
        EXPECT_FALSE(b.success);
        ASSERT_TRUE(b.error.has_value());
        EXPECT_EQ(b.error->code(), ErrorCode::SchedulerError);
        EXPECT_EQ(b.error->message(), "analysis timed out");
    }

    TEST_F(OrchestratorTest, ShutdownFailsLaterRuns) {
        auto orchestrator = make_orchestrator();
        EXPECT_EQ(orchestrator->pool_stats().workers, 2u);

        orchestrator->shutdown();
        const auto result = orchestrator->analyze_workspace();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::SchedulerError);
        EXPECT_EQ(orchestrator->state(), RunState::Failed);
    }

    TEST_F(OrchestratorTest, OnlyChangedFilesAreReparsed) {
        auto mock = std::make_shared<::testing::NiceMock<MockSymbolProvider>>();
        mock->delegate_to(provider_);
        EXPECT_CALL(*mock, parse("a.ts")).Times(1);
        EXPECT_CALL(*mock, parse("b.ts")).Times(2);

        WorkspaceOrchestrator orchestrator(mock, config_);
        orchestrator.register_source("a.ts", "hash-a");
        orchestrator.register_source("b.ts", "hash-b");

        ASSERT_TRUE(orchestrator.analyze_workspace().is_ok());
        ASSERT_TRUE(orchestrator.analyze_workspace().is_ok());

        orchestrator.register_source("b.ts", "hash-b2");
        const auto result = orchestrator.analyze_workspace();
        ASSERT_TRUE(result.is_ok());
        EXPECT_THAT(result.value().file_results,
                    ::testing::Each(::testing::Field(&FileAnalysisResult::success, true)));
    }

    TEST_F(OrchestratorTest, StateNames) {
        EXPECT_EQ(to_string(RunState::Aggregating), "aggregating");
        EXPECT_EQ(to_string(RunState::Failed), "failed");
    }
}
