//
// Created by gregorian-rayne on 02/03/26.
//

#include <gtest/gtest.h>
#include "janitor/janitor.hpp"
#include "janitor/syntax/json_symbol_provider.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace janitor;

namespace {

    class ThrowsOnFileDetector : public detectors::IDetector {
    public:
        explicit ThrowsOnFileDetector(std::string target) : target_(std::move(target)) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "throws-on-file"; }
        [[nodiscard]] std::string_view description() const noexcept override { return "fails on one file"; }
        [[nodiscard]] FindingKind kind() const noexcept override { return FindingKind::DeadFunction; }

        [[nodiscard]] std::vector<analysis::Candidate> analyze(
            const syntax::SyntaxTree& tree, const analysis::AnalysisContext&) const override {
            if (tree.path == target_) {
                throw std::runtime_error("detector crashed on " + tree.path);
            }
            return {};
        }

    private:
        std::string target_;
    };

}  // namespace

class WorkspaceScenariosTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = fs::temp_directory_path() / ("janitor_workspace_scenarios_test_" + std::string(test->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir / "src");
        fs::create_directories(temp_dir / "ast");

        config.engine.workers = 4;
        config.engine.error_cooldown = Duration{1};
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void write_source(const std::string& file, const std::string& content, const nlohmann::json& tree) const {
        std::ofstream(temp_dir / "src" / file) << content;
        std::ofstream(temp_dir / "ast" / (file + ".json")) << tree.dump(2);
    }

    std::unique_ptr<workspace::WorkspaceOrchestrator> open_workspace() const {
        auto provider = std::make_shared<syntax::JsonSymbolProvider>(temp_dir / "ast", temp_dir / "src");
        auto orchestrator = std::make_unique<workspace::WorkspaceOrchestrator>(provider, config);
        const auto scanned = orchestrator->scan(temp_dir / "src");
        if (scanned.is_err()) {
            throw std::runtime_error(scanned.error().to_string());
        }
        return orchestrator;
    }

    static const FileAnalysisResult* find_result(const std::vector<FileAnalysisResult>& results,
                                                 const std::string& file) {
        for (const auto& result : results) {
            if (result.file == file) {
                return &result;
            }
        }
        return nullptr;
    }

    fs::path temp_dir;
    AnalyzerConfig config;
};

TEST_F(WorkspaceScenariosTest, MutualImportReportsOneDirectCycle) {
    write_source("a.ts", "import './b';\n", {{"imports", {{{"specifier", "./b"}, {"line", 1}, {"column", 1}}}}});
    write_source("b.ts", "import './a';\n", {{"imports", {{{"specifier", "./a"}, {"line", 1}, {"column", 1}}}}});

    auto orchestrator = open_workspace();
    const auto context = orchestrator->context();
    ASSERT_EQ(context->cycles().size(), 1u);
    EXPECT_TRUE(context->cycles()[0].is_direct);
    EXPECT_EQ(context->cycles()[0].node_set(), (std::vector<std::string>{"a.ts", "b.ts"}));

    const auto result = orchestrator->analyze_workspace();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().summary.issues_by_type.at("circular-dependency"), 2u);

    const auto* a = find_result(result.value().file_results, "a.ts");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->findings.size(), 1u);
    EXPECT_EQ(a->findings[0].kind, FindingKind::CircularDependency);
    EXPECT_EQ(a->findings[0].certainty, Certainty::High);
    EXPECT_FALSE(a->findings[0].safe_fix_available);
}

TEST_F(WorkspaceScenariosTest, UnreferencedPackageImportIsHighCertainty) {
    write_source("main.ts", "import { x } from 'm';\n",
                 {{"imports", {{{"specifier", "m"}, {"line", 1}, {"column", 1},
                                {"bindings", {{{"local", "x"}, {"imported", "x"}, {"kind", "named"},
                                               {"line", 1}, {"column", 10}}}}}}}});

    auto orchestrator = open_workspace();
    const auto result = orchestrator->analyze_workspace();
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().file_results.size(), 1u);

    const auto& findings = result.value().file_results[0].findings;
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].kind, FindingKind::UnusedImport);
    EXPECT_EQ(findings[0].certainty, Certainty::High);
    EXPECT_TRUE(findings[0].safe_fix_available);
    EXPECT_EQ(findings[0].symbol_name, "x");
    ASSERT_NE(findings[0].primary_location(), nullptr);
    EXPECT_EQ(findings[0].primary_location()->column, 10);
}

TEST_F(WorkspaceScenariosTest, ChangeToSharedFilePropagatesToDependents) {
    write_source("a.ts", "export const a = 1;\n", nlohmann::json::object());
    write_source("b.ts", "import './a';\n", {{"imports", {{{"specifier", "./a"}, {"line", 1}}}}});
    write_source("c.ts", "import './b';\n", {{"imports", {{{"specifier", "./b"}, {"line", 1}}}}});

    auto orchestrator = open_workspace();
    EXPECT_EQ(orchestrator->detect_module_structure(), 3u);

    const auto result = orchestrator->analyze_incremental(ChangeSet{.files = {"a.ts"}, .change_id = "edit-a"});
    ASSERT_TRUE(result.is_ok());

    const auto& affected = result.value().affected;
    EXPECT_EQ(affected.directly_affected, std::vector<std::string>{"a.ts"});
    EXPECT_EQ(affected.indirectly_affected, (std::vector<std::string>{"b.ts", "c.ts"}));
    EXPECT_EQ(affected.chains.at("c.ts"), (std::vector<std::string>{"a.ts", "b.ts", "c.ts"}));
    EXPECT_EQ(result.value().file_results.size(), 3u);
}

TEST_F(WorkspaceScenariosTest, RepeatedCommitIsACacheHit) {
    write_source("a.ts", "import { x } from './b';\n",
                 {{"imports", {{{"specifier", "./b"}, {"line", 1},
                                {"bindings", {{{"local", "x"}, {"line", 1}, {"column", 10}}}}}}}});
    write_source("b.ts", "export const x = 1;\n",
                 {{"declarations", {{{"name", "x"}, {"kind", "variable"}, {"exported", true}, {"line", 1}}}}});

    auto orchestrator = open_workspace();
    const CommitInfo commit{.repository = "web", .sha = "4f2a9c1", .branch = "main", .changed_files = {"a.ts", "b.ts"}};

    const auto first = orchestrator->analyze_commit(commit);
    ASSERT_TRUE(first.is_ok());
    const auto before = orchestrator->cache_stats();

    const auto second = orchestrator->analyze_commit(commit);
    ASSERT_TRUE(second.is_ok());
    const auto after = orchestrator->cache_stats();

    EXPECT_EQ(after.hits, before.hits + 1);
    EXPECT_EQ(after.misses, before.misses);
    EXPECT_EQ(second.value().summary.cached_files, 2u);
    EXPECT_EQ(second.value().summary.total_issues, first.value().summary.total_issues);

    // editing b.ts on disk misses the commit entry; a.ts does not depend on
    // b.ts, so its own entry is still served
    std::ofstream(temp_dir / "src" / "b.ts") << "export const x = 2;\n";
    const auto edited = orchestrator->analyze_commit(commit);
    ASSERT_TRUE(edited.is_ok());
    EXPECT_GT(orchestrator->cache_stats().misses, after.misses);

    const auto* b = find_result(edited.value().file_results, "b.ts");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->from_cache);
    const auto* a = find_result(edited.value().file_results, "a.ts");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->from_cache);
}

TEST_F(WorkspaceScenariosTest, ThrowingDetectorFailsOnlyItsFile) {
    auto provider = std::make_shared<syntax::InMemorySymbolProvider>();
    auto registry = detectors::DetectorRegistry::with_defaults();
    registry.register_detector(std::make_unique<ThrowsOnFileDetector>("x.ts"));

    workspace::WorkspaceOrchestrator orchestrator(provider, config, std::move(registry));
    for (int i = 0; i < 10; ++i) {
        syntax::SyntaxTree tree;
        tree.path = i == 9 ? "x.ts" : "f" + std::to_string(i) + ".ts";
        if (tree.path == "x.ts") {
            syntax::ImportDeclaration import;
            import.specifier = "lodash";
            import.span = {.line = 1, .column = 1, .end_line = 1, .end_column = 30};
            import.bindings.push_back({.local_name = "chunk", .imported_name = "chunk",
                                       .kind = syntax::BindingKind::Named, .type_only = false,
                                       .span = {.line = 1, .column = 10, .end_line = 1, .end_column = 15}});
            tree.imports.push_back(import);
        }
        provider->upsert(tree);
        orchestrator.register_source(tree.path, "hash-" + std::to_string(i));
    }

    Result<WorkspaceAnalysisResult, Error> result = Result<WorkspaceAnalysisResult, Error>::failure(
        Error::internal_error("not run"));
    ASSERT_NO_THROW(result = orchestrator.analyze_workspace());
    ASSERT_TRUE(result.is_ok());

    const auto& results = result.value().file_results;
    ASSERT_EQ(results.size(), 10u);
    std::size_t succeeded = 0;
    for (const auto& file : results) {
        if (file.success) {
            ++succeeded;
        }
    }
    EXPECT_EQ(succeeded, 9u);
    EXPECT_EQ(result.value().summary.failed_files, 1u);

    const auto* failed = find_result(results, "x.ts");
    ASSERT_NE(failed, nullptr);
    EXPECT_FALSE(failed->success);
    ASSERT_TRUE(failed->error.has_value());
    EXPECT_EQ(failed->error->code(), ErrorCode::DetectorError);
    // the detectors that ran before the throwing one keep their findings
    ASSERT_EQ(failed->findings.size(), 1u);
    EXPECT_EQ(failed->findings[0].kind, FindingKind::UnusedImport);
    EXPECT_EQ(failed->findings[0].symbol_name, "chunk");
    EXPECT_EQ(result.value().summary.total_issues, 1u);
    EXPECT_EQ(orchestrator.pool_stats().tasks_failed, 1u);
}
