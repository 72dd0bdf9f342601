//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_ORCHESTRATOR_HPP
#define JANITOR_ORCHESTRATOR_HPP

/**
 * @file orchestrator.hpp
 * @brief Wires sources, structure, scheduling and caching into analysis runs.
 *
 * Every run walks Idle -> Scanning -> Scheduling -> Aggregating and ends in
 * Done or Failed. In a full run, Scanning refreshes the source units (from
 * disk when the workspace was scanned) and brings the dependency graph and
 * reference index up to date. In an incremental run it is replaced by
 * change-scope resolution. Scheduling consults the result cache and queues
 * one task per remaining file. Aggregating waits for the tasks and folds
 * their results.
 *
 * The graph, the reference index and the cycle list are only written
 * between runs. Each structural change publishes a fresh immutable
 * AnalysisContext, which is what the workers read.
 *
 * Runs are serialised: calling a run from several threads is safe, but the
 * calls execute one after the other.
 *
 * Example:
 * @code
 * auto provider = std::make_shared<syntax::JsonSymbolProvider>("build/ast");
 * workspace::WorkspaceOrchestrator orchestrator(provider, config);
 * if (auto scanned = orchestrator.scan("src"); scanned.is_err()) {
 *     return scanned.error();
 * }
 * auto result = orchestrator.analyze_workspace();
 * @endcode
 */

#include "janitor/analysis/certainty_classifier.hpp"
#include "janitor/analysis/context.hpp"
#include "janitor/analysis/reference_index.hpp"
#include "janitor/cache/result_cache.hpp"
#include "janitor/config.hpp"
#include "janitor/detectors/detector.hpp"
#include "janitor/engine/file_analyzer.hpp"
#include "janitor/engine/worker_pool.hpp"
#include "janitor/graph/cycle_detection.hpp"
#include "janitor/graph/dependency_graph.hpp"
#include "janitor/scope/change_scope_resolver.hpp"
#include "janitor/scope/module_index.hpp"
#include "janitor/syntax/symbol_provider.hpp"
#include "janitor/workspace/source_registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace janitor::workspace {

    enum class RunState {
        Idle,
        Scanning,
        Scheduling,
        Aggregating,
        Done,
        Failed
    };

    [[nodiscard]] std::string_view to_string(RunState state) noexcept;

    struct IncrementalAnalysisResult {
        scope::AffectedSet affected;
        std::vector<FileAnalysisResult> file_results;
        AnalysisSummary summary;
    };

    class WorkspaceOrchestrator {
    public:
        using StateObserver = std::function<void(RunState)>;

        WorkspaceOrchestrator(std::shared_ptr<syntax::ISymbolProvider> provider,
                              AnalyzerConfig config,
                              detectors::DetectorRegistry registry = detectors::DetectorRegistry::with_defaults());
        ~WorkspaceOrchestrator();

        WorkspaceOrchestrator(const WorkspaceOrchestrator&) = delete;
        WorkspaceOrchestrator& operator=(const WorkspaceOrchestrator&) = delete;

        // -- source units ---------------------------------------------------

        /**
         * Discovers every source file under @p root. Later full runs rescan
         * the same root; incremental runs re-hash only the changed files.
         */
        Result<std::vector<std::string>, Error> scan(const fs::path& root);

        /**
         * Registers a unit directly, for embedders without a file system
         * view. A changed hash invalidates the cache entries of the file.
         */
        void register_source(const std::string& path, std::string content_hash);
        void remove_source(const std::string& path);

        [[nodiscard]] const SourceRegistry& sources() const noexcept { return sources_; }

        // -- analysis -------------------------------------------------------

        /**
         * Analyses one file against the current workspace snapshot. Parse and
         * detector failures are reported in the result; a SchedulerError is
         * returned only when the pool has been shut down.
         */
        Result<FileAnalysisResult, Error> analyze_file(const std::string& file);
        Result<FileAnalysisResult, Error> analyze_file(const std::string& file, const AnalyzerConfig& config);

        Result<WorkspaceAnalysisResult, Error> analyze_workspace();
        Result<WorkspaceAnalysisResult, Error> analyze_workspace(const AnalyzerConfig& config);

        /**
         * Re-analyses the modules affected by @p changes. Fails with
         * ScopeResolutionError when no module structure has been detected.
         */
        Result<IncrementalAnalysisResult, Error> analyze_incremental(const ChangeSet& changes);
        Result<IncrementalAnalysisResult, Error> analyze_incremental(const ChangeSet& changes,
                                                                     const AnalyzerConfig& config);

        /**
         * Analyses the files touched by a commit. The whole result is cached
         * under the repository and the touched files' hashes, so analysing
         * the same commit content twice is served from the cache.
         */
        Result<WorkspaceAnalysisResult, Error> analyze_commit(const CommitInfo& commit);

        // -- module structure -----------------------------------------------

        /**
         * Installs the configured modules, or one module per source file
         * when none are configured.
         *
         * @return Number of modules.
         */
        std::size_t detect_module_structure();
        void set_module_index(scope::ModuleIndex index);
        [[nodiscard]] bool has_module_structure() const;

        // -- cache, state and lifecycle -------------------------------------

        std::size_t invalidate(const std::vector<std::string>& paths);
        [[nodiscard]] cache::CacheStats cache_stats() const { return cache_.stats(); }

        [[nodiscard]] RunState state() const;
        void set_state_observer(StateObserver observer);

        /**
         * The snapshot the next run will use, bringing the structure up to
         * date first.
         */
        [[nodiscard]] std::shared_ptr<const analysis::AnalysisContext> context();

        [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }
        [[nodiscard]] engine::PoolStats pool_stats() const { return pool_->stats(); }

        /**
         * Stops the worker pool. Every later run fails with SchedulerError.
         */
        void shutdown();

    private:
        struct Scheduled {
            std::string file;
            std::string cache_key;
            std::vector<std::string> covering;
            std::optional<engine::TaskFuture> future;
            /// Submission time plus the task timeout.
            std::chrono::steady_clock::time_point deadline;
            std::optional<FileAnalysisResult> result;
        };

        void transition(RunState next);
        void apply_config(const AnalyzerConfig& config);

        template<typename T>
        Result<T, Error> fail_run(Error error);

        Result<void, Error> sync_sources();
        void refresh_changed(const std::vector<std::string>& files);
        void mark_changed(const std::string& path);
        void update_structure();
        void publish_context();
        [[nodiscard]] std::shared_ptr<const analysis::AnalysisContext> current_context() const;

        [[nodiscard]] std::string file_scope(const std::string& file) const;
        [[nodiscard]] cache::FileHashes hashes_of(const std::vector<std::string>& files) const;

        Result<FileAnalysisResult, Error> file_run(const std::string& file);
        Result<WorkspaceAnalysisResult, Error> workspace_run();
        Result<IncrementalAnalysisResult, Error> incremental_run(const ChangeSet& changes);
        Result<std::vector<FileAnalysisResult>, Error> run_files(const std::vector<std::string>& files);
        engine::TaskResult run_task(const engine::AnalysisTask& task) const;

        std::shared_ptr<syntax::ISymbolProvider> provider_;
        AnalyzerConfig config_;
        std::string fingerprint_;
        detectors::DetectorRegistry registry_;
        analysis::CertaintyClassifier classifier_;
        engine::FileAnalyzer analyzer_;

        SourceRegistry sources_;
        cache::ResultCache cache_;

        // structure, written only between runs
        graph::DependencyGraph graph_;
        analysis::ReferenceIndex references_;
        analysis::AnalysisContext::TreeMap trees_;
        std::vector<graph::Cycle> cycles_;
        std::set<std::string> pending_;
        bool structure_built_ = false;
        std::optional<scope::ModuleIndex> modules_;
        bool modules_per_file_ = false;

        mutable std::mutex context_mutex_;
        std::shared_ptr<const analysis::AnalysisContext> context_;
        std::uint64_t generation_ = 0;
        bool context_stale_ = true;

        mutable std::mutex run_mutex_;
        mutable std::mutex state_mutex_;
        RunState state_ = RunState::Idle;
        StateObserver observer_;
        std::uint64_t run_counter_ = 0;

        std::unique_ptr<engine::WorkerPool> pool_;
    };

}  // namespace janitor::workspace

#endif //JANITOR_ORCHESTRATOR_HPP
