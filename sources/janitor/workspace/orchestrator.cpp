//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/workspace/orchestrator.hpp"
#include "janitor/graph/graph_builder.hpp"
#include "janitor/logging.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <ranges>
#include <stdexcept>

namespace janitor::workspace {

    std::string_view to_string(const RunState state) noexcept {
        switch (state) {
            case RunState::Idle:        return "idle";
            case RunState::Scanning:    return "scanning";
            case RunState::Scheduling:  return "scheduling";
            case RunState::Aggregating: return "aggregating";
            case RunState::Done:        return "done";
            case RunState::Failed:      return "failed";
        }
        return "unknown";
    }

    WorkspaceOrchestrator::WorkspaceOrchestrator(std::shared_ptr<syntax::ISymbolProvider> provider,
                                                 AnalyzerConfig config,
                                                 detectors::DetectorRegistry registry)
        : provider_(std::move(provider))
        , config_(std::move(config))
        , fingerprint_(config_.fingerprint())
        , registry_(std::move(registry))
        , analyzer_(registry_, classifier_)
        , cache_([this](const std::string& file) { return sources_.current_hash(file); },
                 config_.engine.cache_ttl) {
        if (!provider_) {
            throw std::invalid_argument("WorkspaceOrchestrator requires a symbol provider");
        }

        pool_ = std::make_unique<engine::WorkerPool>(
            [this](const engine::AnalysisTask& task) { return run_task(task); },
            engine::WorkerPoolOptions{
                .worker_count = config_.engine.workers,
                .error_cooldown = config_.engine.error_cooldown,
            });

        log::logger()->debug("[orchestrator] {} worker(s), {} detector(s)", pool_->size(), registry_.size());
    }

    WorkspaceOrchestrator::~WorkspaceOrchestrator() {
        // workers call back into this object, so they go first
        pool_.reset();
    }

    // -- state --------------------------------------------------------------

    RunState WorkspaceOrchestrator::state() const {
        std::lock_guard lock(state_mutex_);
        return state_;
    }

    void WorkspaceOrchestrator::set_state_observer(StateObserver observer) {
        std::lock_guard lock(state_mutex_);
        observer_ = std::move(observer);
    }

    void WorkspaceOrchestrator::transition(const RunState next) {
        StateObserver observer;
        {
            std::lock_guard lock(state_mutex_);
            state_ = next;
            observer = observer_;
        }
        log::logger()->debug("[orchestrator] -> {}", to_string(next));
        if (observer) {
            observer(next);
        }
    }

    template<typename T>
    Result<T, Error> WorkspaceOrchestrator::fail_run(Error error) {
        log::logger()->error("[orchestrator] run failed: {}", error.to_string());
        transition(RunState::Failed);
        return Result<T, Error>::failure(std::move(error));
    }

    void WorkspaceOrchestrator::apply_config(const AnalyzerConfig& config) {
        auto fingerprint = config.fingerprint();
        if (fingerprint == fingerprint_ && config.ignore_patterns == config_.ignore_patterns &&
            config.source_extensions == config_.source_extensions) {
            return;
        }
        // engine options are fixed at construction; the pool is not rebuilt
        config_ = config;
        fingerprint_ = std::move(fingerprint);
        if (modules_ && !modules_per_file_ && !config_.modules.empty()) {
            modules_ = scope::ModuleIndex(config_.modules);
        }
        context_stale_ = true;
    }

    // -- source units -------------------------------------------------------

    Result<std::vector<std::string>, Error> WorkspaceOrchestrator::scan(const fs::path& root) {
        std::lock_guard lock(run_mutex_);
        auto scanned = sources_.scan(root, config_);
        if (scanned.is_err()) {
            return scanned;
        }

        // a new root replaces the whole structure
        structure_built_ = false;
        pending_.clear();
        log::logger()->info("[scan] {} source file(s) under {}", scanned.value().size(), root.string());
        return scanned;
    }

    void WorkspaceOrchestrator::register_source(const std::string& path, std::string content_hash) {
        std::lock_guard lock(run_mutex_);
        if (sources_.upsert(path, std::move(content_hash))) {
            mark_changed(path);
        }
    }

    void WorkspaceOrchestrator::remove_source(const std::string& path) {
        std::lock_guard lock(run_mutex_);
        if (sources_.remove(path)) {
            mark_changed(path);
        }
    }

    void WorkspaceOrchestrator::mark_changed(const std::string& path) {
        pending_.insert(path);
        cache_.invalidate({path});
    }

    Result<void, Error> WorkspaceOrchestrator::sync_sources() {
        const auto root = sources_.root();
        if (!root) {
            return Result<void, Error>::success();
        }

        const auto before = sources_.units();
        auto scanned = sources_.scan(*root, config_);
        if (scanned.is_err()) {
            return Result<void, Error>::failure(scanned.error());
        }

        std::map<std::string, std::string> previous;
        for (const auto& unit : before) {
            previous.emplace(unit.path, unit.content_hash);
        }
        for (const auto& unit : sources_.units()) {
            const auto it = previous.find(unit.path);
            if (it == previous.end() || it->second != unit.content_hash) {
                mark_changed(unit.path);
            }
            if (it != previous.end()) {
                previous.erase(it);
            }
        }
        for (const auto& path : previous | std::views::keys) {
            mark_changed(path);
        }
        return Result<void, Error>::success();
    }

    void WorkspaceOrchestrator::refresh_changed(const std::vector<std::string>& files) {
        const bool on_disk = sources_.root().has_value();
        for (const auto& file : files) {
            if (on_disk) {
                auto refreshed = sources_.refresh(file);
                if (refreshed.is_err()) {
                    log::logger()->warn("[scan] cannot refresh {}: {}", file, refreshed.error().to_string());
                } else if (refreshed.value()) {
                    cache_.invalidate({file});
                }
            }
            // re-parse even when the hash is unchanged; the provider may
            // have been updated independently
            pending_.insert(file);
        }
    }

    // -- structure ----------------------------------------------------------

    void WorkspaceOrchestrator::update_structure() {
        const graph::GraphBuilder builder(*provider_);

        if (!structure_built_) {
            auto built = builder.build(sources_.files());
            graph_ = std::move(built.graph);
            trees_ = std::move(built.trees);
            cycles_ = std::move(built.cycles);

            references_ = analysis::ReferenceIndex{};
            for (const auto& tree : trees_ | std::views::values) {
                references_.add_file(*tree, *provider_);
            }
            for (const auto& [file, error] : built.failures) {
                log::logger()->warn("[structure] {} could not be parsed: {}", file, error.to_string());
            }

            pending_.clear();
            structure_built_ = true;
            context_stale_ = true;
        } else if (!pending_.empty()) {
            bool membership_changed = false;
            std::vector<std::string> reparsed;

            for (const auto& file : pending_) {
                if (!sources_.contains(file)) {
                    membership_changed |= graph_.remove_module(file);
                    trees_.erase(file);
                    references_.remove_file(file);
                    continue;
                }

                membership_changed |= !graph_.contains(file);
                auto parsed = provider_->parse(file);
                if (parsed.is_err()) {
                    log::logger()->warn("[structure] {} could not be parsed: {}", file, parsed.error().to_string());
                    trees_.erase(file);
                    references_.remove_file(file);
                    graph_.add_module(file);
                    graph_.clear_dependencies(file);
                    continue;
                }
                trees_[file] = std::make_shared<const syntax::SyntaxTree>(std::move(parsed).value());
                reparsed.push_back(file);
            }

            // an added or removed file can change how other files' imports
            // resolve, so every file is re-linked then
            if (membership_changed) {
                for (const auto& tree : trees_ | std::views::values) {
                    builder.register_file(graph_, *tree);
                    references_.add_file(*tree, *provider_);
                }
            } else {
                for (const auto& file : reparsed) {
                    builder.register_file(graph_, *trees_.at(file));
                    references_.add_file(*trees_.at(file), *provider_);
                }
            }

            cycles_ = graph::find_cycles(graph_);
            log::logger()->debug("[structure] updated {} file(s), {} cycle(s)", pending_.size(), cycles_.size());
            pending_.clear();
            context_stale_ = true;
        }

        if (modules_per_file_) {
            modules_ = scope::ModuleIndex::per_file(sources_.files());
        }
        if (context_stale_) {
            publish_context();
        }
    }

    void WorkspaceOrchestrator::publish_context() {
        analysis::AnalysisContext::Parts parts;
        parts.config = config_;
        parts.provider = provider_;
        parts.graph = std::make_shared<const graph::DependencyGraph>(graph_);
        parts.cycles = cycles_;
        parts.references = std::make_shared<const analysis::ReferenceIndex>(references_);
        parts.trees = trees_;
        parts.generation = ++generation_;

        auto snapshot = std::make_shared<const analysis::AnalysisContext>(std::move(parts));
        std::lock_guard lock(context_mutex_);
        context_ = std::move(snapshot);
        context_stale_ = false;
    }

    std::shared_ptr<const analysis::AnalysisContext> WorkspaceOrchestrator::current_context() const {
        std::lock_guard lock(context_mutex_);
        return context_;
    }

    std::shared_ptr<const analysis::AnalysisContext> WorkspaceOrchestrator::context() {
        std::lock_guard lock(run_mutex_);
        update_structure();
        return current_context();
    }

    // -- module structure ---------------------------------------------------

    std::size_t WorkspaceOrchestrator::detect_module_structure() {
        std::lock_guard lock(run_mutex_);
        if (!config_.modules.empty()) {
            modules_ = scope::ModuleIndex(config_.modules);
            modules_per_file_ = false;
        } else {
            modules_ = scope::ModuleIndex::per_file(sources_.files());
            modules_per_file_ = true;
        }
        log::logger()->info("[scope] {} module(s) detected", modules_->size());
        return modules_->size();
    }

    void WorkspaceOrchestrator::set_module_index(scope::ModuleIndex index) {
        std::lock_guard lock(run_mutex_);
        modules_ = std::move(index);
        modules_per_file_ = false;
    }

    bool WorkspaceOrchestrator::has_module_structure() const {
        std::lock_guard lock(run_mutex_);
        return modules_.has_value() && !modules_->empty();
    }

    // -- cache --------------------------------------------------------------

    std::size_t WorkspaceOrchestrator::invalidate(const std::vector<std::string>& paths) {
        std::lock_guard lock(run_mutex_);
        pending_.insert(paths.begin(), paths.end());
        return cache_.invalidate(paths);
    }

    std::string WorkspaceOrchestrator::file_scope(const std::string& file) const {
        return "file:" + file + "|" + fingerprint_;
    }

    cache::FileHashes WorkspaceOrchestrator::hashes_of(const std::vector<std::string>& files) const {
        cache::FileHashes hashes;
        for (const auto& file : files) {
            if (auto hash = sources_.current_hash(file)) {
                hashes.emplace(file, std::move(*hash));
            }
        }
        return hashes;
    }

    // -- scheduling ---------------------------------------------------------

    engine::TaskResult WorkspaceOrchestrator::run_task(const engine::AnalysisTask& task) const {
        const auto context = current_context();
        if (!context) {
            return engine::TaskResult::failure(
                Error::internal_error("no analysis context has been published", task.file));
        }

        // a detector failure travels inside the result so the findings of
        // the detectors that did run are kept; the pool still counts it
        return engine::TaskResult::success(analyzer_.analyze(task.file, *context, task.detectors));
    }

    Result<std::vector<FileAnalysisResult>, Error> WorkspaceOrchestrator::run_files(
        const std::vector<std::string>& files
    ) {
        transition(RunState::Scheduling);

        const auto context = current_context();
        const auto run_id = ++run_counter_;
        const auto timeout = config_.engine.task_timeout;
        std::vector<Scheduled> scheduled;
        scheduled.reserve(files.size());

        for (const auto& file : files) {
            Scheduled item;
            item.file = file;
            item.covering = context->covering_files(file);

            const auto hashes = hashes_of(item.covering);
            if (hashes.size() == item.covering.size()) {
                item.cache_key = cache::ResultCache::make_key(file_scope(file), hashes);
                if (auto hit = cache_.get(item.cache_key); hit && hit->size() == 1) {
                    auto result = std::move(hit->front());
                    result.from_cache = true;
                    item.result = std::move(result);
                    scheduled.push_back(std::move(item));
                    continue;
                }
            }

            item.deadline = std::chrono::steady_clock::now() + timeout;
            item.future = pool_->execute_task(engine::AnalysisTask{
                .id = file + "#" + std::to_string(run_id),
                .file = file,
                .detectors = {},
            });
            scheduled.push_back(std::move(item));
        }

        transition(RunState::Aggregating);

        std::vector<FileAnalysisResult> results;
        results.reserve(scheduled.size());
        std::optional<Error> fatal;

        for (auto& item : scheduled) {
            if (item.result) {
                results.push_back(std::move(*item.result));
                continue;
            }

            auto& future = *item.future;
            if (timeout.count() > 0 && future.wait_until(item.deadline) != std::future_status::ready) {
                log::logger()->warn("[analyze] {} did not finish within {} ms", item.file, timeout.count());
                results.push_back(FileAnalysisResult::failed(
                    item.file, Error::scheduler_error("analysis timed out", item.file)));
                continue;
            }

            auto outcome = future.get();
            if (outcome.is_err()) {
                if (outcome.error().code() == ErrorCode::SchedulerError) {
                    if (!fatal) {
                        fatal = outcome.error();
                    }
                    continue;
                }
                log::logger()->warn("[analyze] {} failed: {}", item.file, outcome.error().to_string());
                results.push_back(FileAnalysisResult::failed(item.file, outcome.error()));
                continue;
            }

            auto result = std::move(outcome).value();
            if (!result.success && result.error) {
                log::logger()->warn("[analyze] {} failed: {}", item.file, result.error->to_string());
            }
            if (result.success && !item.cache_key.empty()) {
                cache_.set(item.cache_key, std::vector<FileAnalysisResult>{result}, hashes_of(item.covering));
            }
            results.push_back(std::move(result));
        }

        if (fatal) {
            return Result<std::vector<FileAnalysisResult>, Error>::failure(std::move(*fatal));
        }
        return Result<std::vector<FileAnalysisResult>, Error>::success(std::move(results));
    }

    // -- runs ---------------------------------------------------------------

    Result<FileAnalysisResult, Error> WorkspaceOrchestrator::file_run(const std::string& file) {
        transition(RunState::Scanning);
        update_structure();

        auto results = run_files({file});
        if (results.is_err()) {
            return fail_run<FileAnalysisResult>(results.error());
        }
        transition(RunState::Done);
        return Result<FileAnalysisResult, Error>::success(std::move(results.value().front()));
    }

    Result<FileAnalysisResult, Error> WorkspaceOrchestrator::analyze_file(const std::string& file) {
        std::lock_guard lock(run_mutex_);
        return file_run(file);
    }

    Result<FileAnalysisResult, Error> WorkspaceOrchestrator::analyze_file(const std::string& file,
                                                                         const AnalyzerConfig& config) {
        std::lock_guard lock(run_mutex_);
        apply_config(config);
        return file_run(file);
    }

    Result<WorkspaceAnalysisResult, Error> WorkspaceOrchestrator::workspace_run() {
        const auto start = Clock::now();
        transition(RunState::Scanning);

        if (auto synced = sync_sources(); synced.is_err()) {
            return fail_run<WorkspaceAnalysisResult>(synced.error());
        }
        update_structure();

        auto results = run_files(sources_.files());
        if (results.is_err()) {
            return fail_run<WorkspaceAnalysisResult>(results.error());
        }

        WorkspaceAnalysisResult workspace;
        workspace.file_results = std::move(results).value();
        workspace.summary = summarize(workspace.file_results);
        workspace.summary.duration = std::chrono::duration_cast<Duration>(Clock::now() - start);

        log::logger()->info("[orchestrator] {} file(s), {} issue(s), {} failed, {} from cache",
                            workspace.summary.total_files, workspace.summary.total_issues,
                            workspace.summary.failed_files, workspace.summary.cached_files);
        transition(RunState::Done);
        return Result<WorkspaceAnalysisResult, Error>::success(std::move(workspace));
    }

    Result<WorkspaceAnalysisResult, Error> WorkspaceOrchestrator::analyze_workspace() {
        std::lock_guard lock(run_mutex_);
        return workspace_run();
    }

    Result<WorkspaceAnalysisResult, Error> WorkspaceOrchestrator::analyze_workspace(const AnalyzerConfig& config) {
        std::lock_guard lock(run_mutex_);
        apply_config(config);
        return workspace_run();
    }

    Result<IncrementalAnalysisResult, Error> WorkspaceOrchestrator::incremental_run(const ChangeSet& changes) {
        const auto start = Clock::now();
        transition(RunState::Scanning);

        // once pruned from the graph, a deleted file no longer leads to the
        // files that imported it
        std::map<std::string, std::vector<std::string>> prior_dependents;
        for (const auto& file : changes.files) {
            if (graph_.contains(file)) {
                prior_dependents.emplace(file, graph_.dependents_of(file));
            }
        }

        refresh_changed(changes.files);
        update_structure();

        std::vector<std::string> seeds = changes.files;
        for (const auto& [file, dependents] : prior_dependents) {
            if (sources_.contains(file)) {
                continue;
            }
            for (const auto& dependent : dependents) {
                if (sources_.contains(dependent) && std::ranges::find(seeds, dependent) == seeds.end()) {
                    seeds.push_back(dependent);
                }
            }
        }

        const scope::ModuleIndex empty_index;
        const auto& index = modules_ ? *modules_ : empty_index;
        auto affected = scope::resolve_affected(seeds, index.lift(graph_), index);
        if (affected.is_err()) {
            return fail_run<IncrementalAnalysisResult>(affected.error());
        }

        std::vector<std::string> files;
        for (const auto& file : sources_.files()) {
            const auto owner = index.owning_module(file);
            if (owner && affected.value().contains(*owner)) {
                files.push_back(file);
            }
        }
        for (const auto& file : affected.value().unowned_files) {
            if (sources_.contains(file) && std::ranges::find(files, file) == files.end()) {
                files.push_back(file);
            }
        }

        log::logger()->info("[scope] change {}: {} module(s) affected, {} file(s) to analyse",
                            changes.change_id, affected.value().all_affected.size(), files.size());

        auto results = run_files(files);
        if (results.is_err()) {
            return fail_run<IncrementalAnalysisResult>(results.error());
        }

        IncrementalAnalysisResult incremental;
        incremental.affected = std::move(affected).value();
        incremental.file_results = std::move(results).value();
        incremental.summary = summarize(incremental.file_results);
        incremental.summary.duration = std::chrono::duration_cast<Duration>(Clock::now() - start);
        transition(RunState::Done);
        return Result<IncrementalAnalysisResult, Error>::success(std::move(incremental));
    }

    Result<IncrementalAnalysisResult, Error> WorkspaceOrchestrator::analyze_incremental(const ChangeSet& changes) {
        std::lock_guard lock(run_mutex_);
        return incremental_run(changes);
    }

    Result<IncrementalAnalysisResult, Error> WorkspaceOrchestrator::analyze_incremental(
        const ChangeSet& changes,
        const AnalyzerConfig& config
    ) {
        std::lock_guard lock(run_mutex_);
        apply_config(config);
        return incremental_run(changes);
    }

    Result<WorkspaceAnalysisResult, Error> WorkspaceOrchestrator::analyze_commit(const CommitInfo& commit) {
        std::lock_guard lock(run_mutex_);
        const auto start = Clock::now();
        transition(RunState::Scanning);

        refresh_changed(commit.changed_files);
        update_structure();

        std::vector<std::string> files;
        for (const auto& file : commit.changed_files) {
            if (sources_.contains(file)) {
                files.push_back(file);
            }
        }

        const auto context = current_context();
        std::set<std::string> covering;
        for (const auto& file : files) {
            for (auto& member : context->covering_files(file)) {
                covering.insert(std::move(member));
            }
        }
        const auto hashes = hashes_of(std::vector<std::string>(covering.begin(), covering.end()));
        const auto key = cache::ResultCache::make_key("commit:" + commit.repository + "|" + fingerprint_, hashes);

        WorkspaceAnalysisResult workspace;
        if (auto hit = cache_.get(key)) {
            log::logger()->info("[orchestrator] commit {} served from cache", commit.sha);
            transition(RunState::Scheduling);
            transition(RunState::Aggregating);
            for (auto& result : *hit) {
                result.from_cache = true;
            }
            workspace.file_results = std::move(*hit);
        } else {
            auto results = run_files(files);
            if (results.is_err()) {
                return fail_run<WorkspaceAnalysisResult>(results.error());
            }
            workspace.file_results = std::move(results).value();

            const bool all_succeeded = std::ranges::all_of(workspace.file_results, [](const FileAnalysisResult& r) {
                return r.success;
            });
            if (all_succeeded) {
                cache_.set(key, workspace.file_results, hashes);
            }
        }

        workspace.summary = summarize(workspace.file_results);
        workspace.summary.duration = std::chrono::duration_cast<Duration>(Clock::now() - start);
        transition(RunState::Done);
        return Result<WorkspaceAnalysisResult, Error>::success(std::move(workspace));
    }

    void WorkspaceOrchestrator::shutdown() {
        log::logger()->info("[orchestrator] shutting down worker pool");
        pool_->shutdown(config_.engine.shutdown_timeout);
    }

}  // namespace janitor::workspace
