//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/engine/worker_pool.hpp"
#include "janitor/logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace janitor::engine {

    namespace {
        // A parse failure is an ordinary per-file result; only a detector
        // failure, delivered either way, counts against the worker.
        std::optional<Error> task_failure(const TaskResult& outcome) {
            if (outcome.is_err()) {
                return outcome.error();
            }
            const auto& result = outcome.value();
            if (!result.success && result.error && result.error->code() == ErrorCode::DetectorError) {
                return result.error;
            }
            return std::nullopt;
        }
    }

    std::string_view to_string(const WorkerStatus status) noexcept {
        switch (status) {
            case WorkerStatus::Idle:       return "idle";
            case WorkerStatus::Busy:       return "busy";
            case WorkerStatus::Error:      return "error";
            case WorkerStatus::Terminated: return "terminated";
        }
        return "unknown";
    }

    WorkerPool::WorkerPool(Runner runner, WorkerPoolOptions options)
        : runner_(std::move(runner)), options_(options) {
        if (!runner_) {
            throw std::invalid_argument("WorkerPool requires a runner");
        }

        unsigned int count = options_.worker_count;
        if (count == 0) {
            count = std::max(1u, std::thread::hardware_concurrency());
        }

        states_.resize(count);
        for (std::size_t i = 0; i < count; ++i) {
            states_[i].id = i;
        }

        threads_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads_.emplace_back([this, i] {
                worker_loop(i);
            });
        }
    }

    WorkerPool::~WorkerPool() {
        shutdown(Duration{0});
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    TaskFuture WorkerPool::ready(TaskResult result) {
        std::promise<TaskResult> promise;
        promise.set_value(std::move(result));
        return promise.get_future();
    }

    TaskFuture WorkerPool::execute_task(AnalysisTask task) {
        std::unique_lock lock(mutex_);
        if (!accepting_) {
            return ready(TaskResult::failure(Error::scheduler_error("pool shut down", task.id)));
        }
        if (!active_ids_.insert(task.id).second) {
            return ready(TaskResult::failure(
                Error::scheduler_error("task is already queued or running", task.id)));
        }

        PendingTask pending{.task = std::move(task), .promise = {}};
        auto future = pending.promise.get_future();
        queue_.push_back(std::move(pending));
        lock.unlock();

        work_available_.notify_one();
        return future;
    }

    void WorkerPool::worker_loop(const std::size_t index) {
        while (true) {
            PendingTask pending;
            {
                std::unique_lock lock(mutex_);
                work_available_.wait(lock, [this] {
                    return stop_ || !queue_.empty();
                });
                if (stop_) {
                    return;
                }

                pending = std::move(queue_.front());
                queue_.pop_front();

                auto& state = states_[index];
                state.status = WorkerStatus::Busy;
                state.current_task = pending.task.id;
            }

            std::optional<TaskResult> outcome;
            try {
                outcome.emplace(runner_(pending.task));
            } catch (const std::exception& e) {
                outcome.emplace(TaskResult::failure(Error::detector_error(e.what(), pending.task.file)));
            } catch (...) {
                outcome.emplace(TaskResult::failure(
                    Error::detector_error("unknown exception", pending.task.file)));
            }
            const auto failure = task_failure(*outcome);
            const bool failed = failure.has_value();

            {
                std::lock_guard lock(mutex_);
                auto& state = states_[index];
                state.current_task.reset();
                active_ids_.erase(pending.task.id);
                if (failed) {
                    ++state.tasks_failed;
                    state.last_error = failure;
                    if (state.status != WorkerStatus::Terminated) {
                        state.status = WorkerStatus::Error;
                    }
                } else {
                    ++state.tasks_completed;
                    if (state.status != WorkerStatus::Terminated) {
                        state.status = WorkerStatus::Idle;
                    }
                }
            }
            worker_finished_.notify_all();

            if (failed) {
                log::logger()->warn("[pool] worker {} failed task {}: {}",
                                    index, pending.task.id, failure->to_string());
            }
            pending.promise.set_value(std::move(*outcome));

            if (failed) {
                std::unique_lock lock(mutex_);
                cooldown_.wait_for(lock, options_.error_cooldown, [this] { return stop_; });
                if (stop_) {
                    return;
                }
                states_[index].status = WorkerStatus::Idle;
            }
        }
    }

    bool WorkerPool::any_busy() const {
        return std::ranges::any_of(states_, [](const WorkerState& state) {
            return state.current_task.has_value();
        });
    }

    void WorkerPool::shutdown(const Duration timeout) {
        std::deque<PendingTask> abandoned;
        {
            std::unique_lock lock(mutex_);
            if (stop_) {
                return;
            }
            accepting_ = false;

            if (!worker_finished_.wait_for(lock, timeout, [this] { return !any_busy(); })) {
                log::logger()->warn("[pool] shutdown timed out with tasks still running");
            }

            stop_ = true;
            for (auto& state : states_) {
                state.status = WorkerStatus::Terminated;
            }
            abandoned.swap(queue_);
            for (const auto& pending : abandoned) {
                active_ids_.erase(pending.task.id);
            }
        }
        work_available_.notify_all();
        cooldown_.notify_all();

        for (auto& pending : abandoned) {
            pending.promise.set_value(TaskResult::failure(
                Error::scheduler_error("pool shut down", pending.task.id)));
        }
        log::logger()->info("[pool] shut down, {} queued task(s) rejected", abandoned.size());
    }

    bool WorkerPool::accepting() const {
        std::lock_guard lock(mutex_);
        return accepting_;
    }

    std::vector<WorkerState> WorkerPool::workers() const {
        std::lock_guard lock(mutex_);
        return states_;
    }

    PoolStats WorkerPool::stats() const {
        std::lock_guard lock(mutex_);
        PoolStats stats;
        stats.workers = states_.size();
        stats.queued = queue_.size();
        for (const auto& state : states_) {
            switch (state.status) {
                case WorkerStatus::Idle:       ++stats.idle; break;
                case WorkerStatus::Busy:       ++stats.busy; break;
                case WorkerStatus::Error:      ++stats.errored; break;
                case WorkerStatus::Terminated: ++stats.terminated; break;
            }
            stats.tasks_completed += state.tasks_completed;
            stats.tasks_failed += state.tasks_failed;
        }
        return stats;
    }

}  // namespace janitor::engine
