//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_WORKER_POOL_HPP
#define JANITOR_WORKER_POOL_HPP

/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of OS threads running one file analysis each.
 *
 * Tasks are queued FIFO and picked up by the first idle worker. A worker
 * runs exactly one task at a time and owns that task's syntax tree for the
 * duration. When a task fails, its worker moves to Error, the task's future
 * carries the failure (or the partial result that records it), and the
 * worker returns to Idle after the configured cool-down. Failed tasks are
 * never retried here.
 *
 * executeTask() never blocks. It may be called from several threads.
 */

#include "janitor/error.hpp"
#include "janitor/result.hpp"
#include "janitor/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace janitor::engine {

    enum class WorkerStatus {
        Idle,
        Busy,
        Error,
        Terminated
    };

    [[nodiscard]] std::string_view to_string(WorkerStatus status) noexcept;

    struct AnalysisTask {
        std::string id;
        std::string file;
        /// Names of the detectors to run; empty means every enabled one.
        std::vector<std::string> detectors;
    };

    struct WorkerState {
        std::size_t id = 0;
        WorkerStatus status = WorkerStatus::Idle;
        std::optional<std::string> current_task;
        std::size_t tasks_completed = 0;
        std::size_t tasks_failed = 0;
        std::optional<Error> last_error;
    };

    struct PoolStats {
        std::size_t workers = 0;
        std::size_t idle = 0;
        std::size_t busy = 0;
        std::size_t errored = 0;
        std::size_t terminated = 0;
        std::size_t queued = 0;
        std::size_t tasks_completed = 0;
        std::size_t tasks_failed = 0;
    };

    struct WorkerPoolOptions {
        /// 0 selects the hardware concurrency.
        unsigned int worker_count = 0;
        Duration error_cooldown{1000};
    };

    using TaskResult = Result<FileAnalysisResult, Error>;
    using TaskFuture = std::future<TaskResult>;

    class WorkerPool {
    public:
        using Runner = std::function<TaskResult(const AnalysisTask&)>;

        /**
         * Starts the workers.
         *
         * @param runner Executes one task. A thrown exception, a failed
         *               result, or a delivered result carrying a
         *               DetectorError counts as a failed task.
         */
        explicit WorkerPool(Runner runner, WorkerPoolOptions options = {});
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /**
         * Queues @p task. The returned future holds a SchedulerError when the
         * pool no longer accepts work or a task with the same id is already
         * queued or running.
         */
        TaskFuture execute_task(AnalysisTask task);

        /**
         * Stops accepting tasks, waits up to @p timeout for busy workers,
         * then marks every worker Terminated and fails whatever is still
         * queued with "pool shut down". In-flight tasks are not interrupted;
         * their futures still resolve when they finish.
         */
        void shutdown(Duration timeout = Duration{30000});

        [[nodiscard]] bool accepting() const;
        [[nodiscard]] std::vector<WorkerState> workers() const;
        [[nodiscard]] PoolStats stats() const;
        [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

    private:
        struct PendingTask {
            AnalysisTask task;
            std::promise<TaskResult> promise;
        };

        void worker_loop(std::size_t index);
        [[nodiscard]] bool any_busy() const;
        static TaskFuture ready(TaskResult result);

        Runner runner_;
        WorkerPoolOptions options_;

        mutable std::mutex mutex_;
        std::condition_variable work_available_;
        // separate from work_available_ so a wake-up for new work never
        // lands on a worker that is cooling down
        std::condition_variable cooldown_;
        std::condition_variable worker_finished_;
        std::deque<PendingTask> queue_;
        std::set<std::string> active_ids_;
        std::vector<WorkerState> states_;
        bool accepting_ = true;
        bool stop_ = false;

        std::vector<std::thread> threads_;
    };

}  // namespace janitor::engine

#endif //JANITOR_WORKER_POOL_HPP
