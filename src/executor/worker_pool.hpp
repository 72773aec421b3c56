/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool that runs dispatched tasks.
 *
 * Fired timers enqueue dispatch jobs here so external programs run
 * concurrently and outside the scheduling lock. The worker count bounds
 * how many programs run at once.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace task_orchestrator {

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable for execution. Returns false after shutdown().
    bool post(std::function<void()> job);

    /// Block until the queue is empty and no job is running, or the timeout elapses.
    bool wait_idle(std::chrono::milliseconds timeout);

    /**
     * @brief Stop accepting work, discard queued jobs and join the workers.
     *
     * Jobs already running are allowed to finish.
     */
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_jobs_{0};
    bool accepting_ = true;
};

}  // namespace task_orchestrator
