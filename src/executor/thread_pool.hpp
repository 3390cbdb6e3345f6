/**
 * @file thread_pool.hpp
 * @brief Fixed-size std::jthread pool draining a FIFO job queue.
 * @author Dimitris Kafetzis
 *
 * Execution substrate of the Executor: it knows nothing about tasks,
 * handles or cancellation. Jobs must not throw.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace async_executor {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    using Job = std::function<void()>;

    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a job. False once shutdown() has been called.
    bool post(Job job);

    /// Drop every job not yet picked up by a worker.
    size_t discard_queued();

    /**
     * @brief Stop accepting jobs and ask idle workers to exit.
     *
     * Does not wait for jobs already running; the destructor joins.
     */
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
    bool accepting_{true};
    std::vector<std::jthread> workers_;
};

}  // namespace async_executor
