/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <utility>

namespace async_executor {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
    // jthreads auto-join in their destructors
}

bool ThreadPool::post(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

size_t ThreadPool::discard_queued() {
    std::queue<Job> dropped;
    {
        std::lock_guard lock(queue_mutex_);
        dropped.swap(job_queue_);
    }
    // Destroy captured state outside the lock.
    return dropped.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
    }
    // Request stop on all jthreads first
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (stop.stop_requested()) return;
            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        ++active_jobs_;
        job();
        --active_jobs_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace async_executor
