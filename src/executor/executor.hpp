/**
 * @file executor.hpp
 * @brief Bounded worker pool with tracked task lifecycles.
 * @author Dimitris Kafetzis
 *
 * The Executor accepts work from a controlling thread without ever blocking
 * it, runs at most max_workers tasks concurrently (excess work queues FIFO),
 * tracks every task in a CancellationRegistry for cancel-by-id, and
 * publishes pool health as immutable snapshots. All mutable pool state
 * (registry and counters) sits behind one mutex.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/cancellation_registry.hpp"
#include "executor/janitor.hpp"
#include "executor/task_handle.hpp"
#include "executor/thread_pool.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace async_executor {

class LogPipeline;

/**
 * @brief Per-submission options. The timeout is always named explicitly.
 */
struct SubmitOptions {
    std::string name;                          ///< Diagnostic label; defaults to the id
    std::optional<int> timeout_seconds;        ///< Advisory; defaults to the config value
    TaskCallbacks callbacks;
};

struct Submission {
    TaskId id;
    std::shared_ptr<TaskHandle> handle;
};

/**
 * @brief Whether the routine "task submitted" trace is emitted.
 *
 * Above the active-task threshold only every Nth submission is traced.
 */
[[nodiscard]] bool should_trace_submission(size_t active_count,
                                           uint64_t submission_counter,
                                           const ExecutorConfig& config) noexcept;

class Executor : public IRegistryAuditor {
public:
    using ErasedTask = std::function<std::any(TaskContext&)>;

    /**
     * @param config   Fixed for the Executor's lifetime.
     * @param pipeline Log pipeline; stopped by shutdown(). Must outlive the Executor.
     * @param janitor  Periodic registry audit; disabled if !enabled or interval 0.
     */
    Executor(ExecutorConfig config,
             LogPipeline& pipeline,
             JanitorConfig janitor = {},
             LogLevel log_level = LogLevel::Info);
    ~Executor() override;

    // Non-copyable, non-movable
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /**
     * @brief Submit fn(args...) or fn(TaskContext&, args...).
     *
     * Never blocks. Fails only with SubmissionRejected after shutdown().
     * Arguments are bound by value and never interpreted as a timeout.
     */
    template <typename F, typename... Args>
        requires TaskFunction<std::decay_t<F>, std::decay_t<Args>...>
    Result<Submission> submit(F&& fn, Args&&... args) {
        return submit(SubmitOptions{}, std::forward<F>(fn), std::forward<Args>(args)...);
    }

    template <typename F, typename... Args>
        requires TaskFunction<std::decay_t<F>, std::decay_t<Args>...>
    Result<Submission> submit(SubmitOptions options, F&& fn, Args&&... args);

    /// Non-template submission path every overload funnels into.
    Result<Submission> submit_erased(SubmitOptions options, ErasedTask work);

    /**
     * @brief Cancel by id.
     *
     * Pending: becomes Cancelled without running. Running: the stop flag is
     * set and the function decides. Unknown or finished: returns false.
     */
    bool cancel(const TaskId& id);

    /// Block until every tracked task (and its callbacks) has finished.
    bool wait_for_completion(std::chrono::milliseconds timeout);

    /**
     * @brief Idempotent teardown.
     *
     * Rejects new work, cancels everything still registered, waits up to
     * the grace period for running tasks, discards unscheduled jobs, stops
     * the Janitor and the LogPipeline. May be called from a task or one of
     * its callbacks; the calling task is then not waited for.
     */
    void shutdown();
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] bool is_shut_down() const;
    [[nodiscard]] PoolInfo pool_info() const;
    [[nodiscard]] HealthReport health() const;

    /// Prune dead or terminal registry entries; used by the Janitor.
    RegistryAudit audit_registry() override;

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }
    [[nodiscard]] const Logger& logger() const noexcept { return logger_; }

private:
    void run_task(const std::shared_ptr<TaskHandle>& handle, ErasedTask& work);
    void finish_callbacks(TaskHandle& handle);
    void release_in_flight();
    bool wait_for_in_flight(size_t allowed, std::chrono::milliseconds timeout);
    [[nodiscard]] PoolInfo pool_info_locked() const;

    const ExecutorConfig config_;
    LogPipeline& pipeline_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    CancellationRegistry registry_;
    bool shut_down_{false};
    size_t running_count_{0};
    size_t pending_count_{0};
    size_t in_flight_{0};             ///< Tracked tasks whose callbacks have not finished
    uint64_t submission_counter_{0};
    uint64_t submitted_total_{0};
    uint64_t completed_total_{0};
    uint64_t failed_total_{0};
    uint64_t cancelled_total_{0};

    std::atomic<bool> shutdown_started_{false};

    // Destroyed first: joins workers and the janitor before the state above goes away.
    ThreadPool pool_;
    std::unique_ptr<Janitor> janitor_;
};

// ── Template implementations ─────────────────

template <typename F, typename... Args>
    requires TaskFunction<std::decay_t<F>, std::decay_t<Args>...>
Result<Submission> Executor::submit(SubmitOptions options, F&& fn, Args&&... args) {
    using Fn = std::decay_t<F>;
    using ReturnType = task_result_t<Fn, std::decay_t<Args>...>;
    static_assert(std::is_void_v<ReturnType> || std::is_copy_constructible_v<ReturnType>,
                  "task results are stored type-erased and must be copy constructible");

    // Shared so that move-only callables fit into std::function.
    auto bound = std::make_shared<std::tuple<Fn, std::tuple<std::decay_t<Args>...>>>(
        std::forward<F>(fn), std::make_tuple(std::forward<Args>(args)...));

    ErasedTask work = [bound](TaskContext& ctx) -> std::any {
        auto& f = std::get<0>(*bound);
        auto& bound_args = std::get<1>(*bound);
        return std::apply([&](auto&... a) -> std::any {
            if constexpr (ContextAwareTask<Fn, std::decay_t<Args>...>) {
                if constexpr (std::is_void_v<ReturnType>) {
                    std::invoke(f, ctx, a...);
                    return {};
                } else {
                    return std::any(std::invoke(f, ctx, a...));
                }
            } else {
                if constexpr (std::is_void_v<ReturnType>) {
                    std::invoke(f, a...);
                    return {};
                } else {
                    return std::any(std::invoke(f, a...));
                }
            }
        }, bound_args);
    };

    return submit_erased(std::move(options), std::move(work));
}

}  // namespace async_executor
