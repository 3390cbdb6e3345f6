/**
 * @file task_handle.hpp
 * @brief Lifecycle, cancellation flag and callbacks of one submitted task.
 * @author Dimitris Kafetzis
 *
 * State machine:
 *
 *   Pending ──► Running ──► Completed | Failed | Cancelled
 *      │
 *      └──────► Cancelled
 *
 * Transitions are one-directional. Cancellation is cooperative: a Running
 * task only becomes Cancelled if its function observes the stop token and
 * reports it by throwing TaskCancelled.
 */

#pragma once

#include "core/types.hpp"

#include <any>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace async_executor {

class TaskHandle;

using TaskCallback = std::function<void(const TaskHandle&)>;
using ProgressCallback = std::function<void(const TaskHandle&, std::string_view)>;

/**
 * @brief Thrown by a task function to report that it honoured cancellation.
 */
class TaskCancelled : public std::exception {
public:
    [[nodiscard]] const char* what() const noexcept override { return "task cancelled"; }
};

struct TaskCallbacks {
    TaskCallback on_completed;
    TaskCallback on_failed;
    TaskCallback on_cancelled;
    ProgressCallback on_progress;
};

/**
 * @brief Diagnostic view of a task's execution.
 */
struct ExecutionInfo {
    TaskId id;
    std::string name;
    TaskState state{TaskState::Pending};
    Timestamp submitted_at;
    std::optional<Duration> queued_for;    ///< Submission to start
    std::optional<Duration> ran_for;       ///< Start to terminal (or now, if Running)
    std::optional<int> timeout_seconds;
    std::optional<std::string> error;
};

enum class CancelOutcome : uint8_t {
    CancelledPending,  ///< Never ran; now Cancelled
    FlagSet,           ///< Running; stop requested
    AlreadyTerminal
};

/**
 * @brief One unit of submitted work and its tracked lifecycle.
 *
 * Thread-safe. Shared between the worker job that owns it while running,
 * the submitter (optionally), and the CancellationRegistry (weakly).
 */
class TaskHandle {
public:
    TaskHandle(TaskId id,
               std::string name,
               std::optional<int> timeout_seconds,
               TaskCallbacks callbacks = {});

    // Non-copyable
    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::optional<int> timeout_seconds() const noexcept { return timeout_seconds_; }

    [[nodiscard]] TaskState state() const;
    [[nodiscard]] bool is_terminal() const;
    [[nodiscard]] bool cancel_requested() const noexcept;
    [[nodiscard]] std::stop_token stop_token() const noexcept;

    /// Block until a terminal state is reached or the timeout elapses.
    bool wait(std::chrono::milliseconds timeout) const;

    /// Result of a Completed task, or nullptr if absent or of another type.
    template <typename T>
    [[nodiscard]] const T* result_as() const {
        std::lock_guard lock(mutex_);
        return std::any_cast<T>(&result_);
    }

    [[nodiscard]] bool has_result() const;
    [[nodiscard]] std::optional<std::string> error_message() const;
    [[nodiscard]] std::exception_ptr exception() const;
    [[nodiscard]] ExecutionInfo execution_info() const;

    /// True while Running for longer than the advisory timeout.
    [[nodiscard]] bool exceeded_timeout(SteadyTime now) const;

    // ── Callback registration ─────────────────
    //
    // Registered before the terminal transition: invoked once on the
    // thread that performs it. Registered after: invoked immediately on the
    // calling thread if the state matches.

    void on_completed(TaskCallback callback);
    void on_failed(TaskCallback callback);
    void on_cancelled(TaskCallback callback);
    void on_progress(ProgressCallback callback);

    // ── Lifecycle transitions (driven by the Executor) ─────

    /// Pending -> Running. False if the task is no longer Pending.
    bool mark_running();

    /// Pending -> Cancelled, or set the stop flag if Running.
    CancelOutcome request_cancel();

    /// Running -> Completed. The value may be empty for void tasks.
    bool complete(std::any value);

    /// Running -> Failed.
    bool fail(std::string message, std::exception_ptr error);

    /// Running -> Cancelled, after the function honoured the stop flag.
    bool mark_cancelled();

    /**
     * @brief Invoke the callbacks of the terminal state, exactly once.
     *
     * Must be called without any Executor lock held. Exceptions thrown by
     * callbacks are caught; their messages are returned for logging.
     */
    std::vector<std::string> fire_terminal_callbacks();

    /// Forward a progress message to the progress callbacks.
    void report_progress(std::string_view message);

private:
    bool finish(TaskState from, TaskState to);
    void register_callback(TaskState kind, TaskCallback callback);

    const TaskId id_;
    const std::string name_;
    const std::optional<int> timeout_seconds_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    TaskState state_{TaskState::Pending};
    std::stop_source stop_source_;

    std::any result_;
    std::optional<std::string> error_message_;
    std::exception_ptr exception_;

    Timestamp submitted_at_;
    SteadyTime submitted_steady_;
    std::optional<SteadyTime> started_at_;
    std::optional<SteadyTime> finished_at_;

    std::vector<TaskCallback> completed_callbacks_;
    std::vector<TaskCallback> failed_callbacks_;
    std::vector<TaskCallback> cancelled_callbacks_;
    std::vector<ProgressCallback> progress_callbacks_;
    bool callbacks_fired_{false};
};

/**
 * @brief What a running task function sees of its own handle.
 *
 * Task functions should poll cancel_requested() (or the stop token) at safe
 * points and call throw_if_cancelled() to report honoured cancellation.
 */
class TaskContext {
public:
    explicit TaskContext(TaskHandle& handle) noexcept : handle_(handle) {}

    [[nodiscard]] const TaskId& task_id() const noexcept { return handle_.id(); }
    [[nodiscard]] bool cancel_requested() const noexcept { return handle_.cancel_requested(); }
    [[nodiscard]] std::stop_token stop_token() const noexcept { return handle_.stop_token(); }

    /// Throws TaskCancelled if cancellation was requested.
    void throw_if_cancelled() const {
        if (handle_.cancel_requested()) throw TaskCancelled{};
    }

    void report_progress(std::string_view message) { handle_.report_progress(message); }

private:
    TaskHandle& handle_;
};

}  // namespace async_executor
