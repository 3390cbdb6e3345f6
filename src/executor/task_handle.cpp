/**
 * @file task_handle.cpp
 * @brief TaskHandle state machine implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/task_handle.hpp"

#include <utility>

namespace async_executor {

TaskHandle::TaskHandle(TaskId id,
                       std::string name,
                       std::optional<int> timeout_seconds,
                       TaskCallbacks callbacks)
    : id_(std::move(id))
    , name_(name.empty() ? id_ : std::move(name))
    , timeout_seconds_(timeout_seconds)
    , submitted_at_(std::chrono::system_clock::now())
    , submitted_steady_(std::chrono::steady_clock::now()) {
    if (callbacks.on_completed) completed_callbacks_.push_back(std::move(callbacks.on_completed));
    if (callbacks.on_failed) failed_callbacks_.push_back(std::move(callbacks.on_failed));
    if (callbacks.on_cancelled) cancelled_callbacks_.push_back(std::move(callbacks.on_cancelled));
    if (callbacks.on_progress) progress_callbacks_.push_back(std::move(callbacks.on_progress));
}

// ─────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────

TaskState TaskHandle::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool TaskHandle::is_terminal() const {
    return async_executor::is_terminal(state());
}

bool TaskHandle::cancel_requested() const noexcept {
    return stop_source_.stop_requested();
}

std::stop_token TaskHandle::stop_token() const noexcept {
    return stop_source_.get_token();
}

bool TaskHandle::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return terminal_cv_.wait_for(lock, timeout, [this] {
        return async_executor::is_terminal(state_);
    });
}

bool TaskHandle::has_result() const {
    std::lock_guard lock(mutex_);
    return result_.has_value();
}

std::optional<std::string> TaskHandle::error_message() const {
    std::lock_guard lock(mutex_);
    return error_message_;
}

std::exception_ptr TaskHandle::exception() const {
    std::lock_guard lock(mutex_);
    return exception_;
}

ExecutionInfo TaskHandle::execution_info() const {
    using std::chrono::duration_cast;

    std::lock_guard lock(mutex_);
    ExecutionInfo info{
        .id = id_,
        .name = name_,
        .state = state_,
        .submitted_at = submitted_at_,
        .queued_for = std::nullopt,
        .ran_for = std::nullopt,
        .timeout_seconds = timeout_seconds_,
        .error = error_message_
    };
    if (started_at_) {
        info.queued_for = duration_cast<Duration>(*started_at_ - submitted_steady_);
        auto end = finished_at_.value_or(std::chrono::steady_clock::now());
        info.ran_for = duration_cast<Duration>(end - *started_at_);
    }
    return info;
}

bool TaskHandle::exceeded_timeout(SteadyTime now) const {
    std::lock_guard lock(mutex_);
    if (state_ != TaskState::Running || !timeout_seconds_ || !started_at_) return false;
    return now - *started_at_ > std::chrono::seconds(*timeout_seconds_);
}

// ─────────────────────────────────────────────
// Callback registration
// ─────────────────────────────────────────────

void TaskHandle::on_completed(TaskCallback callback) {
    register_callback(TaskState::Completed, std::move(callback));
}

void TaskHandle::on_failed(TaskCallback callback) {
    register_callback(TaskState::Failed, std::move(callback));
}

void TaskHandle::on_cancelled(TaskCallback callback) {
    register_callback(TaskState::Cancelled, std::move(callback));
}

void TaskHandle::on_progress(ProgressCallback callback) {
    if (!callback) return;
    std::lock_guard lock(mutex_);
    progress_callbacks_.push_back(std::move(callback));
}

void TaskHandle::register_callback(TaskState kind, TaskCallback callback) {
    if (!callback) return;
    {
        std::lock_guard lock(mutex_);
        if (!callbacks_fired_) {
            switch (kind) {
                case TaskState::Completed: completed_callbacks_.push_back(std::move(callback)); break;
                case TaskState::Failed:    failed_callbacks_.push_back(std::move(callback)); break;
                default:                   cancelled_callbacks_.push_back(std::move(callback)); break;
            }
            return;
        }
        if (state_ != kind) return;
    }
    // Terminal callbacks already dispatched: run on the registering thread.
    callback(*this);
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

bool TaskHandle::mark_running() {
    std::lock_guard lock(mutex_);
    if (state_ != TaskState::Pending) return false;
    state_ = TaskState::Running;
    started_at_ = std::chrono::steady_clock::now();
    return true;
}

CancelOutcome TaskHandle::request_cancel() {
    {
        std::lock_guard lock(mutex_);
        if (async_executor::is_terminal(state_)) return CancelOutcome::AlreadyTerminal;

        stop_source_.request_stop();
        if (state_ == TaskState::Running) return CancelOutcome::FlagSet;

        state_ = TaskState::Cancelled;
        finished_at_ = std::chrono::steady_clock::now();
    }
    terminal_cv_.notify_all();
    return CancelOutcome::CancelledPending;
}

bool TaskHandle::complete(std::any value) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != TaskState::Running) return false;
        result_ = std::move(value);
    }
    return finish(TaskState::Running, TaskState::Completed);
}

bool TaskHandle::fail(std::string message, std::exception_ptr error) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != TaskState::Running) return false;
        error_message_ = std::move(message);
        exception_ = std::move(error);
    }
    return finish(TaskState::Running, TaskState::Failed);
}

bool TaskHandle::mark_cancelled() {
    return finish(TaskState::Running, TaskState::Cancelled);
}

bool TaskHandle::finish(TaskState from, TaskState to) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != from) return false;
        state_ = to;
        finished_at_ = std::chrono::steady_clock::now();
    }
    terminal_cv_.notify_all();
    return true;
}

std::vector<std::string> TaskHandle::fire_terminal_callbacks() {
    std::vector<TaskCallback> to_run;
    {
        std::lock_guard lock(mutex_);
        if (callbacks_fired_ || !async_executor::is_terminal(state_)) return {};
        callbacks_fired_ = true;

        switch (state_) {
            case TaskState::Completed: to_run.swap(completed_callbacks_); break;
            case TaskState::Failed:    to_run.swap(failed_callbacks_); break;
            default:                   to_run.swap(cancelled_callbacks_); break;
        }
        completed_callbacks_.clear();
        failed_callbacks_.clear();
        cancelled_callbacks_.clear();
        progress_callbacks_.clear();
    }

    std::vector<std::string> errors;
    for (auto& callback : to_run) {
        try {
            callback(*this);
        } catch (const std::exception& e) {
            errors.emplace_back(e.what());
        } catch (...) {
            errors.emplace_back("non-standard exception");
        }
    }
    return errors;
}

void TaskHandle::report_progress(std::string_view message) {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (state_ != TaskState::Running) return;
        callbacks = progress_callbacks_;
    }
    for (auto& callback : callbacks) {
        callback(*this, message);
    }
}

}  // namespace async_executor
