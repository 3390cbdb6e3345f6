/**
 * @file executor.cpp
 * @brief Executor implementation: submission, dispatch, cancellation, teardown.
 * @author Dimitris Kafetzis
 */

#include "executor/executor.hpp"

#include "telemetry/log_pipeline.hpp"

#include <exception>

namespace async_executor {

namespace {

// Process-wide so ids stay unique across Executor instances.
std::atomic<uint64_t> g_task_counter{0};

TaskId next_task_id() {
    return "task_" + std::to_string(g_task_counter.fetch_add(1) + 1);
}

// Executor whose task (or task callbacks) the current thread is running.
thread_local const Executor* t_running_for = nullptr;

struct RunningScope {
    explicit RunningScope(const Executor* executor) : previous(t_running_for) {
        t_running_for = executor;
    }
    ~RunningScope() { t_running_for = previous; }

    const Executor* previous;
};

// A pool always has at least one worker; the stored config reports what runs.
ExecutorConfig runnable(ExecutorConfig config) {
    if (config.max_workers == 0) config.max_workers = 1;
    return config;
}

}  // namespace

bool should_trace_submission(size_t active_count,
                             uint64_t submission_counter,
                             const ExecutorConfig& config) noexcept {
    if (active_count <= config.trace_throttle_active_threshold) return true;
    return config.trace_throttle_every != 0
        && submission_counter % config.trace_throttle_every == 0;
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Executor::Executor(ExecutorConfig config,
                   LogPipeline& pipeline,
                   JanitorConfig janitor,
                   LogLevel log_level)
    : config_(runnable(config))
    , pipeline_(pipeline)
    , logger_(&pipeline, "executor", log_level)
    , pool_(config_.max_workers) {
    if (janitor.enabled && janitor.interval_ms > 0) {
        janitor_ = std::make_unique<Janitor>(
            *this, logger_.with_component("janitor"),
            std::chrono::milliseconds(janitor.interval_ms));
        janitor_->start();
    }
    logger_.info("Executor initialized with " + std::to_string(pool_.thread_count())
                 + " workers");
}

Executor::~Executor() {
    shutdown();
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

Result<Submission> Executor::submit_erased(SubmitOptions options, ErasedTask work) {
    std::shared_ptr<TaskHandle> handle;
    uint64_t counter = 0;
    size_t active = 0;
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) {
            return make_error<Submission>(ErrorCode::SubmissionRejected, "executor is shut down");
        }

        auto timeout = options.timeout_seconds.value_or(
            static_cast<int>(config_.default_task_timeout_s));
        handle = std::make_shared<TaskHandle>(next_task_id(), std::move(options.name),
                                              timeout, std::move(options.callbacks));
        registry_.add(handle);

        // Posting under the lock orders it before any concurrent shutdown().
        pool_.post([this, handle, work = std::move(work)]() mutable {
            run_task(handle, work);
        });

        counter = ++submission_counter_;
        active = running_count_;
        ++submitted_total_;
        ++pending_count_;
        ++in_flight_;
    }

    if (should_trace_submission(active, counter, config_)) {
        logger_.debug("Submitted task " + handle->id() + ": " + handle->name());
    }
    return Submission{handle->id(), handle};
}

// ─────────────────────────────────────────────
// Worker side
// ─────────────────────────────────────────────

void Executor::run_task(const std::shared_ptr<TaskHandle>& handle, ErasedTask& work) {
    {
        std::lock_guard lock(mutex_);
        // Cancelled while queued: already accounted for by cancel()/shutdown().
        if (!handle->mark_running()) return;
        --pending_count_;
        ++running_count_;
    }
    RunningScope scope(this);
    logger_.debug("Starting task " + handle->id());

    TaskContext ctx(*handle);
    TaskState outcome = TaskState::Completed;
    std::any value;
    std::string error;
    std::exception_ptr eptr;

    try {
        value = work(ctx);
    } catch (const TaskCancelled&) {
        outcome = TaskState::Cancelled;
    } catch (const std::exception& e) {
        outcome = TaskState::Failed;
        error = e.what();
        eptr = std::current_exception();
    } catch (...) {
        outcome = TaskState::Failed;
        error = "non-standard exception";
        eptr = std::current_exception();
    }

    {
        std::lock_guard lock(mutex_);
        switch (outcome) {
            case TaskState::Completed:
                handle->complete(std::move(value));
                ++completed_total_;
                break;
            case TaskState::Failed:
                handle->fail(error, eptr);
                ++failed_total_;
                break;
            default:
                handle->mark_cancelled();
                ++cancelled_total_;
                break;
        }
        registry_.remove(handle->id());
        --running_count_;
    }

    switch (outcome) {
        case TaskState::Completed:
            logger_.debug("Task completed: " + handle->id());
            break;
        case TaskState::Failed:
            logger_.error("Task failed: " + handle->id() + ": " + error);
            break;
        default:
            logger_.info("Task cancelled while running: " + handle->id());
            break;
    }

    finish_callbacks(*handle);
}

void Executor::finish_callbacks(TaskHandle& handle) {
    for (const auto& message : handle.fire_terminal_callbacks()) {
        logger_.error("Callback for task " + handle.id() + " threw: " + message);
    }
    release_in_flight();
}

void Executor::release_in_flight() {
    {
        std::lock_guard lock(mutex_);
        if (in_flight_ > 0) --in_flight_;
    }
    idle_cv_.notify_all();
}

// ─────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────

bool Executor::cancel(const TaskId& id) {
    std::shared_ptr<TaskHandle> handle;
    CancelOutcome outcome{};
    {
        std::lock_guard lock(mutex_);
        handle = registry_.find(id);
        if (!handle) return false;

        outcome = handle->request_cancel();
        switch (outcome) {
            case CancelOutcome::CancelledPending:
                registry_.remove(id);
                --pending_count_;
                ++cancelled_total_;
                break;
            case CancelOutcome::FlagSet:
                break;
            case CancelOutcome::AlreadyTerminal:
                registry_.remove(id);
                break;
        }
    }

    switch (outcome) {
        case CancelOutcome::CancelledPending:
            logger_.debug("Cancelled pending task " + id);
            finish_callbacks(*handle);
            return true;
        case CancelOutcome::FlagSet:
            logger_.debug("Cancellation requested for running task " + id);
            return true;
        case CancelOutcome::AlreadyTerminal:
            logger_.warn("Registry held terminal task " + id + " at cancel time");
            return false;
    }
    return false;
}

bool Executor::wait_for_completion(std::chrono::milliseconds timeout) {
    return wait_for_in_flight(0, timeout);
}

bool Executor::wait_for_in_flight(size_t allowed, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this, allowed] { return in_flight_ <= allowed; });
}

// ─────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────

void Executor::shutdown() {
    shutdown(std::chrono::milliseconds(config_.shutdown_grace_ms));
}

void Executor::shutdown(std::chrono::milliseconds grace) {
    if (shutdown_started_.exchange(true)) return;

    logger_.info("Executor shutting down");

    std::vector<std::shared_ptr<TaskHandle>> cancelled_pending;
    size_t flagged = 0;
    {
        std::lock_guard lock(mutex_);
        shut_down_ = true;
        for (auto& handle : registry_.live_handles()) {
            switch (handle->request_cancel()) {
                case CancelOutcome::CancelledPending:
                    registry_.remove(handle->id());
                    --pending_count_;
                    ++cancelled_total_;
                    cancelled_pending.push_back(handle);
                    break;
                case CancelOutcome::FlagSet:
                    ++flagged;
                    break;
                case CancelOutcome::AlreadyTerminal:
                    registry_.remove(handle->id());
                    break;
            }
        }
    }

    for (auto& handle : cancelled_pending) {
        finish_callbacks(*handle);
    }

    auto discarded = pool_.discard_queued();
    logger_.info("Shutdown: cancelled " + std::to_string(cancelled_pending.size())
                 + " pending, signalled " + std::to_string(flagged)
                 + " running, discarded " + std::to_string(discarded) + " queued jobs");

    // Called from one of our own tasks or callbacks: that task cannot finish
    // until shutdown() returns, so it is not waited for.
    const size_t own = t_running_for == this ? 1 : 0;
    if (!wait_for_in_flight(own, grace)) {
        logger_.warn("Some tasks did not complete within the shutdown grace period ("
                     + std::to_string(pool_info().active_count) + " still running)");
    }

    if (janitor_) janitor_->stop();
    pool_.shutdown();

    auto info = pool_info();
    logger_.info("Executor stopped: " + std::to_string(info.completed_total) + " completed, "
                 + std::to_string(info.failed_total) + " failed, "
                 + std::to_string(info.cancelled_total) + " cancelled");

    pipeline_.stop();
}

bool Executor::is_shut_down() const {
    std::lock_guard lock(mutex_);
    return shut_down_;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

PoolInfo Executor::pool_info() const {
    std::lock_guard lock(mutex_);
    return pool_info_locked();
}

PoolInfo Executor::pool_info_locked() const {
    return PoolInfo{
        .active_count = running_count_,
        .max_workers = config_.max_workers,
        .completed_total = completed_total_,
        .failed_total = failed_total_,
        .cancelled_total = cancelled_total_,
        .submitted_total = submitted_total_,
        .pending_count = pending_count_,
        .tracked_count = registry_.size()
    };
}

HealthReport Executor::health() const {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard lock(mutex_);
    HealthReport report;
    report.active_count = running_count_;
    report.max_workers = config_.max_workers;
    report.load_percentage = config_.max_workers == 0 ? 0.0
        : 100.0 * static_cast<double>(running_count_) / static_cast<double>(config_.max_workers);

    if (running_count_ >= config_.max_workers && pending_count_ > 0) {
        report.status = HealthStatus::Overloaded;
    } else if (report.load_percentage >= 75.0) {
        report.status = HealthStatus::Busy;
    }

    for (const auto& handle : registry_.live_handles()) {
        if (handle->exceeded_timeout(now)) report.long_running_tasks.push_back(handle->id());
    }
    return report;
}

RegistryAudit Executor::audit_registry() {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard lock(mutex_);
    RegistryAudit audit;
    audit.anomalies = registry_.sweep();
    for (const auto& handle : registry_.live_handles()) {
        if (handle->exceeded_timeout(now)) audit.long_running.push_back(handle->id());
    }
    audit.pool = pool_info_locked();
    return audit;
}

}  // namespace async_executor
