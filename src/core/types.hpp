/**
 * @file types.hpp
 * @brief Fundamental types used throughout AsyncExecutor.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, TaskState, and the immutable snapshot types the Executor
 * publishes (PoolInfo, HealthReport). All types have value semantics.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace async_executor {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Pending,       ///< Submitted, waiting for a worker
    Running,       ///< Currently executing on a worker
    Completed,     ///< Finished successfully
    Failed,        ///< User function raised
    Cancelled      ///< Cancelled before running, or honoured cancellation
};

/**
 * @brief Convert TaskState to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:    return "pending";
        case TaskState::Running:    return "running";
        case TaskState::Completed:  return "completed";
        case TaskState::Failed:     return "failed";
        case TaskState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Completed
        || state == TaskState::Failed
        || state == TaskState::Cancelled;
}

// ─────────────────────────────────────────────
// Pool snapshots
// ─────────────────────────────────────────────

/**
 * @brief Point-in-time view of the worker pool.
 *
 * Taken under the Executor mutex, so all counters are mutually consistent.
 */
struct PoolInfo {
    size_t active_count{0};        ///< Tasks currently Running
    size_t max_workers{0};
    uint64_t completed_total{0};
    uint64_t failed_total{0};
    uint64_t cancelled_total{0};
    uint64_t submitted_total{0};
    size_t pending_count{0};       ///< Tasks submitted but not yet started
    size_t tracked_count{0};       ///< Registry entries (Pending + Running)
};

enum class HealthStatus : uint8_t {
    Healthy,
    Busy,
    Overloaded
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:    return "Healthy";
        case HealthStatus::Busy:       return "Busy";
        case HealthStatus::Overloaded: return "Overloaded";
    }
    return "unknown";
}

struct HealthReport {
    size_t active_count{0};
    size_t max_workers{0};
    double load_percentage{0.0};
    HealthStatus status{HealthStatus::Healthy};
    std::vector<TaskId> long_running_tasks;  ///< Running past their advisory timeout
};

}  // namespace async_executor
