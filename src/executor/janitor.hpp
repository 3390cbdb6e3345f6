/**
 * @file janitor.hpp
 * @brief Periodic registry audit for an Executor.
 * @author Dimitris Kafetzis
 *
 * Runs a dedicated std::jthread that wakes at a fixed interval, prunes dead
 * or terminal registry entries, and warns once per task that is still
 * running past its advisory timeout. The Janitor only observes tasks: it
 * never cancels or otherwise mutates them.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/cancellation_registry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>
#include <vector>

namespace async_executor {

/**
 * @brief Outcome of one registry audit.
 */
struct RegistryAudit {
    std::vector<RegistryAnomaly> anomalies;   ///< Entries removed by this audit
    std::vector<TaskId> long_running;         ///< Running past their advisory timeout
    PoolInfo pool;
};

/**
 * @brief Anything that can sweep its task registry on request.
 */
class IRegistryAuditor {
public:
    virtual ~IRegistryAuditor() = default;
    virtual RegistryAudit audit_registry() = 0;
};

/**
 * @brief What a single janitor pass found.
 */
struct JanitorReport {
    size_t anomalies{0};
    std::vector<TaskId> newly_overdue;   ///< Warned about in this pass
    PoolInfo pool;
};

class Janitor {
public:
    Janitor(IRegistryAuditor& auditor, Logger logger, std::chrono::milliseconds interval);
    ~Janitor();

    // Non-copyable
    Janitor(const Janitor&) = delete;
    Janitor& operator=(const Janitor&) = delete;

    void start();
    void stop();

    /// Run one audit pass on the calling thread.
    JanitorReport tick();

    [[nodiscard]] uint64_t ticks() const;
    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

private:
    void loop(std::stop_token stop);

    IRegistryAuditor& auditor_;
    Logger logger_;
    const std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_cv_;
    std::set<TaskId> reported_overdue_;
    uint64_t ticks_{0};

    std::jthread thread_;
};

}  // namespace async_executor
