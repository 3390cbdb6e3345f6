/**
 * @file janitor.cpp
 * @brief Janitor implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/janitor.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace async_executor {

Janitor::Janitor(IRegistryAuditor& auditor, Logger logger, std::chrono::milliseconds interval)
    : auditor_(auditor)
    , logger_(std::move(logger))
    , interval_(interval) {}

Janitor::~Janitor() {
    stop();
}

void Janitor::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        loop(stop);
    });
    logger_.debug("Janitor started (interval: " + std::to_string(interval_.count()) + "ms)");
}

void Janitor::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wake_cv_.notify_all();
    thread_.join();
    logger_.debug("Janitor stopped after " + std::to_string(ticks()) + " passes");
}

void Janitor::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            wake_cv_.wait_for(lock, stop, interval_, [&stop] { return stop.stop_requested(); });
            if (stop.stop_requested()) return;
        }
        tick();
    }
}

JanitorReport Janitor::tick() {
    auto audit = auditor_.audit_registry();

    JanitorReport report;
    report.anomalies = audit.anomalies.size();
    report.pool = audit.pool;

    for (const auto& anomaly : audit.anomalies) {
        logger_.warn("Registry inconsistency: task " + anomaly.id + " " + anomaly.reason);
    }

    {
        std::lock_guard lock(mutex_);
        ++ticks_;

        // Forget tasks that are no longer overdue (finished or pruned).
        std::set<TaskId> still_overdue(audit.long_running.begin(), audit.long_running.end());
        std::set<TaskId> kept;
        std::set_intersection(reported_overdue_.begin(), reported_overdue_.end(),
                              still_overdue.begin(), still_overdue.end(),
                              std::inserter(kept, kept.end()));
        reported_overdue_.swap(kept);

        for (const auto& id : audit.long_running) {
            if (reported_overdue_.insert(id).second) report.newly_overdue.push_back(id);
        }
    }

    for (const auto& id : report.newly_overdue) {
        logger_.warn("Task " + id + " is running past its advisory timeout");
    }

    logger_.debug("Pool: " + std::to_string(audit.pool.active_count) + "/"
                  + std::to_string(audit.pool.max_workers) + " active, "
                  + std::to_string(audit.pool.pending_count) + " pending, "
                  + std::to_string(audit.pool.tracked_count) + " tracked");
    return report;
}

uint64_t Janitor::ticks() const {
    std::lock_guard lock(mutex_);
    return ticks_;
}

}  // namespace async_executor
