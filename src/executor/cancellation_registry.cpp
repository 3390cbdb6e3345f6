/**
 * @file cancellation_registry.cpp
 * @brief CancellationRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/cancellation_registry.hpp"

namespace async_executor {

bool CancellationRegistry::add(const std::shared_ptr<TaskHandle>& handle) {
    if (!handle) return false;
    return entries_.try_emplace(handle->id(), handle).second;
}

bool CancellationRegistry::remove(const TaskId& id) {
    return entries_.erase(id) > 0;
}

std::shared_ptr<TaskHandle> CancellationRegistry::find(const TaskId& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return it->second.lock();
}

bool CancellationRegistry::contains(const TaskId& id) const {
    return entries_.contains(id);
}

std::vector<TaskId> CancellationRegistry::ids() const {
    std::vector<TaskId> out;
    out.reserve(entries_.size());
    for (const auto& [id, weak] : entries_) out.push_back(id);
    return out;
}

std::vector<std::shared_ptr<TaskHandle>> CancellationRegistry::live_handles() const {
    std::vector<std::shared_ptr<TaskHandle>> out;
    out.reserve(entries_.size());
    for (const auto& [id, weak] : entries_) {
        if (auto handle = weak.lock()) out.push_back(std::move(handle));
    }
    return out;
}

std::vector<RegistryAnomaly> CancellationRegistry::sweep() {
    std::vector<RegistryAnomaly> anomalies;

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        auto handle = it->second.lock();
        if (!handle) {
            anomalies.push_back({it->first, "handle reclaimed while still registered"});
            it = entries_.erase(it);
        } else if (handle->is_terminal()) {
            anomalies.push_back({it->first,
                "handle already " + std::string{to_string(handle->state())}});
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return anomalies;
}

}  // namespace async_executor
