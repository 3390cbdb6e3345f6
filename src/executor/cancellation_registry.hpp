/**
 * @file cancellation_registry.hpp
 * @brief id -> weak TaskHandle lookup for cancel-by-id.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "executor/task_handle.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace async_executor {

/**
 * @brief Registry entry found to be inconsistent by sweep().
 */
struct RegistryAnomaly {
    TaskId id;
    std::string reason;
};

/**
 * @brief O(1) map from task id to a non-owning reference to its handle.
 *
 * An entry exists while its task is Pending or Running. The completion path
 * removes it synchronously; sweep() catches anything that slipped through.
 *
 * Not internally synchronized: the Executor serializes every access under
 * its own mutex.
 */
class CancellationRegistry {
public:
    /// False if the id is already registered.
    bool add(const std::shared_ptr<TaskHandle>& handle);

    /// False if the id was not present (already removed or unknown).
    bool remove(const TaskId& id);

    /// Live handle for id, or nullptr if unknown or already reclaimed.
    [[nodiscard]] std::shared_ptr<TaskHandle> find(const TaskId& id) const;

    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] std::vector<TaskId> ids() const;

    /// Live handles, in no particular order.
    [[nodiscard]] std::vector<std::shared_ptr<TaskHandle>> live_handles() const;

    /**
     * @brief Remove entries whose handle was reclaimed or is already terminal.
     * @return One anomaly per removed entry.
     */
    std::vector<RegistryAnomaly> sweep();

    void clear() noexcept { entries_.clear(); }

private:
    std::unordered_map<TaskId, std::weak_ptr<TaskHandle>> entries_;
};

}  // namespace async_executor
