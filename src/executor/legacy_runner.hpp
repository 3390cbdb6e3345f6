/**
 * @file legacy_runner.hpp
 * @brief "Run in thread" call style on top of Executor::submit.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "executor/executor.hpp"

#include <utility>

namespace async_executor {

/**
 * @brief Adapter for callers that only want a task id back.
 *
 * Holds no state of its own; every call is a plain Executor::submit.
 */
class LegacyRunner {
public:
    explicit LegacyRunner(Executor& executor) noexcept : executor_(executor) {}

    template <typename F, typename... Args>
        requires TaskFunction<std::decay_t<F>, std::decay_t<Args>...>
    Result<TaskId> run_in_thread(F&& fn, Args&&... args) {
        auto submitted = executor_.submit(std::forward<F>(fn), std::forward<Args>(args)...);
        if (!submitted) return submitted.error();
        return submitted->id;
    }

    bool cancel(const TaskId& id) { return executor_.cancel(id); }

private:
    Executor& executor_;
};

}  // namespace async_executor
