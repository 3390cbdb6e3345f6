/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for submitted work.
 * @author Dimitris Kafetzis
 *
 * A task function is any callable invocable with its bound arguments,
 * optionally preceded by a TaskContext& through which it can poll for
 * cancellation and report progress.
 */

#pragma once

#include <concepts>
#include <functional>
#include <type_traits>

namespace async_executor {

class TaskContext;

/**
 * @concept ContextAwareTask
 * @brief Callable taking `TaskContext&` ahead of its bound arguments.
 */
template <typename F, typename... Args>
concept ContextAwareTask = std::invocable<F&, TaskContext&, Args&...>;

/**
 * @concept PlainTask
 * @brief Callable taking only its bound arguments.
 */
template <typename F, typename... Args>
concept PlainTask = !ContextAwareTask<F, Args...> && std::invocable<F&, Args&...>;

template <typename F, typename... Args>
concept TaskFunction = ContextAwareTask<F, Args...> || PlainTask<F, Args...>;

namespace detail {

template <typename F, typename... Args>
constexpr auto task_result_identity() {
    if constexpr (ContextAwareTask<F, Args...>) {
        return std::type_identity<std::invoke_result_t<F&, TaskContext&, Args&...>>{};
    } else {
        return std::type_identity<std::invoke_result_t<F&, Args&...>>{};
    }
}

}  // namespace detail

/// Return type of a task function, whichever form it takes.
template <typename F, typename... Args>
    requires TaskFunction<F, Args...>
using task_result_t = typename decltype(detail::task_result_identity<F, Args...>())::type;

}  // namespace async_executor
