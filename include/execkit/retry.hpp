#pragma once

#include "execkit/errors.hpp"
#include "execkit/utility.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace execkit {

/** @brief Values that have a natural notion of "non-empty" or "set". */
template <typename T>
concept Truthy = std::is_constructible_v<bool, const T &> || requires(const T &value) {
    { value.empty() } -> std::convertible_to<bool>;
};

/**
 * @brief Default success predicate: `bool` conversion where the value has
 * one, otherwise non-emptiness.
 */
struct truthy_fn {
    template <Truthy T>
    bool operator()(const T &value) const {
        if constexpr (std::is_constructible_v<bool, const T &>)
            return static_cast<bool>(value);
        else
            return !value.empty();
    }
};

inline constexpr truthy_fn truthy{};

struct no_wait {
    void operator()(size_t) const noexcept {
    }
};

template <typename Task>
using task_result_t = std::remove_cvref_t<std::invoke_result_t<Task &>>;

/**
 * @brief Calls `task` up to `retries` times until `check` accepts its result.
 *
 * After each rejected attempt except the last, `wait(attempt)` is called with
 * the 0-based index of the attempt that just failed. A `retries` of zero
 * makes no attempt at all.
 *
 * @param retries Maximum number of attempts.
 * @param task Zero-argument callable producing the value to check.
 * @param check Predicate deciding whether a result counts as success.
 * @param wait Side effect between attempts (backoff sleep, cleanup).
 * @return The first accepted result, or `RetryExhausted` naming `retries`.
 */
template <typename Task, typename Check = truthy_fn, typename Wait = no_wait>
    requires std::invocable<Task &> && std::invocable<Wait &, size_t>
Result<task_result_t<Task>, RetryExhausted> retry(size_t retries, Task &&task, Check &&check = {}, Wait &&wait = {}) {
    static_assert(!std::is_void_v<task_result_t<Task>>, "retry needs a task that returns a value to check");

    for (size_t attempt = 0; attempt < retries; ++attempt) {
        task_result_t<Task> ret = std::invoke(task);
        if (std::invoke(check, std::as_const(ret)))
            return ret;
        if (attempt + 1 < retries)
            std::invoke(wait, attempt);
    }
    return std::unexpected(RetryExhausted{retries});
}

} // namespace execkit
