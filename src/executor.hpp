#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Parallel rendering of large
// documents submits its per-paragraph work through this executor.
//
// Internal header — not installed.

#include <taskflow/algorithm/for_each.hpp>
#include <taskflow/taskflow.hpp>

namespace docspan_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace docspan_cpp::detail
