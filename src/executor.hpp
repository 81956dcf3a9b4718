#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). The editor's format codec calls
// run on it.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace blocktree_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace blocktree_cpp::detail
