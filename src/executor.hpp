#pragma once

// Process-global Taskflow executor for I/O-adjacent parallel work
// (decoding every published slice). The fold itself runs on the
// replica's own BS::thread_pool.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace semilog_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace semilog_cpp::detail
