#pragma once

#include <exception>
#include <string>

#include "log/log.hpp"
#include "task.hpp"

namespace pasture {

/// Await `inner` and log any exception it ends with instead of keeping it
/// in the promise, where nobody would look for it once the task is detached.
inline task<> guarded(task<> inner, std::string context) {
    try {
        co_await inner;
    } catch (const std::exception& e) {
        log::logger().log_error("{}: task failed: {}", context, e.what());
    }
}

} // namespace pasture
