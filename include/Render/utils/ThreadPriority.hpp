#pragma once

#include <memory>
#include <thread>

namespace spdlog {
    class logger;
}

namespace RTB {
namespace Render {
namespace ThreadPriority {

/// SCHED_FIFO priority used for the device clock thread.
constexpr int kRealtimePriority = 80;

/**
 * @brief Move a thread to the real-time FIFO scheduling class.
 *
 * Best effort: unprivileged processes usually get EPERM, in which case the
 * thread keeps its normal policy and a warning is logged.
 * @return true if the policy was applied
 */
bool promoteToRealtime(std::thread::native_handle_type thread,
                       int priority,
                       const std::shared_ptr<spdlog::logger>& logger);

/**
 * @brief Name a thread for debuggers and top(1). Truncated to 15 characters.
 */
bool setName(std::thread::native_handle_type thread, const char* name);

} // namespace ThreadPriority
} // namespace Render
} // namespace RTB
