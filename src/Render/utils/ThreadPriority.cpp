#include "Render/utils/ThreadPriority.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <pthread.h>
#include <sched.h>

namespace RTB {
namespace Render {
namespace ThreadPriority {

bool promoteToRealtime(std::thread::native_handle_type thread,
                       int priority,
                       const std::shared_ptr<spdlog::logger>& logger) {
    const int minPriority = ::sched_get_priority_min(SCHED_FIFO);
    const int maxPriority = ::sched_get_priority_max(SCHED_FIFO);

    sched_param param{};
    param.sched_priority = std::clamp(priority, minPriority, maxPriority);

    const int rc = ::pthread_setschedparam(thread, SCHED_FIFO, &param);
    if (rc != 0) {
        if (logger) {
            logger->warn("ThreadPriority: SCHED_FIFO/{} not applied: {} (running with default policy)",
                         param.sched_priority, std::strerror(rc));
        }
        return false;
    }
    if (logger) {
        logger->debug("ThreadPriority: thread promoted to SCHED_FIFO/{}", param.sched_priority);
    }
    return true;
}

bool setName(std::thread::native_handle_type thread, const char* name) {
    char truncated[16] = {};
    std::strncpy(truncated, name, sizeof(truncated) - 1);
    return ::pthread_setname_np(thread, truncated) == 0;
}

} // namespace ThreadPriority
} // namespace Render
} // namespace RTB
