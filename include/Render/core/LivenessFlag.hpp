#pragma once

#include <atomic>

namespace RTB {
namespace Render {

/**
 * @class LivenessFlag
 * @brief Shared alive/dead marker for one stream.
 *
 * Written only by the control thread on teardown, read by both sides with
 * relaxed ordering. The transition is one way: once dead, always dead.
 */
class alignas(64) LivenessFlag {
public:
    LivenessFlag() = default;

    LivenessFlag(const LivenessFlag&) = delete;
    LivenessFlag& operator=(const LivenessFlag&) = delete;

    void markDead() noexcept { alive_.store(false, std::memory_order_relaxed); }

    bool isAlive() const noexcept { return alive_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> alive_{true};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace Render
} // namespace RTB
