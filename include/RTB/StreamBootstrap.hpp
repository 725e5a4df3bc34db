#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "RTB/Error.h"
#include "RTB/IAudioPlatform.h"

namespace spdlog {
    class logger;
}

namespace RTB {

enum class BootstrapState {
    Pending,    // Module load or node construction still in progress
    Active,     // Render node connected, callbacks may run
    Failed,     // Activation failed, stream renders nothing
    Cancelled   // Stopped by release before activation
};

const char* bootstrapStateToString(BootstrapState state);

/**
 * @brief Control-side holder for the render node once the bootstrap creates it.
 */
struct RenderNodeSlot {
    std::mutex mutex;
    std::shared_ptr<IRenderNode> node;
};

/**
 * @class StreamBootstrap
 * @brief Background task that activates the render callback for one stream.
 *
 * Loads the render module, constructs the render node with the host moved into
 * it and connects it to the output. Runs on its own thread so startStream can
 * return immediately; failures are logged and visible through state(). The task
 * can be cancelled and is always joined by cancel() or the destructor.
 */
class StreamBootstrap {
public:
    StreamBootstrap(std::shared_ptr<IAudioContext> context,
                    std::string moduleName,
                    std::unique_ptr<Render::RenderHost> host,
                    std::shared_ptr<RenderNodeSlot> nodeSlot,
                    std::shared_ptr<spdlog::logger> logger);

    ~StreamBootstrap();

    StreamBootstrap(const StreamBootstrap&) = delete;
    StreamBootstrap& operator=(const StreamBootstrap&) = delete;

    BootstrapState state() const noexcept { return state_.load(std::memory_order_acquire); }

    /// Platform error that made the bootstrap fail, if any.
    std::optional<PlatformError> failure() const;

    /**
     * @brief Wait for the bootstrap to leave the Pending state
     * @param timeout Maximum time to wait
     * @return The state reached, Pending on timeout
     */
    BootstrapState wait(std::chrono::milliseconds timeout) const;

    /**
     * @brief Request stop and join the task. Idempotent.
     */
    void cancel();

private:
    void run(std::stop_token stopToken);
    void finish(BootstrapState state, std::optional<PlatformError> error = std::nullopt);
    void fail(const char* step, PlatformError error);

    std::shared_ptr<IAudioContext> context_;
    std::string moduleName_;
    std::unique_ptr<Render::RenderHost> host_;
    std::shared_ptr<RenderNodeSlot> nodeSlot_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<BootstrapState> state_{BootstrapState::Pending};
    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCond_;
    std::optional<PlatformError> failure_;

    std::jthread thread_;
};

} // namespace RTB
