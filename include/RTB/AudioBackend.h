// include/RTB/AudioBackend.h
#pragma once

#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "RTB/Error.h"
#include "RTB/IAudioPlatform.h"
#include "RTB/IProcessor.hpp"
#include "RTB/StreamBootstrap.hpp"
#include "RTB/StreamTypes.hpp"
#include "Render/core/HandoffChannel.hpp"
#include "Render/core/LivenessFlag.hpp"
#include "Render/core/SharedBufferPool.hpp"

namespace RTB {

class AudioBackend;

/**
 * @brief Result of a successful startStream call.
 */
struct StreamHandle {
    std::unique_ptr<AudioBackend> backend;
    StreamInfo info;
};

/**
 * @brief Control-thread side of one audio stream.
 *
 * Created by startStream(), which returns as soon as the platform context is
 * open; the render callback is activated asynchronously by a StreamBootstrap.
 * A processor may be installed at any time after construction. Releasing (or
 * destroying) the backend marks the stream dead, disconnects the render node
 * and closes the context.
 */
class AudioBackend {
public:
    /**
     * @brief Input devices visible to this backend (none)
     */
    static std::vector<DeviceInfo> availableInputDevices();

    /**
     * @brief Output devices visible to this backend (the default output only)
     */
    static std::vector<DeviceInfo> availableOutputDevices();

    /**
     * @brief Open a stream on the given platform.
     * @param platform Platform audio system
     * @param config Stream configuration
     * @return Backend and negotiated stream info, or Initialization on failure
     */
    static std::expected<StreamHandle, StartStreamError>
    startStream(std::shared_ptr<IAudioPlatform> platform, const StreamConfig& config);

    ~AudioBackend();

    AudioBackend(const AudioBackend&) = delete;
    AudioBackend& operator=(const AudioBackend&) = delete;

    /**
     * @brief Hand the processor to the render thread.
     *
     * Never blocks. If the render side is unreachable, or activation has
     * failed, the stream is recorded as dropped and the next pollStatus()
     * reports UnexpectedDrop.
     */
    void installProcessor(std::unique_ptr<IProcessor> processor);

    /**
     * @brief Report whether the render side is still reachable
     * @return Success, or UnexpectedDrop once a drop has been recorded
     */
    std::expected<void, StreamError> pollStatus() const noexcept;

    /**
     * @brief Tear the stream down. Safe to call repeatedly and in any state.
     */
    void release();

    const StreamInfo& streamInfo() const noexcept { return info_; }

    BootstrapState bootstrapState() const noexcept;

    /**
     * @brief Wait until activation succeeds, fails or is cancelled
     * @param timeout Maximum time to wait
     * @return The state reached, Pending on timeout
     */
    BootstrapState waitForBootstrap(std::chrono::milliseconds timeout) const;

    bool isAlive() const noexcept { return alive_->isAlive(); }
    bool isDropped() const noexcept { return dropped_.load(std::memory_order_acquire); }
    bool isReleased() const noexcept { return released_; }

    /// One-line state summary for logs.
    std::string describe() const;

private:
    AudioBackend(std::shared_ptr<IAudioContext> context,
                 Render::HandoffSender<IProcessor> sender,
                 std::shared_ptr<Render::LivenessFlag> alive,
                 std::shared_ptr<Render::SharedBufferPool> buffers,
                 std::shared_ptr<RenderNodeSlot> nodeSlot,
                 std::unique_ptr<StreamBootstrap> bootstrap,
                 StreamInfo info,
                 std::shared_ptr<spdlog::logger> logger);

    std::shared_ptr<IAudioContext> context_;
    Render::HandoffSender<IProcessor> sender_;
    std::shared_ptr<Render::LivenessFlag> alive_;
    std::shared_ptr<Render::SharedBufferPool> buffers_;
    std::shared_ptr<RenderNodeSlot> nodeSlot_;
    std::unique_ptr<StreamBootstrap> bootstrap_;
    StreamInfo info_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<bool> dropped_{false};
    bool released_{false};
};

} // namespace RTB
