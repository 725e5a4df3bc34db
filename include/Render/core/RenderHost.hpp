#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>

#include "RTB/IProcessor.hpp"
#include "Render/core/HandoffChannel.hpp"
#include "Render/core/LivenessFlag.hpp"
#include "Render/core/SharedBufferPool.hpp"

namespace RTB {
namespace Render {

enum class RenderHostState : uint8_t {
    AwaitingProcessor,
    Active
};

/**
 * @class RenderHost
 * @brief Render-thread side of a stream.
 *
 * Owns the receiving end of the processor channel, a handle to the shared
 * buffer pool and a reference to the stream's liveness flag. The platform calls
 * render() once per device period. Until a processor arrives every block is
 * silence; afterwards the processor is driven over the pool's regions.
 *
 * render() never blocks, locks or allocates. The host itself must be destroyed
 * off the render thread.
 */
class RenderHost {
public:
    RenderHost(HandoffReceiver<IProcessor> receiver,
               std::shared_ptr<const LivenessFlag> alive,
               std::shared_ptr<SharedBufferPool> buffers,
               uint32_t sampleRate);

    ~RenderHost() = default;

    RenderHost(const RenderHost&) = delete;
    RenderHost& operator=(const RenderHost&) = delete;

    /**
     * @brief Process one device callback.
     * @param input Interleaved input from the device, may be empty
     * @param output Interleaved output to the device, numOutChannels * frames
     * @param frames Frames in this callback, at most the pool's block size
     */
    void render(std::span<const float> input, std::span<float> output, uint32_t frames) noexcept;

    RenderHostState state() const noexcept { return state_.load(std::memory_order_acquire); }

    uint32_t numInChannels() const noexcept { return numInChannels_; }
    uint32_t numOutChannels() const noexcept { return numOutChannels_; }
    uint32_t blockFrames() const noexcept { return blockFrames_; }
    uint32_t sampleRate() const noexcept { return sampleRate_; }

    // Counters, readable from any thread.
    uint64_t callbackCount() const noexcept { return callbacks_.load(std::memory_order_relaxed); }
    uint64_t silentCallbackCount() const noexcept { return silentCallbacks_.load(std::memory_order_relaxed); }
    uint64_t processedBlockCount() const noexcept { return processedBlocks_.load(std::memory_order_relaxed); }

private:
    void writeSilence(std::span<float> output) noexcept;

    HandoffReceiver<IProcessor> receiver_;
    std::unique_ptr<IProcessor> processor_;
    std::shared_ptr<const LivenessFlag> alive_;
    std::shared_ptr<SharedBufferPool> buffers_;

    std::span<float> inputRegion_;
    std::span<float> outputRegion_;
    uint32_t numInChannels_;
    uint32_t numOutChannels_;
    uint32_t blockFrames_;
    uint32_t sampleRate_;

    std::atomic<RenderHostState> state_{RenderHostState::AwaitingProcessor};
    std::atomic<uint64_t> callbacks_{0};
    std::atomic<uint64_t> silentCallbacks_{0};
    std::atomic<uint64_t> processedBlocks_{0};
};

} // namespace Render
} // namespace RTB
