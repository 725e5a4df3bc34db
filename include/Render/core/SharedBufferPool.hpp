#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <system_error>

namespace spdlog {
    class logger;
}

namespace RTB {
namespace Render {

/**
 * @class SharedBufferPool
 * @brief Fixed-size interleaved input/output sample regions for one stream.
 *
 * Both regions live in a single anonymous mapping that is zero-filled and, when
 * the process is allowed to, locked into memory. The pool is shared between the
 * backend and the render host; the mapping is released when the last owner
 * goes away, which may be after the backend itself has been destroyed.
 *
 * After activation only the render thread touches the sample contents.
 */
class SharedBufferPool {
public:
    /**
     * @brief Allocate the pool.
     * @param numInChannels Input channels (may be zero)
     * @param numOutChannels Output channels
     * @param blockFrames Frames per block
     * @param logger Logger for allocation diagnostics
     * @return The pool, or the system error that prevented mapping it
     */
    static std::expected<std::shared_ptr<SharedBufferPool>, std::error_code>
    create(uint32_t numInChannels,
           uint32_t numOutChannels,
           uint32_t blockFrames,
           std::shared_ptr<spdlog::logger> logger);

    ~SharedBufferPool();

    SharedBufferPool(const SharedBufferPool&) = delete;
    SharedBufferPool& operator=(const SharedBufferPool&) = delete;

    std::span<float> inputRegion() noexcept { return {input_, inputSamples_}; }
    std::span<float> outputRegion() noexcept { return {output_, outputSamples_}; }

    uint32_t numInChannels() const noexcept { return numInChannels_; }
    uint32_t numOutChannels() const noexcept { return numOutChannels_; }
    uint32_t blockFrames() const noexcept { return blockFrames_; }

    /// True if the pages were successfully locked into memory.
    bool isLocked() const noexcept { return locked_; }

    std::size_t mappedBytes() const noexcept { return mappedBytes_; }

private:
    SharedBufferPool(uint32_t numInChannels,
                     uint32_t numOutChannels,
                     uint32_t blockFrames,
                     std::shared_ptr<spdlog::logger> logger);

    std::error_code map();

    uint32_t numInChannels_;
    uint32_t numOutChannels_;
    uint32_t blockFrames_;
    std::size_t inputSamples_;
    std::size_t outputSamples_;

    void* mapping_{nullptr};
    std::size_t mappedBytes_{0};
    bool locked_{false};

    float* input_{nullptr};
    float* output_{nullptr};

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace Render
} // namespace RTB
