#include "Render/core/SharedBufferPool.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <sys/mman.h>
#include <unistd.h>

namespace {
    constexpr std::size_t kRegionAlignment = 64; // cache line

    constexpr std::size_t alignUp(std::size_t value, std::size_t alignment) {
        return (value + alignment - 1) / alignment * alignment;
    }
}

namespace RTB {
namespace Render {

std::expected<std::shared_ptr<SharedBufferPool>, std::error_code>
SharedBufferPool::create(uint32_t numInChannels,
                         uint32_t numOutChannels,
                         uint32_t blockFrames,
                         std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        logger = spdlog::default_logger();
    }
    if (blockFrames == 0 || numOutChannels == 0) {
        logger->error("SharedBufferPool::create: invalid layout ({} in, {} out, {} frames)",
                      numInChannels, numOutChannels, blockFrames);
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::shared_ptr<SharedBufferPool> pool(
        new SharedBufferPool(numInChannels, numOutChannels, blockFrames, std::move(logger)));
    if (auto ec = pool->map()) {
        return std::unexpected(ec);
    }
    return pool;
}

SharedBufferPool::SharedBufferPool(uint32_t numInChannels,
                                   uint32_t numOutChannels,
                                   uint32_t blockFrames,
                                   std::shared_ptr<spdlog::logger> logger)
    : numInChannels_(numInChannels)
    , numOutChannels_(numOutChannels)
    , blockFrames_(blockFrames)
    , inputSamples_(static_cast<std::size_t>(numInChannels) * blockFrames)
    , outputSamples_(static_cast<std::size_t>(numOutChannels) * blockFrames)
    , logger_(std::move(logger)) {
}

SharedBufferPool::~SharedBufferPool() {
    if (!mapping_) {
        return;
    }
    if (locked_) {
        ::munlock(mapping_, mappedBytes_);
    }
    if (::munmap(mapping_, mappedBytes_) != 0) {
        logger_->warn("SharedBufferPool: munmap failed: errno {}", errno);
    } else {
        logger_->debug("SharedBufferPool: released {} bytes", mappedBytes_);
    }
}

std::error_code SharedBufferPool::map() {
    const std::size_t inputBytes = alignUp(inputSamples_ * sizeof(float), kRegionAlignment);
    const std::size_t outputBytes = outputSamples_ * sizeof(float);
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    const std::size_t page = pageSize > 0 ? static_cast<std::size_t>(pageSize) : 4096;

    mappedBytes_ = alignUp(inputBytes + outputBytes, page);

    // Anonymous mappings come back zero-filled.
    void* ptr = ::mmap(nullptr, mappedBytes_, PROT_READ | PROT_WRITE,
                       MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (ptr == MAP_FAILED) {
        const int err = errno;
        logger_->error("SharedBufferPool::map: mmap of {} bytes failed: errno {}", mappedBytes_, err);
        mappedBytes_ = 0;
        return {err, std::system_category()};
    }
    mapping_ = ptr;

    if (::mlock(mapping_, mappedBytes_) != 0) {
        logger_->warn("SharedBufferPool::map: mlock failed: errno {} (continuing unlocked)", errno);
    } else {
        locked_ = true;
    }

    auto* base = static_cast<std::byte*>(mapping_);
    input_ = inputSamples_ > 0 ? reinterpret_cast<float*>(base) : nullptr;
    output_ = reinterpret_cast<float*>(base + inputBytes);

    logger_->debug("SharedBufferPool: mapped {} bytes ({} input / {} output samples, locked={})",
                   mappedBytes_, inputSamples_, outputSamples_, locked_);
    return {};
}

} // namespace Render
} // namespace RTB
