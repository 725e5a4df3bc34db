#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "RTB/IAudioPlatform.h"

namespace spdlog {
    class logger;
}

namespace RTB {
namespace Platform {

/// Called on the clock thread with each rendered interleaved output block.
using OutputTap = std::function<void(std::span<const float> samples, uint32_t frames, uint32_t channels)>;

struct SoftwareClockOptions {
    uint32_t defaultSampleRate{48000};
    std::vector<uint32_t> supportedSampleRates{22050, 32000, 44100, 48000, 88200, 96000, 192000};

    /// Modules that loadModule() will find.
    std::set<std::string> registeredModules;

    /// Simulated latency of an asynchronous module load.
    std::chrono::milliseconds moduleLoadDelay{0};

    /// Try to run the clock thread with SCHED_FIFO.
    bool realtimePriority{true};

    /// Fault injection: make every createContext() fail.
    bool failContextCreation{false};

    OutputTap outputTap;

    std::shared_ptr<spdlog::logger> logger;
};

class SoftwareClockContext;

/**
 * @class SoftwareRenderNode
 * @brief Render node whose host is driven by the context's device clock.
 */
class SoftwareRenderNode : public IRenderNode {
public:
    SoftwareRenderNode(std::weak_ptr<SoftwareClockContext> context,
                       std::unique_ptr<Render::RenderHost> host);
    ~SoftwareRenderNode() override;

    std::expected<void, PlatformError> connectToDestination() override;
    std::expected<void, PlatformError> disconnect() override;

    bool isConnected() const noexcept { return connected_.load(std::memory_order_acquire); }

    /// Clock thread only.
    void renderBlock(std::span<float> output, uint32_t frames) noexcept;

    const Render::RenderHost& host() const noexcept { return *host_; }

private:
    std::weak_ptr<SoftwareClockContext> context_;
    std::unique_ptr<Render::RenderHost> host_;
    std::atomic<bool> connected_{false};
};

/**
 * @class SoftwareClockContext
 * @brief Audio context backed by a periodic clock thread.
 *
 * The clock wakes once per block period and renders the node connected to the
 * destination, handing each block to the output tap. One node can be connected
 * to the destination at a time.
 */
class SoftwareClockContext : public IAudioContext,
                             public std::enable_shared_from_this<SoftwareClockContext> {
public:
    static std::expected<std::shared_ptr<SoftwareClockContext>, PlatformError>
    create(uint32_t sampleRate, const SoftwareClockOptions& options);

    ~SoftwareClockContext() override;

    uint32_t sampleRate() const override { return sampleRate_; }
    std::future<std::expected<void, PlatformError>> loadModule(const std::string& moduleName) override;
    std::expected<std::shared_ptr<IRenderNode>, PlatformError>
    createRenderNode(const RenderNodeOptions& options, std::unique_ptr<Render::RenderHost> host) override;
    std::expected<void, PlatformError> close() override;

    bool isClosed() const noexcept { return closed_.load(std::memory_order_acquire); }
    uint64_t blocksRendered() const noexcept { return blocksRendered_.load(std::memory_order_relaxed); }
    uint64_t idleBlocks() const noexcept { return idleBlocks_.load(std::memory_order_relaxed); }
    uint64_t lateWakeups() const noexcept { return lateWakeups_.load(std::memory_order_relaxed); }

private:
    friend class SoftwareRenderNode;

    SoftwareClockContext(uint32_t sampleRate, const SoftwareClockOptions& options);

    std::expected<void, PlatformError> startClock();
    void stopClock();
    void clockLoop();

    std::expected<void, PlatformError> attach(SoftwareRenderNode* node);
    void detach(SoftwareRenderNode* node);

    struct ModuleRegistry {
        std::mutex mutex;
        std::condition_variable_any loadCond;
        std::set<std::string> available;
        std::set<std::string> loaded;
    };

    static std::expected<void, PlatformError> runModuleLoad(std::stop_token stopToken,
                                                            const std::shared_ptr<ModuleRegistry>& registry,
                                                            const std::string& moduleName,
                                                            std::chrono::milliseconds delay,
                                                            const std::shared_ptr<spdlog::logger>& logger);
    void stopModuleLoaders();

    uint32_t sampleRate_;
    uint32_t blockFrames_;
    uint32_t channels_;
    std::chrono::nanoseconds period_;
    SoftwareClockOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<ModuleRegistry> modules_;

    // Pending loads; close() stops and joins them.
    std::mutex loadersMutex_;
    std::vector<std::jthread> moduleLoaders_;

    std::mutex nodesMutex_;
    std::vector<std::shared_ptr<SoftwareRenderNode>> nodes_;

    std::atomic<SoftwareRenderNode*> destination_{nullptr};
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
    std::thread clockThread_;
    std::vector<float> outputBlock_;

    std::atomic<uint64_t> blocksRendered_{0};
    std::atomic<uint64_t> idleBlocks_{0};
    std::atomic<uint64_t> lateWakeups_{0};
};

/**
 * @class SoftwareClockPlatform
 * @brief Platform whose contexts are clocked in software.
 */
class SoftwareClockPlatform : public IAudioPlatform {
public:
    explicit SoftwareClockPlatform(SoftwareClockOptions options = {});

    std::expected<std::shared_ptr<IAudioContext>, PlatformError>
    createContext(std::optional<uint32_t> sampleRate) override;

    void registerModule(const std::string& moduleName);

    /// Most recently created context, for inspection.
    std::shared_ptr<SoftwareClockContext> lastContext() const;

private:
    SoftwareClockOptions options_;
    mutable std::mutex mutex_;
    std::weak_ptr<SoftwareClockContext> lastContext_;
};

} // namespace Platform
} // namespace RTB
