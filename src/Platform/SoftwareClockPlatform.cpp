#include "Platform/SoftwareClockPlatform.hpp"
#include "RTB/StreamTypes.hpp"
#include "Render/core/RenderHost.hpp"
#include "Render/utils/ThreadPriority.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <system_error>

namespace RTB {
namespace Platform {

// --- SoftwareRenderNode ---

SoftwareRenderNode::SoftwareRenderNode(std::weak_ptr<SoftwareClockContext> context,
                                       std::unique_ptr<Render::RenderHost> host)
    : context_(std::move(context))
    , host_(std::move(host)) {
}

SoftwareRenderNode::~SoftwareRenderNode() {
    if (auto context = context_.lock()) {
        context->detach(this);
    }
}

std::expected<void, PlatformError> SoftwareRenderNode::connectToDestination() {
    auto context = context_.lock();
    if (!context || context->isClosed()) {
        return std::unexpected(PlatformError::AlreadyClosed);
    }
    if (auto attached = context->attach(this); !attached) {
        return attached;
    }
    connected_.store(true, std::memory_order_release);
    return {};
}

std::expected<void, PlatformError> SoftwareRenderNode::disconnect() {
    if (!connected_.exchange(false, std::memory_order_acq_rel)) {
        return std::unexpected(PlatformError::NotConnected);
    }
    if (auto context = context_.lock()) {
        context->detach(this);
    }
    return {};
}

void SoftwareRenderNode::renderBlock(std::span<float> output, uint32_t frames) noexcept {
    host_->render({}, output, frames);
}

// --- SoftwareClockContext ---

std::expected<std::shared_ptr<SoftwareClockContext>, PlatformError>
SoftwareClockContext::create(uint32_t sampleRate, const SoftwareClockOptions& options) {
    std::shared_ptr<SoftwareClockContext> context(new SoftwareClockContext(sampleRate, options));
    if (auto started = context->startClock(); !started) {
        return std::unexpected(started.error());
    }
    return context;
}

SoftwareClockContext::SoftwareClockContext(uint32_t sampleRate, const SoftwareClockOptions& options)
    : sampleRate_(sampleRate)
    , blockFrames_(kBlockFrames)
    , channels_(kNumOutputChannels)
    , period_(std::chrono::nanoseconds(
          static_cast<int64_t>(kBlockFrames) * 1'000'000'000LL / sampleRate))
    , options_(options)
    , logger_(options.logger ? options.logger : spdlog::default_logger())
    , modules_(std::make_shared<ModuleRegistry>())
    , outputBlock_(static_cast<std::size_t>(kBlockFrames) * kNumOutputChannels, 0.0f) {
    modules_->available = options.registeredModules;
}

SoftwareClockContext::~SoftwareClockContext() {
    if (!isClosed()) {
        if (auto closed = close(); !closed) {
            logger_->warn("SoftwareClockContext: close on destruction failed");
        }
    }
}

std::expected<void, PlatformError> SoftwareClockContext::startClock() {
    running_.store(true, std::memory_order_release);
    try {
        clockThread_ = std::thread(&SoftwareClockContext::clockLoop, this);
    } catch (const std::system_error& e) {
        running_.store(false, std::memory_order_release);
        logger_->error("SoftwareClockContext: failed to start clock thread: {}", e.what());
        return std::unexpected(PlatformError::ClockStartFailed);
    }

    if (!Render::ThreadPriority::setName(clockThread_.native_handle(), "rtb-clock")) {
        logger_->debug("SoftwareClockContext: could not name clock thread");
    }
    bool realtime = false;
    if (options_.realtimePriority) {
        realtime = Render::ThreadPriority::promoteToRealtime(clockThread_.native_handle(),
                                                             Render::ThreadPriority::kRealtimePriority,
                                                             logger_);
    }
    logger_->info("SoftwareClockContext: clock running at {} Hz, period {} us, realtime={}",
                  sampleRate_, period_.count() / 1000, realtime);
    return {};
}

void SoftwareClockContext::stopClock() {
    running_.store(false, std::memory_order_release);
    if (clockThread_.joinable()) {
        clockThread_.join();
    }
}

void SoftwareClockContext::clockLoop() {
    auto next = std::chrono::steady_clock::now();
    std::span<float> block(outputBlock_);

    while (running_.load(std::memory_order_acquire)) {
        next += period_;

        SoftwareRenderNode* node = destination_.load(std::memory_order_acquire);
        if (node && node->isConnected()) {
            node->renderBlock(block, blockFrames_);
            blocksRendered_.fetch_add(1, std::memory_order_relaxed);
            if (options_.outputTap) {
                options_.outputTap(block, blockFrames_, channels_);
            }
        } else {
            idleBlocks_.fetch_add(1, std::memory_order_relaxed);
        }

        const auto now = std::chrono::steady_clock::now();
        if (now > next + period_) {
            // Fell more than a period behind; resynchronize instead of bursting.
            lateWakeups_.fetch_add(1, std::memory_order_relaxed);
            next = now;
        }
        std::this_thread::sleep_until(next);
    }
}

std::expected<void, PlatformError> SoftwareClockContext::attach(SoftwareRenderNode* node) {
    SoftwareRenderNode* expected = nullptr;
    if (!destination_.compare_exchange_strong(expected, node, std::memory_order_acq_rel)
        && expected != node) {
        logger_->error("SoftwareClockContext: destination already has a connected node");
        return std::unexpected(PlatformError::NodeCreationFailed);
    }
    return {};
}

void SoftwareClockContext::detach(SoftwareRenderNode* node) {
    // No-op unless this node is the current destination.
    SoftwareRenderNode* expected = node;
    destination_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
}

std::expected<void, PlatformError>
SoftwareClockContext::runModuleLoad(std::stop_token stopToken,
                                    const std::shared_ptr<ModuleRegistry>& registry,
                                    const std::string& moduleName,
                                    std::chrono::milliseconds delay,
                                    const std::shared_ptr<spdlog::logger>& logger) {
    std::unique_lock<std::mutex> lock(registry->mutex);
    if (delay.count() > 0) {
        // Simulated load latency, cut short by close().
        registry->loadCond.wait_for(lock, stopToken, delay, [] { return false; });
    }
    if (stopToken.stop_requested()) {
        logger->debug("SoftwareClockContext: load of module '{}' abandoned", moduleName);
        return std::unexpected(PlatformError::Cancelled);
    }
    if (!registry->available.contains(moduleName)) {
        logger->error("SoftwareClockContext: module '{}' is not registered", moduleName);
        return std::unexpected(PlatformError::ModuleNotFound);
    }
    registry->loaded.insert(moduleName);
    logger->debug("SoftwareClockContext: module '{}' loaded", moduleName);
    return {};
}

std::future<std::expected<void, PlatformError>>
SoftwareClockContext::loadModule(const std::string& moduleName) {
    auto promise = std::make_shared<std::promise<std::expected<void, PlatformError>>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(loadersMutex_);
    if (isClosed()) {
        promise->set_value(std::unexpected(PlatformError::AlreadyClosed));
        return future;
    }

    try {
        moduleLoaders_.emplace_back([promise, registry = modules_, moduleName,
                                     delay = options_.moduleLoadDelay, logger = logger_](std::stop_token st) {
            promise->set_value(runModuleLoad(st, registry, moduleName, delay, logger));
        });
    } catch (const std::system_error& e) {
        logger_->error("SoftwareClockContext: failed to start module loader: {}", e.what());
        promise->set_value(std::unexpected(PlatformError::ModuleLoadFailed));
    }
    return future;
}

void SoftwareClockContext::stopModuleLoaders() {
    std::vector<std::jthread> loaders;
    {
        std::lock_guard<std::mutex> lock(loadersMutex_);
        loaders.swap(moduleLoaders_);
    }
    for (auto& loader : loaders) {
        loader.request_stop();
    }
    // jthread joins on destruction.
    loaders.clear();
}

std::expected<std::shared_ptr<IRenderNode>, PlatformError>
SoftwareClockContext::createRenderNode(const RenderNodeOptions& options,
                                       std::unique_ptr<Render::RenderHost> host) {
    if (isClosed()) {
        return std::unexpected(PlatformError::AlreadyClosed);
    }
    {
        std::lock_guard<std::mutex> lock(modules_->mutex);
        if (modules_->loaded.empty()) {
            logger_->error("SoftwareClockContext: no render module loaded");
            return std::unexpected(PlatformError::NodeCreationFailed);
        }
    }
    if (!host || options.processorName.empty()) {
        return std::unexpected(PlatformError::NodeCreationFailed);
    }
    if (options.outputChannelCount != host->numOutChannels() || host->numOutChannels() != channels_) {
        logger_->error("SoftwareClockContext: node wants {} output channels, host has {}, device has {}",
                       options.outputChannelCount, host->numOutChannels(), channels_);
        return std::unexpected(PlatformError::NodeCreationFailed);
    }
    if (host->blockFrames() < blockFrames_) {
        logger_->error("SoftwareClockContext: host block of {} frames is smaller than device block {}",
                       host->blockFrames(), blockFrames_);
        return std::unexpected(PlatformError::NodeCreationFailed);
    }

    auto node = std::make_shared<SoftwareRenderNode>(weak_from_this(), std::move(host));
    {
        std::lock_guard<std::mutex> lock(nodesMutex_);
        nodes_.push_back(node);
    }
    logger_->debug("SoftwareClockContext: created render node '{}'", options.processorName);
    return node;
}

std::expected<void, PlatformError> SoftwareClockContext::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return std::unexpected(PlatformError::AlreadyClosed);
    }
    stopModuleLoaders();
    stopClock();
    destination_.store(nullptr, std::memory_order_release);

    // Hosts are destroyed here, after the clock thread has stopped.
    std::vector<std::shared_ptr<SoftwareRenderNode>> nodes;
    {
        std::lock_guard<std::mutex> lock(nodesMutex_);
        nodes.swap(nodes_);
    }
    nodes.clear();

    logger_->info("SoftwareClockContext: closed after {} blocks ({} idle)",
                  blocksRendered(), idleBlocks());
    return {};
}

// --- SoftwareClockPlatform ---

SoftwareClockPlatform::SoftwareClockPlatform(SoftwareClockOptions options)
    : options_(std::move(options)) {
    if (!options_.logger) {
        options_.logger = spdlog::default_logger();
    }
}

void SoftwareClockPlatform::registerModule(const std::string& moduleName) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.registeredModules.insert(moduleName);
}

std::shared_ptr<SoftwareClockContext> SoftwareClockPlatform::lastContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastContext_.lock();
}

std::expected<std::shared_ptr<IAudioContext>, PlatformError>
SoftwareClockPlatform::createContext(std::optional<uint32_t> sampleRate) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (options_.failContextCreation) {
        options_.logger->error("SoftwareClockPlatform: context creation disabled");
        return std::unexpected(PlatformError::ContextCreationFailed);
    }

    const uint32_t rate = sampleRate.value_or(options_.defaultSampleRate);
    const auto& rates = options_.supportedSampleRates;
    if (rate == 0 || std::find(rates.begin(), rates.end(), rate) == rates.end()) {
        options_.logger->error("SoftwareClockPlatform: unsupported sample rate {}", rate);
        return std::unexpected(PlatformError::UnsupportedSampleRate);
    }

    auto context = SoftwareClockContext::create(rate, options_);
    if (!context) {
        return std::unexpected(context.error());
    }
    lastContext_ = *context;
    return std::shared_ptr<IAudioContext>(*context);
}

} // namespace Platform
} // namespace RTB
