#include "RTB/StreamBootstrap.hpp"
#include "RTB/StreamTypes.hpp"
#include "Render/core/RenderHost.hpp"
#include <spdlog/spdlog.h>

namespace {
    // Granularity at which a pending module load checks for cancellation.
    constexpr auto kModuleLoadPollInterval = std::chrono::milliseconds(5);

    constexpr const char* kRenderProcessorName = "RenderHostProcessor";
}

namespace RTB {

const char* bootstrapStateToString(BootstrapState state) {
    switch (state) {
        case BootstrapState::Pending: return "Pending";
        case BootstrapState::Active: return "Active";
        case BootstrapState::Failed: return "Failed";
        case BootstrapState::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

StreamBootstrap::StreamBootstrap(std::shared_ptr<IAudioContext> context,
                                 std::string moduleName,
                                 std::unique_ptr<Render::RenderHost> host,
                                 std::shared_ptr<RenderNodeSlot> nodeSlot,
                                 std::shared_ptr<spdlog::logger> logger)
    : context_(std::move(context))
    , moduleName_(std::move(moduleName))
    , host_(std::move(host))
    , nodeSlot_(std::move(nodeSlot))
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

StreamBootstrap::~StreamBootstrap() {
    cancel();
}

std::optional<PlatformError> StreamBootstrap::failure() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return failure_;
}

BootstrapState StreamBootstrap::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCond_.wait_for(lock, timeout, [this] {
        return state_.load(std::memory_order_acquire) != BootstrapState::Pending;
    });
    return state_.load(std::memory_order_acquire);
}

void StreamBootstrap::cancel() {
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    thread_.join();
}

void StreamBootstrap::finish(BootstrapState state, std::optional<PlatformError> error) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        failure_ = error;
        state_.store(state, std::memory_order_release);
    }
    stateCond_.notify_all();
}

void StreamBootstrap::fail(const char* step, PlatformError error) {
    // The render side will never run; later installs must observe the drop.
    host_.reset();
    logger_->error("StreamBootstrap: {}: {} ({})", step,
                   make_error_code(StartStreamError::WorkletCreation).message(),
                   make_error_code(error).message());
    finish(BootstrapState::Failed, error);
}

void StreamBootstrap::run(std::stop_token stopToken) {
    logger_->debug("StreamBootstrap: loading module '{}'", moduleName_);

    // --- 1. Module load ---
    auto loading = context_->loadModule(moduleName_);
    if (!loading.valid()) {
        fail("module load did not start", PlatformError::ModuleLoadFailed);
        return;
    }
    while (loading.wait_for(kModuleLoadPollInterval) == std::future_status::timeout) {
        if (stopToken.stop_requested()) {
            logger_->info("StreamBootstrap: cancelled while loading module '{}'", moduleName_);
            finish(BootstrapState::Cancelled, PlatformError::Cancelled);
            return;
        }
    }
    auto loaded = loading.get();
    if (!loaded) {
        fail("module load failed", loaded.error());
        return;
    }
    if (stopToken.stop_requested()) {
        finish(BootstrapState::Cancelled, PlatformError::Cancelled);
        return;
    }

    // --- 2. Node construction, host moves into the platform ---
    RenderNodeOptions options;
    options.processorName = kRenderProcessorName;
    options.numInputs = kNumInputChannels > 0 ? 1 : 0;
    options.numOutputs = 1;
    options.outputChannelCount = kNumOutputChannels;

    auto node = context_->createRenderNode(options, std::move(host_));
    if (!node) {
        fail("render node construction failed", node.error());
        return;
    }

    // Publish before connecting so release() can disconnect a half-built node.
    {
        std::lock_guard<std::mutex> lock(nodeSlot_->mutex);
        nodeSlot_->node = *node;
    }

    if (stopToken.stop_requested()) {
        finish(BootstrapState::Cancelled, PlatformError::Cancelled);
        return;
    }

    // --- 3. Connect to output ---
    auto connected = (*node)->connectToDestination();
    if (!connected) {
        // Never connected, so release has nothing to disconnect.
        {
            std::lock_guard<std::mutex> lock(nodeSlot_->mutex);
            nodeSlot_->node.reset();
        }
        fail("connecting render node to output failed", connected.error());
        return;
    }

    logger_->info("StreamBootstrap: render node active");
    finish(BootstrapState::Active);
}

} // namespace RTB
