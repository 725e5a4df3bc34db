// src/RTB/AudioBackend.cpp

#include "RTB/AudioBackend.h"
#include "Render/core/RenderHost.hpp"
#include <spdlog/spdlog.h>

namespace RTB {

std::vector<DeviceInfo> AudioBackend::availableInputDevices() {
    return {};
}

std::vector<DeviceInfo> AudioBackend::availableOutputDevices() {
    return {DeviceInfo{kDefaultOutputName, kNumOutputChannels, true}};
}

std::expected<StreamHandle, StartStreamError>
AudioBackend::startStream(std::shared_ptr<IAudioPlatform> platform, const StreamConfig& config) {
    auto logger = config.logger ? config.logger : spdlog::default_logger();
    logger->info("AudioBackend::startStream: {}", config.configSummary());

    if (!config.isValid()) {
        logger->error("AudioBackend::startStream: invalid configuration");
        return std::unexpected(StartStreamError::Initialization);
    }
    if (!platform) {
        logger->error("AudioBackend::startStream: no platform");
        return std::unexpected(StartStreamError::Initialization);
    }

    // --- 1. Audio context ---
    auto contextResult = platform->createContext(config.sampleRate);
    if (!contextResult) {
        logger->error("AudioBackend::startStream: {}: {}",
                      make_error_code(StartStreamError::Initialization).message(),
                      make_error_code(contextResult.error()).message());
        return std::unexpected(StartStreamError::Initialization);
    }
    auto context = std::move(*contextResult);

    auto closeQuietly = [&]() {
        if (auto closed = context->close(); !closed) {
            logger->error("AudioBackend::startStream: failed to close context after error: {}",
                          make_error_code(closed.error()).message());
        }
    };

    const uint32_t sampleRate = context->sampleRate();
    if (sampleRate == 0) {
        logger->error("AudioBackend::startStream: platform reported a zero sample rate");
        closeQuietly();
        return std::unexpected(StartStreamError::Initialization);
    }
    if (config.sampleRate && *config.sampleRate != sampleRate) {
        logger->warn("AudioBackend::startStream: requested {} Hz, platform runs at {} Hz",
                     *config.sampleRate, sampleRate);
    }

    // --- 2. Shared buffers ---
    auto buffers = Render::SharedBufferPool::create(kNumInputChannels, kNumOutputChannels,
                                                    kBlockFrames, logger);
    if (!buffers) {
        logger->error("AudioBackend::startStream: buffer allocation failed: {}", buffers.error().message());
        closeQuietly();
        return std::unexpected(StartStreamError::Initialization);
    }

    // --- 3. Render host, pre-loaded with the receiving end ---
    auto [sender, receiver] = Render::makeHandoffChannel<IProcessor>();
    auto alive = std::make_shared<Render::LivenessFlag>();
    auto host = std::make_unique<Render::RenderHost>(std::move(receiver), alive, *buffers, sampleRate);

    // --- 4. Asynchronous activation ---
    auto nodeSlot = std::make_shared<RenderNodeSlot>();
    auto bootstrap = std::make_unique<StreamBootstrap>(context, config.moduleName, std::move(host),
                                                       nodeSlot, logger);

    StreamInfo info;
    info.sampleRate = sampleRate;
    info.maxBlockFrames = kBlockFrames;
    info.numStreamInChannels = kNumInputChannels;
    info.numStreamOutChannels = kNumOutputChannels;
    info.outputDeviceName = kDefaultOutputName;

    std::unique_ptr<AudioBackend> backend(new AudioBackend(std::move(context), std::move(sender),
                                                           std::move(alive), std::move(*buffers),
                                                           std::move(nodeSlot), std::move(bootstrap),
                                                           info, logger));
    logger->info("AudioBackend: stream started at {} Hz, {} frames per block", sampleRate, kBlockFrames);
    return StreamHandle{std::move(backend), info};
}

AudioBackend::AudioBackend(std::shared_ptr<IAudioContext> context,
                           Render::HandoffSender<IProcessor> sender,
                           std::shared_ptr<Render::LivenessFlag> alive,
                           std::shared_ptr<Render::SharedBufferPool> buffers,
                           std::shared_ptr<RenderNodeSlot> nodeSlot,
                           std::unique_ptr<StreamBootstrap> bootstrap,
                           StreamInfo info,
                           std::shared_ptr<spdlog::logger> logger)
    : context_(std::move(context))
    , sender_(std::move(sender))
    , alive_(std::move(alive))
    , buffers_(std::move(buffers))
    , nodeSlot_(std::move(nodeSlot))
    , bootstrap_(std::move(bootstrap))
    , info_(std::move(info))
    , logger_(std::move(logger)) {
}

AudioBackend::~AudioBackend() {
    release();
}

void AudioBackend::installProcessor(std::unique_ptr<IProcessor> processor) {
    if (!processor) {
        logger_->warn("AudioBackend::installProcessor: null processor ignored");
        return;
    }
    if (released_) {
        logger_->warn("AudioBackend::installProcessor: stream already released");
        dropped_.store(true, std::memory_order_release);
        return;
    }

    if (bootstrapState() == BootstrapState::Failed) {
        // Activation failed; the render callback will never run.
        logger_->error("AudioBackend::installProcessor: render node not active: {}",
                       make_error_code(StreamError::UnexpectedDrop).message());
        dropped_.store(true, std::memory_order_release);
        return;
    }

    auto sent = sender_.send(std::move(processor));
    if (sent) {
        logger_->debug("AudioBackend::installProcessor: processor handed off");
        return;
    }

    switch (sent.error()) {
        case HandoffError::AlreadySent:
            logger_->warn("AudioBackend::installProcessor: a processor is already installed, discarding");
            break;
        case HandoffError::ReceiverGone:
            logger_->error("AudioBackend::installProcessor: {}",
                           make_error_code(StreamError::UnexpectedDrop).message());
            dropped_.store(true, std::memory_order_release);
            break;
    }
}

std::expected<void, StreamError> AudioBackend::pollStatus() const noexcept {
    if (dropped_.load(std::memory_order_acquire)) {
        return std::unexpected(StreamError::UnexpectedDrop);
    }
    // Covers an install that raced a failing bootstrap.
    if (sender_.hasSent() && bootstrapState() == BootstrapState::Failed) {
        return std::unexpected(StreamError::UnexpectedDrop);
    }
    return {};
}

void AudioBackend::release() {
    if (released_) {
        return;
    }
    released_ = true;

    alive_->markDead();

    if (bootstrap_) {
        bootstrap_->cancel();
    }

    std::shared_ptr<IRenderNode> node;
    {
        std::lock_guard<std::mutex> lock(nodeSlot_->mutex);
        node = std::move(nodeSlot_->node);
    }
    if (node) {
        if (auto result = node->disconnect(); !result) {
            logger_->error("AudioBackend::release: failed to disconnect render node: {}",
                           make_error_code(result.error()).message());
        }
    }

    if (context_) {
        if (auto result = context_->close(); !result) {
            logger_->error("AudioBackend::release: failed to close audio context: {}",
                           make_error_code(result.error()).message());
        }
    }

    // The render host keeps its own handle; the mapping goes away with the last one.
    buffers_.reset();
    logger_->info("AudioBackend: stream released");
}

BootstrapState AudioBackend::bootstrapState() const noexcept {
    return bootstrap_ ? bootstrap_->state() : BootstrapState::Failed;
}

BootstrapState AudioBackend::waitForBootstrap(std::chrono::milliseconds timeout) const {
    return bootstrap_ ? bootstrap_->wait(timeout) : BootstrapState::Failed;
}

std::string AudioBackend::describe() const {
    return fmt::format("AudioBackend {{ dropped: {}, alive: {}, released: {}, bootstrap: {}, "
                       "sampleRate: {}, channels: {}/{} }}",
                       isDropped(), isAlive(), released_, bootstrapStateToString(bootstrapState()),
                       info_.sampleRate, info_.numStreamInChannels, info_.numStreamOutChannels);
}

} // namespace RTB
