#include "Render/core/RenderHost.hpp"
#include <algorithm>

namespace RTB {
namespace Render {

RenderHost::RenderHost(HandoffReceiver<IProcessor> receiver,
                       std::shared_ptr<const LivenessFlag> alive,
                       std::shared_ptr<SharedBufferPool> buffers,
                       uint32_t sampleRate)
    : receiver_(std::move(receiver))
    , alive_(std::move(alive))
    , buffers_(std::move(buffers))
    , inputRegion_(buffers_->inputRegion())
    , outputRegion_(buffers_->outputRegion())
    , numInChannels_(buffers_->numInChannels())
    , numOutChannels_(buffers_->numOutChannels())
    , blockFrames_(buffers_->blockFrames())
    , sampleRate_(sampleRate) {
}

void RenderHost::writeSilence(std::span<float> output) noexcept {
    std::fill(outputRegion_.begin(), outputRegion_.end(), 0.0f);
    std::fill(output.begin(), output.end(), 0.0f);
    silentCallbacks_.fetch_add(1, std::memory_order_relaxed);
}

void RenderHost::render(std::span<const float> input, std::span<float> output, uint32_t frames) noexcept {
    callbacks_.fetch_add(1, std::memory_order_relaxed);

    const std::size_t outSamples = static_cast<std::size_t>(frames) * numOutChannels_;
    if (frames > blockFrames_ || output.size() < outSamples) {
        // Platform contract violation; the render path has no way to report it.
        writeSilence(output);
        return;
    }

    if (alive_ && !alive_->isAlive()) {
        writeSilence(output);
        return;
    }

    if (!processor_) {
        processor_ = receiver_.tryReceive();
        if (!processor_) {
            writeSilence(output);
            return;
        }
        state_.store(RenderHostState::Active, std::memory_order_release);
    }

    const std::size_t inSamples = static_cast<std::size_t>(frames) * numInChannels_;
    auto inBlock = inputRegion_.first(inSamples);
    auto outBlock = outputRegion_.first(outSamples);

    if (inSamples > 0) {
        const std::size_t copied = std::min(inSamples, input.size());
        std::copy_n(input.begin(), copied, inBlock.begin());
        std::fill(inBlock.begin() + copied, inBlock.end(), 0.0f);
    }

    BlockInfo info;
    info.frames = frames;
    info.numInChannels = numInChannels_;
    info.numOutChannels = numOutChannels_;
    info.sampleRate = sampleRate_;
    info.blockIndex = processedBlocks_.load(std::memory_order_relaxed);

    processor_->process(inBlock, outBlock, info);

    std::copy(outBlock.begin(), outBlock.end(), output.begin());
    std::fill(output.begin() + outSamples, output.end(), 0.0f);
    processedBlocks_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace Render
} // namespace RTB
