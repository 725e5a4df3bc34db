#pragma once

#include <span>
#include "RTB/StreamTypes.hpp"

namespace RTB {

/**
 * @brief Interface implemented by the audio-graph engine.
 *
 * An instance is built on the control thread, handed to the render thread once
 * through AudioBackend::installProcessor and from then on used only by the
 * render thread. Implementations must not block, allocate or throw in process().
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    /**
     * @brief Render one block.
     * @param input Interleaved input samples, numInChannels * frames long
     * @param output Interleaved output samples, numOutChannels * frames long
     * @param info Frame count, channel layout and clock for this block
     */
    virtual void process(std::span<const float> input,
                         std::span<float> output,
                         const BlockInfo& info) = 0;
};

} // namespace RTB
