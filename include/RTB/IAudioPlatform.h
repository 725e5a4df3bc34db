// include/RTB/IAudioPlatform.h
#pragma once

#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include "RTB/Error.h"

namespace RTB {

namespace Render {
class RenderHost; // Forward declaration
}

/**
 * @brief Options for constructing a render node.
 */
struct RenderNodeOptions {
    std::string processorName;      ///< Name registered by the render module
    uint32_t numInputs{0};          ///< Input ports
    uint32_t numOutputs{1};         ///< Output ports
    uint32_t outputChannelCount{2}; ///< Channels on the first output port
};

/**
 * @brief A render node living in the platform's real-time context.
 *
 * While connected, the platform invokes the node's RenderHost once per device
 * period on its real-time thread.
 */
class IRenderNode {
public:
    virtual ~IRenderNode() = default;

    /**
     * @brief Connect the node to the context's output destination
     * @return Success or error status
     */
    virtual std::expected<void, PlatformError> connectToDestination() = 0;

    /**
     * @brief Disconnect the node from every output.
     *
     * Prevents future callbacks from reaching the device. A callback already
     * executing is not interrupted.
     * @return Success or error status
     */
    virtual std::expected<void, PlatformError> disconnect() = 0;
};

/**
 * @brief An open audio context on the platform.
 */
class IAudioContext {
public:
    virtual ~IAudioContext() = default;

    /**
     * @brief The sample rate the platform actually runs at.
     *
     * Authoritative over any rate requested at creation.
     */
    virtual uint32_t sampleRate() const = 0;

    /**
     * @brief Asynchronously load the module that provides the render processor
     * @param moduleName Name of the module to load
     * @return Future resolving once the module is available or failed
     */
    virtual std::future<std::expected<void, PlatformError>> loadModule(const std::string& moduleName) = 0;

    /**
     * @brief Construct a render node, transferring the render host into it.
     *
     * On failure the host is destroyed by the platform on the calling thread.
     * @param options Node construction options
     * @param host Render-side host driven by the node's callback
     * @return The node or error
     */
    virtual std::expected<std::shared_ptr<IRenderNode>, PlatformError>
    createRenderNode(const RenderNodeOptions& options, std::unique_ptr<Render::RenderHost> host) = 0;

    /**
     * @brief Close the context and stop its device clock
     * @return Success or error status
     */
    virtual std::expected<void, PlatformError> close() = 0;
};

/**
 * @brief Entry point into the host platform's audio system.
 */
class IAudioPlatform {
public:
    virtual ~IAudioPlatform() = default;

    /**
     * @brief Open an audio context
     * @param sampleRate Requested sample rate, or nullopt to let the platform choose
     * @return Shared pointer to the context or error
     */
    virtual std::expected<std::shared_ptr<IAudioContext>, PlatformError>
    createContext(std::optional<uint32_t> sampleRate) = 0;
};

} // namespace RTB
