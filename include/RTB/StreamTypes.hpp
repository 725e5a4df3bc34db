#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

namespace RTB {

// --- Protocol constants shared by the control and render sides ---

// Frames per render callback. Matches the Web Audio render quantum.
constexpr uint32_t kBlockFrames = 128;

constexpr uint32_t kNumInputChannels = 0;
constexpr uint32_t kNumOutputChannels = 2;

constexpr const char* kDefaultOutputName = "default output";
constexpr const char* kDefaultModuleName = "rtb-render-host";

/**
 * @brief Configuration for AudioBackend::startStream.
 */
struct StreamConfig {
    /// Requested sample rate. The platform negotiates one if unset.
    std::optional<uint32_t> sampleRate;

    /// Render module the bootstrap loads before creating the render node.
    std::string moduleName{kDefaultModuleName};

    std::shared_ptr<spdlog::logger> logger;

    bool isValid() const {
        if (sampleRate && *sampleRate == 0) {
            return false;
        }
        return !moduleName.empty();
    }

    std::string configSummary() const {
        return fmt::format("sampleRate={}, module='{}', block={} frames, {} in / {} out",
                           sampleRate ? std::to_string(*sampleRate) : std::string("negotiated"),
                           moduleName, kBlockFrames, kNumInputChannels, kNumOutputChannels);
    }
};

/**
 * @brief Stream parameters negotiated at startup.
 */
struct StreamInfo {
    uint32_t sampleRate{0};
    uint32_t maxBlockFrames{kBlockFrames};
    uint32_t numStreamInChannels{kNumInputChannels};
    uint32_t numStreamOutChannels{kNumOutputChannels};
    std::optional<std::string> inputDeviceName;
    std::optional<std::string> outputDeviceName;
};

struct DeviceInfo {
    std::string name;
    uint32_t numChannels{0};
    bool isDefault{false};

    bool operator==(const DeviceInfo&) const = default;
};

/**
 * @brief Per-callback parameters handed to the processor.
 */
struct BlockInfo {
    uint32_t frames{0};
    uint32_t numInChannels{0};
    uint32_t numOutChannels{0};
    uint32_t sampleRate{0};
    uint64_t blockIndex{0};   // Number of blocks processed before this one
};

} // namespace RTB
