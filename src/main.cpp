/**
 * @file main.cpp
 * @brief Plays a sine tone through the software clock platform.
 *
 * Usage: rtb_demo [config.json] [seconds]
 */

#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <numbers>
#include <string>
#include <thread>

#include "RTB/AudioBackend.h"
#include "RTB/JsonHelpers.hpp"
#include "Platform/SoftwareClockPlatform.hpp"

namespace {

std::atomic<bool> g_shuttingDown = false;

void signalHandler(int) {
    if (g_shuttingDown.exchange(true)) {
        std::_Exit(1);
    }
}

class SineProcessor final : public RTB::IProcessor {
public:
    SineProcessor(double frequency, double amplitude)
        : frequency_(frequency), amplitude_(amplitude) {}

    void process(std::span<const float>, std::span<float> output, const RTB::BlockInfo& info) override {
        const double phaseIncrement = 2.0 * std::numbers::pi * frequency_ / info.sampleRate;
        for (uint32_t frame = 0; frame < info.frames; ++frame) {
            const float sample = static_cast<float>(amplitude_ * std::sin(phase_));
            for (uint32_t channel = 0; channel < info.numOutChannels; ++channel) {
                output[frame * info.numOutChannels + channel] = sample;
            }
            phase_ += phaseIncrement;
            if (phase_ >= 2.0 * std::numbers::pi) {
                phase_ -= 2.0 * std::numbers::pi;
            }
        }
    }

private:
    double frequency_;
    double amplitude_;
    double phase_{0.0};
};

} // namespace

int main(int argc, char** argv) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("rtb", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return 1;
    }

    RTB::StreamConfig config;
    if (argc > 1) {
        auto loaded = RTB::JsonHelpers::loadStreamConfig(argv[1]);
        if (!loaded) {
            spdlog::critical("Invalid configuration file '{}'", argv[1]);
            return 1;
        }
        config = std::move(*loaded);
    }
    config.logger = logger;

    int seconds = 3;
    if (argc > 2) {
        try {
            seconds = std::stoi(argv[2]);
        } catch (const std::exception&) {
            spdlog::critical("Invalid duration '{}'", argv[2]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::atomic<float> peak{0.0f};
    RTB::Platform::SoftwareClockOptions options;
    options.logger = logger;
    options.registeredModules.insert(config.moduleName);
    options.outputTap = [&peak](std::span<const float> samples, uint32_t, uint32_t) {
        float blockPeak = 0.0f;
        for (float s : samples) {
            blockPeak = std::max(blockPeak, std::abs(s));
        }
        if (blockPeak > peak.load(std::memory_order_relaxed)) {
            peak.store(blockPeak, std::memory_order_relaxed);
        }
    };
    auto platform = std::make_shared<RTB::Platform::SoftwareClockPlatform>(std::move(options));

    spdlog::info("Devices: {}", RTB::JsonHelpers::devicesToJson(
                                    RTB::AudioBackend::availableInputDevices(),
                                    RTB::AudioBackend::availableOutputDevices()).dump());

    auto stream = RTB::AudioBackend::startStream(platform, config);
    if (!stream) {
        spdlog::critical("Failed to start stream: {}", make_error_code(stream.error()).message());
        return 1;
    }
    auto backend = std::move(stream->backend);
    spdlog::info("Stream: {}", RTB::JsonHelpers::toJson(stream->info).dump());

    backend->installProcessor(std::make_unique<SineProcessor>(440.0, 0.5));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    int exitCode = 0;
    while (!g_shuttingDown.load() && std::chrono::steady_clock::now() < deadline) {
        if (auto status = backend->pollStatus(); !status) {
            spdlog::error("Stream error: {}", make_error_code(status.error()).message());
            exitCode = 1;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("{}", backend->describe());
    spdlog::info("Peak output level: {:.3f}", peak.load());
    backend->release();

    spdlog::default_logger()->flush();
    return exitCode;
}
