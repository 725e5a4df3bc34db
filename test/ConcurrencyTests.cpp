#include <gtest/gtest.h>
#include "RTB/AudioBackend.h"
#include "Render/core/RenderHost.hpp"
#include "FakeAudioPlatform.hpp"
#include "TestProcessors.hpp"
#include <thread>
#include <atomic>
#include <vector>
#include <chrono>
#include <algorithm>
#include <spdlog/sinks/null_sink.h>

using namespace RTB;
using namespace RTB::Testing;
using namespace std::chrono_literals;

// Concurrency test fixture: a render thread ticks the node while the test
// drives the control side.
class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.sampleRate = 48000;
        config_.logger = std::make_shared<spdlog::logger>("concurrency", std::make_shared<spdlog::sinks::null_sink_mt>());

        platform_ = std::make_shared<FakeAudioPlatform>();
        auto handle = AudioBackend::startStream(platform_, config_);
        ASSERT_TRUE(handle.has_value());
        backend_ = std::move(handle->backend);
        ASSERT_EQ(backend_->waitForBootstrap(2s), BootstrapState::Active);
        node_ = platform_->context()->node();
        ASSERT_NE(node_, nullptr);
    }

    void TearDown() override {
        stopRenderThread();
        if (backend_) {
            backend_->release();
        }
    }

    void startRenderThread(float expectedValue) {
        renderThread_ = std::thread([this, expectedValue]() {
            bool seenProcessor = false;
            while (!stopRender_.load()) {
                auto block = node_->tick();
                const bool silent = std::all_of(block.begin(), block.end(), [](float s) { return s == 0.0f; });
                const bool processed = std::all_of(block.begin(), block.end(),
                                                   [expectedValue](float s) { return s == expectedValue; });
                if (!silent && !processed) {
                    tornBlocks_.fetch_add(1);
                }
                if (processed) {
                    seenProcessor = true;
                    processedBlocks_.fetch_add(1);
                } else if (seenProcessor && backend_->isAlive()) {
                    // Once the processor is running, only a dead stream may go silent.
                    regressions_.fetch_add(1);
                }
                renderedBlocks_.fetch_add(1);
            }
        });
    }

    void stopRenderThread() {
        stopRender_.store(true);
        if (renderThread_.joinable()) {
            renderThread_.join();
        }
    }

    bool waitForBlocks(std::atomic<uint64_t>& counter, uint64_t target) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (counter.load() < target) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::yield();
        }
        return true;
    }

    StreamConfig config_;
    std::shared_ptr<FakeAudioPlatform> platform_;
    std::unique_ptr<AudioBackend> backend_;
    std::shared_ptr<FakeRenderNode> node_;

    std::thread renderThread_;
    std::atomic<bool> stopRender_{false};
    std::atomic<uint64_t> renderedBlocks_{0};
    std::atomic<uint64_t> processedBlocks_{0};
    std::atomic<uint32_t> tornBlocks_{0};
    std::atomic<uint32_t> regressions_{0};
};

// The processor is picked up mid-stream without the render loop ever seeing
// a partially constructed processor or a mixed block.
TEST_F(ConcurrencyTest, InstallWhileRendering_BlocksAreSilenceThenProcessor) {
    startRenderThread(0.5f);
    ASSERT_TRUE(waitForBlocks(renderedBlocks_, 100));

    auto probe = std::make_shared<ProcessorProbe>();
    backend_->installProcessor(std::make_unique<ConstantProcessor>(0.5f, probe));

    ASSERT_TRUE(waitForBlocks(processedBlocks_, 1000));
    stopRenderThread();

    EXPECT_EQ(tornBlocks_.load(), 0u);
    EXPECT_EQ(regressions_.load(), 0u);
    EXPECT_TRUE(backend_->pollStatus().has_value());
    EXPECT_EQ(node_->host()->state(), Render::RenderHostState::Active);
}

// After release returns, at most the callback already in flight may call the
// processor.
TEST_F(ConcurrencyTest, ReleaseWhileRendering_ProcessorStopsBeingCalled) {
    auto probe = std::make_shared<ProcessorProbe>();
    backend_->installProcessor(std::make_unique<ConstantProcessor>(0.5f, probe));
    startRenderThread(0.5f);
    ASSERT_TRUE(waitForBlocks(processedBlocks_, 200));

    backend_->release();
    const int callsAtRelease = probe->calls.load();
    const auto renderedAtRelease = renderedBlocks_.load();
    ASSERT_TRUE(waitForBlocks(renderedBlocks_, renderedAtRelease + 200));
    stopRenderThread();

    EXPECT_LE(probe->calls.load(), callsAtRelease + 1);
    EXPECT_EQ(tornBlocks_.load(), 0u);
    EXPECT_EQ(probe->destroyed.load(), 0) << "Processor is owned by the render host, not the backend";
}

// Installs racing a render loop that starts at the same time.
TEST_F(ConcurrencyTest, RepeatedStreams_InstallRacesFirstCallback) {
    stopRenderThread();
    backend_.reset();

    constexpr int kStreams = 50;
    for (int i = 0; i < kStreams; ++i) {
        auto platform = std::make_shared<FakeAudioPlatform>();
        auto handle = AudioBackend::startStream(platform, config_);
        ASSERT_TRUE(handle.has_value());
        ASSERT_EQ(handle->backend->waitForBootstrap(2s), BootstrapState::Active);
        auto node = platform->context()->node();

        std::atomic<bool> go{false};
        std::atomic<int> processed{0};
        std::thread render([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int block = 0; block < 200; ++block) {
                auto out = node->tick();
                if (out.front() == 0.25f) {
                    processed.fetch_add(1);
                }
            }
        });

        auto probe = std::make_shared<ProcessorProbe>();
        go.store(true);
        handle->backend->installProcessor(std::make_unique<ConstantProcessor>(0.25f, probe));
        render.join();

        EXPECT_TRUE(handle->backend->pollStatus().has_value()) << "stream " << i;
        EXPECT_EQ(probe->calls.load(), processed.load()) << "stream " << i;
        handle->backend->release();
    }
}
