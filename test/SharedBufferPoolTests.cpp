#include <gtest/gtest.h>
#include "Render/core/SharedBufferPool.hpp"
#include "RTB/StreamTypes.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>

using namespace RTB;
using namespace RTB::Render;

TEST(SharedBufferPoolTest, RegionsSizedChannelsTimesBlockFrames) {
    auto pool = SharedBufferPool::create(kNumInputChannels, kNumOutputChannels, kBlockFrames,
                                         spdlog::default_logger());
    ASSERT_TRUE(pool.has_value()) << pool.error().message();

    auto& p = *pool;
    EXPECT_EQ(p->inputRegion().size(), static_cast<std::size_t>(kNumInputChannels) * kBlockFrames);
    EXPECT_EQ(p->outputRegion().size(), static_cast<std::size_t>(kNumOutputChannels) * kBlockFrames);
    EXPECT_TRUE(p->inputRegion().empty());
    EXPECT_EQ(p->numOutChannels(), kNumOutputChannels);
    EXPECT_EQ(p->blockFrames(), kBlockFrames);
    EXPECT_GE(p->mappedBytes(), p->outputRegion().size_bytes());
}

TEST(SharedBufferPoolTest, RegionsStartZeroFilled) {
    auto pool = SharedBufferPool::create(2, 2, 256, nullptr);
    ASSERT_TRUE(pool.has_value());

    auto in = (*pool)->inputRegion();
    auto out = (*pool)->outputRegion();
    EXPECT_TRUE(std::all_of(in.begin(), in.end(), [](float s) { return s == 0.0f; }));
    EXPECT_TRUE(std::all_of(out.begin(), out.end(), [](float s) { return s == 0.0f; }));
}

TEST(SharedBufferPoolTest, InputAndOutputDoNotOverlap) {
    auto pool = SharedBufferPool::create(1, 2, kBlockFrames, nullptr);
    ASSERT_TRUE(pool.has_value());

    auto in = (*pool)->inputRegion();
    auto out = (*pool)->outputRegion();
    ASSERT_EQ(in.size(), kBlockFrames);

    std::fill(in.begin(), in.end(), 1.0f);
    std::fill(out.begin(), out.end(), -1.0f);
    EXPECT_TRUE(std::all_of(in.begin(), in.end(), [](float s) { return s == 1.0f; }));
    EXPECT_TRUE(std::all_of(out.begin(), out.end(), [](float s) { return s == -1.0f; }));

    EXPECT_LE(in.data() + in.size(), out.data());
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(out.data()) % 64, 0u);
}

TEST(SharedBufferPoolTest, InvalidLayout_Rejected) {
    auto noFrames = SharedBufferPool::create(0, 2, 0, nullptr);
    ASSERT_FALSE(noFrames.has_value());
    EXPECT_EQ(noFrames.error(), std::make_error_code(std::errc::invalid_argument));

    auto noOutputs = SharedBufferPool::create(0, 0, kBlockFrames, nullptr);
    EXPECT_FALSE(noOutputs.has_value());
}

// The pool stays valid for holders other than its creator.
TEST(SharedBufferPoolTest, OutlivesCreatorHandle) {
    std::shared_ptr<SharedBufferPool> renderSide;
    {
        auto pool = SharedBufferPool::create(0, 2, kBlockFrames, nullptr);
        ASSERT_TRUE(pool.has_value());
        renderSide = *pool;
    }
    auto out = renderSide->outputRegion();
    std::fill(out.begin(), out.end(), 0.25f);
    EXPECT_EQ(out.back(), 0.25f);
}
