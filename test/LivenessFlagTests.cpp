#include <gtest/gtest.h>
#include "Render/core/LivenessFlag.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace RTB::Render;

TEST(LivenessFlagTest, StartsAlive) {
    LivenessFlag flag;
    EXPECT_TRUE(flag.isAlive());
}

TEST(LivenessFlagTest, MarkDead_IsIdempotent) {
    LivenessFlag flag;
    flag.markDead();
    EXPECT_FALSE(flag.isAlive());
    flag.markDead();
    flag.markDead();
    EXPECT_FALSE(flag.isAlive());
}

// Once a reader has seen the flag dead it must never see it alive again.
TEST(LivenessFlagTest, ReaderObservesMonotonicTransition) {
    auto flag = std::make_shared<LivenessFlag>();
    std::atomic<bool> stop{false};
    std::atomic<int> resurrections{0};
    std::atomic<bool> sawDead{false};

    std::thread reader([&]() {
        bool seenDead = false;
        while (!stop.load()) {
            const bool alive = flag->isAlive();
            if (seenDead && alive) {
                resurrections.fetch_add(1);
            }
            if (!alive) {
                seenDead = true;
                sawDead.store(true);
            }
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    flag->markDead();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!sawDead.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop.store(true);
    reader.join();

    EXPECT_TRUE(sawDead.load()) << "Dead transition should become visible";
    EXPECT_EQ(resurrections.load(), 0);
    EXPECT_FALSE(flag->isAlive());
}
