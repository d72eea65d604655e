//filename: tests/test_window.cpp
#include <gtest/gtest.h>
#include "core/window.hpp"
#include <atomic>
#include <chrono>
#include <thread>

TEST(WindowTest, AcquireUpToCapacity) {
    Window w(2);
    EXPECT_TRUE(w.acquire());
    EXPECT_TRUE(w.acquire());
    EXPECT_EQ(w.in_flight(), 2u);
    EXPECT_EQ(w.capacity(), 2u);
}

TEST(WindowTest, FullWindowBlocksUntilRelease) {
    Window w(1);
    ASSERT_TRUE(w.acquire());

    std::atomic<bool> acquired{false};
    std::thread t([&] {
        if (w.acquire()) acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    w.release();
    t.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(w.in_flight(), 1u);
}

TEST(WindowTest, CloseWakesBlockedAcquire) {
    Window w(1);
    ASSERT_TRUE(w.acquire());

    std::atomic<int> result{-1};
    std::thread t([&] { result = w.acquire() ? 1 : 0; });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    w.close();
    t.join();
    EXPECT_EQ(result.load(), 0);
    EXPECT_FALSE(w.acquire());
}

TEST(WindowTest, ReleaseWithoutAcquireIsHarmless) {
    Window w(1);
    w.release();
    EXPECT_EQ(w.in_flight(), 0u);
    EXPECT_TRUE(w.acquire());
}
