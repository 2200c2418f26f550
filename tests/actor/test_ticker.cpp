#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "quote_ngin/actor/ticker.hpp"

using namespace quote_ngin;

class TickerTest : public ::testing::Test {};

TEST_F(TickerTest, FiresImmediatelyThenPeriodically) {
    Ticker ticker;
    std::atomic<int> ticks{0};

    auto begin = std::chrono::steady_clock::now();
    ticker.start(std::chrono::milliseconds(200), [&ticks]() { ticks++; });
    while (ticks == 0 && std::chrono::steady_clock::now() - begin < std::chrono::seconds(1)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(ticks, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(150));

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    ticker.stop();
    EXPECT_GE(ticks, 2);
    EXPECT_LE(ticks, 4);
}

TEST_F(TickerTest, StopHaltsTicks) {
    Ticker ticker;
    std::atomic<int> ticks{0};

    ticker.start(std::chrono::milliseconds(10), [&ticks]() { ticks++; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ticker.stop();
    EXPECT_FALSE(ticker.is_running());

    int after_stop = ticks;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(ticks, after_stop);

    // Stopping twice is harmless
    ticker.stop();
}

TEST_F(TickerTest, StopDoesNotWaitForInterval) {
    Ticker ticker;
    ticker.start(std::chrono::seconds(60), []() {});
    EXPECT_TRUE(ticker.is_running());

    auto begin = std::chrono::steady_clock::now();
    ticker.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}
