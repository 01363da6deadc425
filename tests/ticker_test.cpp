#include "ticker.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace std::chrono_literals;

TEST(Ticker, FirstTickIsImmediateAndStopEndsRun) {
    Ticker ticker(1h, 5ms);
    int calls = 0;
    auto started = std::chrono::steady_clock::now();
    ticker.run([&] {
        calls++;
        ticker.stop();
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(ticker.ticks(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

TEST(Ticker, StopFromAnotherThreadInterruptsTheWait) {
    Ticker ticker(1h, 5ms);
    std::thread stopper([&] {
        std::this_thread::sleep_for(50ms);
        ticker.stop();
    });
    auto started = std::chrono::steady_clock::now();
    ticker.run([] {});
    stopper.join();
    EXPECT_TRUE(ticker.stopped());
    EXPECT_EQ(ticker.ticks(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(Ticker, OverrunDropsMissedTicksInsteadOfQueueing) {
    Ticker ticker(20ms, 1ms);
    int calls = 0;
    ticker.run([&] {
        calls++;
        if (calls == 1) std::this_thread::sleep_for(110ms);
        if (calls == 2) ticker.stop();
    });
    EXPECT_EQ(calls, 2);
    EXPECT_GE(ticker.dropped(), 4u);
}

TEST(Ticker, KeepsCadence) {
    Ticker ticker(10ms, 1ms);
    auto started = std::chrono::steady_clock::now();
    ticker.run([&] {
        if (ticker.ticks() == 4) ticker.stop();
    });
    EXPECT_EQ(ticker.ticks(), 5u);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 40ms);
}
