#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

// Calls tick() at a fixed cadence until stop(). The first tick fires at once.
// Ticks missed while tick() overruns are dropped, not queued.
class Ticker {
public:
    explicit Ticker(std::chrono::milliseconds interval,
                    std::chrono::milliseconds stop_poll = std::chrono::milliseconds(100));

    void run(const std::function<void()>& tick);

    // Async-signal-safe.
    void stop() noexcept { stop_.store(true); }
    bool stopped() const noexcept { return stop_.load(); }

    uint64_t ticks() const noexcept { return ticks_.load(); }
    uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds stop_poll_;
    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> dropped_{0};
};
