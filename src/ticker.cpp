#include "ticker.hpp"

#include <algorithm>
#include <thread>

Ticker::Ticker(std::chrono::milliseconds interval, std::chrono::milliseconds stop_poll)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      stop_poll_(stop_poll.count() > 0 ? stop_poll : std::chrono::milliseconds(1)) {
}

void Ticker::run(const std::function<void()>& tick) {
    using steady = std::chrono::steady_clock;
    auto next = steady::now();

    while (!stop_.load()) {
        tick();
        ticks_++;

        next += interval_;
        auto now = steady::now();
        if (next <= now) {
            auto missed = (now - next) / interval_ + 1;
            dropped_ += static_cast<uint64_t>(missed);
            next += interval_ * missed;
        }

        while (!stop_.load()) {
            now = steady::now();
            if (now >= next) break;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
            std::this_thread::sleep_for(std::min(left + std::chrono::milliseconds(1), stop_poll_));
        }
    }
}
