#pragma once

#include <chrono>
#include <functional>
#include <utility>

#include <asio.hpp>

#include "logger.h"

// Fixed-rate timer on absolute deadlines, so the period does not drift with handler
// latency. After a stall longer than one period the missed ticks are skipped rather
// than fired back to back. All handlers run on the executor passed in.
class PeriodicTimer {
public:
    using clock = std::chrono::steady_clock;

    template <typename Executor>
    PeriodicTimer(const Executor& executor, clock::duration period, std::function<void()> on_tick)
        : timer_(executor), period_(period), on_tick_(std::move(on_tick)) {}

    void start(clock::duration initial_delay = {}) {
        running_  = true;
        deadline_ = clock::now() + initial_delay;
        arm();
    }

    void stop() {
        running_ = false;
        timer_.cancel();
    }

private:
    void arm() {
        timer_.expires_at(deadline_);
        timer_.async_wait([this](std::error_code error_code) { on_expiry(error_code); });
    }

    void on_expiry(std::error_code error_code) {
        if (error_code == asio::error::operation_aborted || !running_) {
            return;
        }
        if (error_code) {
            Log::error("Periodic timer failed: {}", error_code.message());
            return;
        }

        on_tick_();

        deadline_ += period_;
        auto now = clock::now();
        if (deadline_ < now) {
            deadline_ = now + period_;
        }
        arm();
    }

    asio::steady_timer    timer_;
    clock::duration       period_;
    clock::time_point     deadline_;
    std::function<void()> on_tick_;
    bool                  running_ = false;
};
