#pragma once

#include <asio.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include "logger.h"

// Fixed-rate callback on an io_context. Ticks are scheduled on absolute deadlines so a slow
// callback does not push the whole schedule back.
class PeriodicTimer {
public:
    PeriodicTimer(asio::io_context& io_context, std::string name,
                  std::chrono::steady_clock::duration interval, std::function<void()> callback)
        : timer_(io_context),
          name_(std::move(name)),
          interval_(interval),
          callback_(std::move(callback)) {}

    void start() {
        running_   = true;
        next_tick_ = std::chrono::steady_clock::now() + interval_;
        timer_.expires_at(next_tick_);
        timer_.async_wait([this](std::error_code error_code) { on_timeout(error_code); });
    }

    void stop() {
        running_ = false;
        timer_.cancel();
    }

private:
    asio::steady_timer                    timer_;
    std::string                           name_;
    std::chrono::steady_clock::duration   interval_;
    std::function<void()>                 callback_;
    std::chrono::steady_clock::time_point next_tick_;
    bool                                  running_ = false;

    void on_timeout(std::error_code error_code) {
        if (error_code == asio::error::operation_aborted || !running_) {
            return;
        }
        if (error_code) {
            Log::error("{} timer error: {}", name_, error_code.message());
            return;
        }

        try {
            callback_();
        } catch (const std::exception& e) {
            Log::error("{} timer callback failed: {}", name_, e.what());
        }

        next_tick_ += interval_;  // Accumulate time to prevent drift
        auto now = std::chrono::steady_clock::now();
        if (next_tick_ < now) {
            next_tick_ = now;  // fell behind, skip the missed ticks
        }
        timer_.expires_at(next_tick_);
        timer_.async_wait([this](std::error_code error_code) { on_timeout(error_code); });
    }
};
