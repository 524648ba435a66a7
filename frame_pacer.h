#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>

#include "audio_constants.h"

struct PacingResult {
    size_t                    frames_sent = 0;
    std::chrono::microseconds elapsed{0};
    std::chrono::microseconds drift{0};  // elapsed minus frames_sent * interval

    double elapsed_seconds() const {
        return std::chrono::duration<double>(elapsed).count();
    }

    double drift_ms() const {
        return std::chrono::duration<double, std::milli>(drift).count();
    }
};

// Deadline-driven frame emitter. Frame i goes out at t0 + i*interval; between frames
// the thread sleeps to within SPIN_WINDOW of the next deadline and then spins. Deadlines are
// absolute, so a late frame does not push back the ones after it.
class FramePacer {
public:
    using clock = std::chrono::steady_clock;

    // Returning false stops the run early (the frame is not counted)
    using EmitFn = std::function<bool(size_t index)>;

    static constexpr auto SPIN_WINDOW = std::chrono::milliseconds(3);

    explicit FramePacer(clock::duration interval = audio_constants::FRAME_INTERVAL)
        : interval_(interval) {}

    PacingResult run(size_t frame_count, const EmitFn& emit) const {
        PacingResult result;
        const auto   start = clock::now();

        for (size_t i = 0; i < frame_count; ++i) {
            if (!emit(i)) {
                break;
            }
            ++result.frames_sent;
            wait_until(start + (interval_ * static_cast<int64_t>(i + 1)));
        }

        result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - start);
        result.drift   = result.elapsed - std::chrono::duration_cast<std::chrono::microseconds>(
                                            interval_ * static_cast<int64_t>(result.frames_sent));
        return result;
    }

    clock::duration interval() const {
        return interval_;
    }

    static void wait_until(clock::time_point deadline) {
        auto now = clock::now();
        if (deadline - now > SPIN_WINDOW) {
            std::this_thread::sleep_for(deadline - now - SPIN_WINDOW);
        }
        while (clock::now() < deadline) {
            std::this_thread::yield();
        }
    }

private:
    clock::duration interval_;
};
