#include <catch2/catch.hpp>

#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

#include "frame_pacer.h"

using namespace std::chrono_literals;

TEST_CASE("250 frames at 20ms take five seconds", "[pacer]") {
    FramePacer pacer;
    auto       start = FramePacer::clock::now();

    PacingResult result = pacer.run(250, [](size_t) { return true; });

    auto wall = FramePacer::clock::now() - start;
    CHECK(result.frames_sent == 250);
    CHECK(wall >= 5000ms);
    CHECK(wall < 5030ms);
    CHECK(std::abs(result.drift_ms()) < 10.0);
}

TEST_CASE("Frames go out on absolute deadlines", "[pacer]") {
    FramePacer                                 pacer(10ms);
    std::vector<FramePacer::clock::time_point> stamps;
    const auto                                 start = FramePacer::clock::now();

    pacer.run(20, [&](size_t index) {
        // A slow frame must not shift the ones after it
        if (index == 5) {
            std::this_thread::sleep_for(6ms);
        }
        stamps.push_back(FramePacer::clock::now());
        return true;
    });

    REQUIRE(stamps.size() == 20);
    auto last_offset = stamps.back() - start;
    CHECK(last_offset >= 190ms);
    CHECK(last_offset < 205ms);
}

TEST_CASE("Returning false stops the run without counting the frame", "[pacer]") {
    FramePacer pacer(1ms);
    size_t     emitted = 0;

    PacingResult result = pacer.run(100, [&](size_t index) {
        ++emitted;
        return index < 9;
    });

    CHECK(emitted == 10);
    CHECK(result.frames_sent == 9);
}

TEST_CASE("Zero frames return at once", "[pacer]") {
    FramePacer   pacer;
    PacingResult result = pacer.run(0, [](size_t) { return true; });
    CHECK(result.frames_sent == 0);
    CHECK(result.elapsed < 5ms);
}
