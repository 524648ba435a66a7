#pragma once

#include <chrono>
#include <cstddef>

namespace audio_constants {

constexpr int    SAMPLE_RATE       = 16000;
constexpr int    CHANNELS          = 1;    // mono
constexpr int    FRAME_DURATION_MS = 20;
constexpr int    FRAME_SIZE        = SAMPLE_RATE * FRAME_DURATION_MS / 1000;  // 320 samples
constexpr int    BYTES_PER_SAMPLE  = 2;                                       // int16
constexpr size_t FRAME_BYTES       = FRAME_SIZE * CHANNELS * BYTES_PER_SAMPLE;  // 640
constexpr int    OPUS_BITRATE      = 32000;  // shared by broadcast, chime and PTT producers
constexpr int    OPUS_COMPLEXITY   = 5;
constexpr int    OPUS_LOSS_PERC    = 10;

constexpr auto FRAME_INTERVAL = std::chrono::milliseconds(FRAME_DURATION_MS);

// Silence padding around hub-originated streams so edge jitter buffers can prime and drain
constexpr size_t LEAD_IN_FRAMES   = 15;  // 300ms
constexpr size_t TRAIL_OUT_FRAMES = 30;  // 600ms

}  // namespace audio_constants
