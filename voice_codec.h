#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

// One 20ms frame of 16 kHz mono PCM
using PcmFrame = std::vector<int16_t>;

// Minimal codec contract the hub depends on. The Opus wrappers implement it;
// tests substitute counting fakes.
class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;

    // pcm must hold exactly one frame; output receives the compressed frame
    virtual bool encode(std::span<const int16_t> pcm, std::vector<uint8_t>& output) = 0;

    // Clears prediction history; call at the start of every independent stream
    virtual void reset() = 0;
};

class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    // use_fec recovers the frame *preceding* data from its in-band redundancy
    virtual bool decode(std::span<const uint8_t> data, bool use_fec, PcmFrame& output) = 0;

    // Synthesises one frame of concealment audio without any input
    virtual bool decode_plc(PcmFrame& output) = 0;

    virtual void reset() = 0;
};

using EncoderFactory = std::function<std::unique_ptr<FrameEncoder>()>;
using DecoderFactory = std::function<std::unique_ptr<FrameDecoder>()>;
