#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <opus.h>
#include <opus_defines.h>

#include "audio_constants.h"
#include "logger.h"
#include "voice_codec.h"

class OpusDecoderWrapper : public FrameDecoder {
public:
    OpusDecoderWrapper() = default;

    ~OpusDecoderWrapper() override {
        destroy();
    }

    // Prevent copying (Opus decoder maintains state)
    OpusDecoderWrapper(const OpusDecoderWrapper&)            = delete;
    OpusDecoderWrapper& operator=(const OpusDecoderWrapper&) = delete;

    OpusDecoderWrapper(OpusDecoderWrapper&& other) noexcept
        : decoder_(other.decoder_), frame_size_(other.frame_size_) {
        other.decoder_ = nullptr;
    }

    OpusDecoderWrapper& operator=(OpusDecoderWrapper&& other) noexcept {
        if (this != &other) {
            destroy();
            decoder_       = other.decoder_;
            frame_size_    = other.frame_size_;
            other.decoder_ = nullptr;
        }
        return *this;
    }

    bool create(int sample_rate = audio_constants::SAMPLE_RATE,
                int channels    = audio_constants::CHANNELS) {
        destroy();

        int err;
        decoder_ = opus_decoder_create(sample_rate, channels, &err);
        if (err != OPUS_OK) {
            Log::error("Failed to create Opus decoder: {}", opus_strerror(err));
            decoder_ = nullptr;
            return false;
        }

        frame_size_ = sample_rate * audio_constants::FRAME_DURATION_MS / 1000;
        Log::debug("Opus decoder created: {}ch, {}Hz", channels, sample_rate);
        return true;
    }

    void destroy() {
        if (decoder_ != nullptr) {
            opus_decoder_destroy(decoder_);
            decoder_ = nullptr;
        }
    }

    bool decode(std::span<const uint8_t> data, bool use_fec, PcmFrame& output) override {
        if (decoder_ == nullptr) {
            Log::error("Opus decoder not initialized.");
            output.clear();
            return false;
        }

        output.resize(frame_size_);
        int decoded = opus_decode(decoder_, data.data(), static_cast<opus_int32>(data.size()),
                                  output.data(), frame_size_, use_fec ? 1 : 0);
        if (decoded < 0) {
            Log::debug("Opus decoding failed: {}", opus_strerror(decoded));
            output.clear();
            return false;
        }

        output.resize(decoded);
        return true;
    }

    // Decode with Packet Loss Concealment (when packet is lost)
    bool decode_plc(PcmFrame& output) override {
        if (decoder_ == nullptr) {
            Log::error("Opus decoder not initialized.");
            output.clear();
            return false;
        }

        output.resize(frame_size_);
        // Pass nullptr to trigger PLC (packet loss concealment)
        int decoded = opus_decode(decoder_, nullptr, 0, output.data(), frame_size_, 0);
        if (decoded < 0) {
            Log::debug("Opus PLC decoding failed: {}", opus_strerror(decoded));
            output.clear();
            return false;
        }

        output.resize(decoded);
        return true;
    }

    void reset() override {
        if (decoder_ != nullptr) {
            opus_decoder_ctl(decoder_, OPUS_RESET_STATE);
        }
    }

    bool is_initialized() const {
        return decoder_ != nullptr;
    }

    static DecoderFactory factory() {
        return []() -> std::unique_ptr<FrameDecoder> {
            auto decoder = std::make_unique<OpusDecoderWrapper>();
            if (!decoder->create()) {
                return nullptr;
            }
            return decoder;
        };
    }

private:
    OpusDecoder* decoder_    = nullptr;
    int          frame_size_ = audio_constants::FRAME_SIZE;
};
