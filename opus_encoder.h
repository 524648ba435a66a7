#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <opus.h>
#include <opus_defines.h>
#include <opus_types.h>

#include "audio_constants.h"
#include "logger.h"
#include "voice_codec.h"

class OpusEncoderWrapper : public FrameEncoder {
public:
    using SampleRate = int;
    using Channels   = int;
    using Bitrate    = int;

    static constexpr size_t ENCODE_BUFFER_SIZE = 512;

    OpusEncoderWrapper() = default;

    ~OpusEncoderWrapper() override {
        destroy();
    }

    // Prevent copying (Opus encoder is a resource)
    OpusEncoderWrapper(const OpusEncoderWrapper&)            = delete;
    OpusEncoderWrapper& operator=(const OpusEncoderWrapper&) = delete;

    OpusEncoderWrapper(OpusEncoderWrapper&& other) noexcept
        : encoder_(other.encoder_), frame_size_(other.frame_size_) {
        other.encoder_ = nullptr;
    }

    OpusEncoderWrapper& operator=(OpusEncoderWrapper&& other) noexcept {
        if (this != &other) {
            destroy();
            encoder_       = other.encoder_;
            frame_size_    = other.frame_size_;
            other.encoder_ = nullptr;
        }
        return *this;
    }

    // Voice profile shared by every hub producer so edge nodes hear consistent quality
    bool create(SampleRate sample_rate = audio_constants::SAMPLE_RATE,
                Channels   channels    = audio_constants::CHANNELS,
                Bitrate    bitrate     = audio_constants::OPUS_BITRATE) {
        destroy();

        int err;
        encoder_ = opus_encoder_create(sample_rate, channels, OPUS_APPLICATION_VOIP, &err);
        if (err != OPUS_OK) {
            Log::error("Failed to create Opus encoder: {}", opus_strerror(err));
            encoder_ = nullptr;
            return false;
        }

        frame_size_ = sample_rate * audio_constants::FRAME_DURATION_MS / 1000;

        opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(bitrate));
        opus_encoder_ctl(encoder_, OPUS_SET_COMPLEXITY(audio_constants::OPUS_COMPLEXITY));
        opus_encoder_ctl(encoder_, OPUS_SET_SIGNAL(OPUS_SIGNAL_VOICE));
        opus_encoder_ctl(encoder_, OPUS_SET_VBR(1));
        opus_encoder_ctl(encoder_, OPUS_SET_INBAND_FEC(1));  // lets receivers recover one lost frame
        opus_encoder_ctl(encoder_, OPUS_SET_PACKET_LOSS_PERC(audio_constants::OPUS_LOSS_PERC));
        opus_encoder_ctl(encoder_, OPUS_SET_DTX(0));

        Log::debug("Opus encoder created: {}ch, {}Hz, {}bps", channels, sample_rate, bitrate);
        return true;
    }

    void destroy() {
        if (encoder_ != nullptr) {
            opus_encoder_destroy(encoder_);
            encoder_ = nullptr;
        }
    }

    bool encode(std::span<const int16_t> pcm, std::vector<uint8_t>& output) override {
        if (encoder_ == nullptr) {
            Log::error("Opus encoder not initialized.");
            output.clear();
            return false;
        }
        if (pcm.size() != static_cast<size_t>(frame_size_)) {
            Log::error("Opus encode: expected {} samples, got {}", frame_size_, pcm.size());
            output.clear();
            return false;
        }

        output.resize(ENCODE_BUFFER_SIZE);
        int encoded_bytes = opus_encode(encoder_, pcm.data(), frame_size_, output.data(),
                                        static_cast<opus_int32>(output.size()));

        if (encoded_bytes < 0) {
            Log::error("Opus encoding failed: {}", opus_strerror(encoded_bytes));
            output.clear();
            return false;
        }

        output.resize(encoded_bytes);
        return true;
    }

    void reset() override {
        if (encoder_ != nullptr) {
            opus_encoder_ctl(encoder_, OPUS_RESET_STATE);
        }
    }

    bool is_initialized() const {
        return encoder_ != nullptr;
    }

    // Fresh voice-profile encoders for the hub components; yields nullptr when creation fails
    static EncoderFactory factory() {
        return []() -> std::unique_ptr<FrameEncoder> {
            auto encoder = std::make_unique<OpusEncoderWrapper>();
            if (!encoder->create()) {
                return nullptr;
            }
            return encoder;
        };
    }

private:
    OpusEncoder* encoder_    = nullptr;
    int          frame_size_ = audio_constants::FRAME_SIZE;
};
