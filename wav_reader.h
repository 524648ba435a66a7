#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

#include "audio_constants.h"
#include "logger.h"

// RIFF/WAVE parsing over an in-memory buffer (uploads arrive as a request body)
namespace wav_format {

struct WavInfo {
    uint16_t audio_format    = 0;  // 1 for PCM
    uint16_t num_channels    = 0;
    uint32_t sample_rate     = 0;
    uint16_t bits_per_sample = 0;
    size_t   data_offset     = 0;
    size_t   data_size       = 0;
};

inline uint16_t read_u16(std::span<const uint8_t> data, size_t pos) {
    return static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
}

inline uint32_t read_u32(std::span<const uint8_t> data, size_t pos) {
    return static_cast<uint32_t>(data[pos]) | (static_cast<uint32_t>(data[pos + 1]) << 8) |
           (static_cast<uint32_t>(data[pos + 2]) << 16) |
           (static_cast<uint32_t>(data[pos + 3]) << 24);
}

// Walks the chunk list for "fmt " and "data", skipping anything else
inline bool parse_header(std::span<const uint8_t> data, WavInfo& info) {
    if (data.size() < 12 || std::memcmp(data.data(), "RIFF", 4) != 0 ||
        std::memcmp(data.data() + 8, "WAVE", 4) != 0) {
        return false;
    }

    bool   found_fmt = false;
    size_t pos       = 12;
    while (pos + 8 <= data.size()) {
        const uint8_t* chunk_id   = data.data() + pos;
        uint32_t       chunk_size = read_u32(data, pos + 4);
        size_t         body       = pos + 8;

        if (std::memcmp(chunk_id, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > data.size()) {
                return false;
            }
            info.audio_format    = read_u16(data, body);
            info.num_channels    = read_u16(data, body + 2);
            info.sample_rate     = read_u32(data, body + 4);
            info.bits_per_sample = read_u16(data, body + 14);
            found_fmt            = true;
        } else if (std::memcmp(chunk_id, "data", 4) == 0) {
            if (!found_fmt) {
                return false;
            }
            info.data_offset = body;
            // Truncated files keep whatever audio actually arrived
            info.data_size = std::min<size_t>(chunk_size, data.size() - body);
            return true;
        }

        // Chunks are word aligned
        pos = body + chunk_size + (chunk_size & 1U);
    }
    return false;
}

// PCM only, 8/16/24/32-bit, at least one channel
inline bool validate_format(const WavInfo& info) {
    if (info.audio_format != 1 || info.num_channels < 1 || info.sample_rate == 0) {
        return false;
    }
    switch (info.bits_per_sample) {
        case 8:
        case 16:
        case 24:
        case 32:
            return true;
        default:
            return false;
    }
}

}  // namespace wav_format

// Sample format conversion to 16-bit mono
namespace pcm_decode {

inline int32_t sample_to_int16(const uint8_t* p, uint16_t bits) {
    switch (bits) {
        case 8:
            // 8-bit WAV is unsigned
            return (static_cast<int32_t>(p[0]) - 128) << 8;
        case 16:
            return static_cast<int16_t>(p[0] | (p[1] << 8));
        case 24: {
            int32_t value = p[0] | (p[1] << 8) | (p[2] << 16);
            if (value >= 0x800000) {
                value -= 0x1000000;
            }
            return value >> 8;
        }
        case 32: {
            auto value = static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                                              (static_cast<uint32_t>(p[1]) << 8) |
                                              (static_cast<uint32_t>(p[2]) << 16) |
                                              (static_cast<uint32_t>(p[3]) << 24));
            return value >> 16;
        }
        default:
            return 0;
    }
}

// Averages all channels of each frame
inline std::vector<int16_t> to_mono16(std::span<const uint8_t> data, const wav_format::WavInfo& info) {
    const size_t bytes_per_sample = info.bits_per_sample / 8;
    const size_t frame_bytes      = bytes_per_sample * info.num_channels;
    const size_t frames           = info.data_size / frame_bytes;

    std::vector<int16_t> mono;
    mono.reserve(frames);
    const uint8_t* base = data.data() + info.data_offset;
    for (size_t i = 0; i < frames; ++i) {
        int64_t sum = 0;
        for (size_t ch = 0; ch < info.num_channels; ++ch) {
            sum += sample_to_int16(base + (i * frame_bytes) + (ch * bytes_per_sample),
                                   info.bits_per_sample);
        }
        auto avg = static_cast<int32_t>(sum / static_cast<int64_t>(info.num_channels));
        mono.push_back(static_cast<int16_t>(std::clamp(avg, -32768, 32767)));
    }
    return mono;
}

}  // namespace pcm_decode

// Sample rate conversion
namespace audio_resample {

// Linear interpolation; output length is input length scaled by the rate ratio
inline std::vector<int16_t> linear(const std::vector<int16_t>& input, uint32_t source_rate,
                                   uint32_t target_rate) {
    if (source_rate == target_rate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(source_rate) / static_cast<double>(target_rate);
    const auto   count = static_cast<size_t>(static_cast<double>(input.size()) / ratio);

    std::vector<int16_t> output;
    output.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double pos  = static_cast<double>(i) * ratio;
        auto   lo   = static_cast<size_t>(pos);
        double frac = pos - static_cast<double>(lo);
        if (lo + 1 >= input.size()) {
            output.push_back(input[std::min(lo, input.size() - 1)]);
        } else {
            auto value = static_cast<int32_t>((input[lo] * (1.0 - frac)) + (input[lo + 1] * frac));
            output.push_back(static_cast<int16_t>(std::clamp(value, -32768, 32767)));
        }
    }
    return output;
}

}  // namespace audio_resample

// Decodes a WAV image into 16 kHz mono int16 PCM
inline std::optional<std::vector<int16_t>> decode_wav_to_voice_pcm(std::span<const uint8_t> data) {
    wav_format::WavInfo info;
    if (!wav_format::parse_header(data, info)) {
        Log::error("Invalid WAV header");
        return std::nullopt;
    }
    if (!wav_format::validate_format(info)) {
        Log::error("Unsupported WAV format: format={}, {}ch, {}-bit", info.audio_format,
                   info.num_channels, info.bits_per_sample);
        return std::nullopt;
    }

    Log::info("WAV: {}ch, {}-bit, {}Hz, {} bytes of audio", info.num_channels,
              info.bits_per_sample, info.sample_rate, info.data_size);

    auto mono = pcm_decode::to_mono16(data, info);
    return audio_resample::linear(mono, info.sample_rate, audio_constants::SAMPLE_RATE);
}

inline std::optional<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Log::error("Failed to open file: {}", path.string());
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return bytes;
}
