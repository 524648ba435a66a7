#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "audio_constants.h"
#include "audio_transmitter.h"
#include "control_plane.h"
#include "hub_config.h"
#include "hub_context.h"
#include "session_info.h"
#include "voice_codec.h"

namespace test_support {

// Encoder that emits {marker, frame index} and counts everything it is asked to do
class FakeEncoder : public FrameEncoder {
public:
    struct Counters {
        std::atomic<int> created{0};
        std::atomic<int> encodes{0};
        std::atomic<int> resets{0};
        std::atomic<int> fail_after{-1};  // encode fails from this call on; -1 never
    };

    explicit FakeEncoder(std::shared_ptr<Counters> counters) : counters_(std::move(counters)) {
        ++counters_->created;
    }

    bool encode(std::span<const int16_t> pcm, std::vector<uint8_t>& output) override {
        int index = counters_->encodes++;
        if (counters_->fail_after >= 0 && index >= counters_->fail_after) {
            return false;
        }
        if (pcm.size() != static_cast<size_t>(audio_constants::FRAME_SIZE)) {
            return false;
        }
        bool silent = std::all_of(pcm.begin(), pcm.end(), [](int16_t s) { return s == 0; });
        output      = {silent ? uint8_t{0x00} : uint8_t{0xA5}, static_cast<uint8_t>(index)};
        return true;
    }

    void reset() override {
        ++counters_->resets;
    }

private:
    std::shared_ptr<Counters> counters_;
};

inline EncoderFactory fake_encoder_factory(std::shared_ptr<FakeEncoder::Counters> counters) {
    return [counters]() { return std::make_unique<FakeEncoder>(counters); };
}

// Decoder that records the kind of each call in order
class FakeDecoder : public FrameDecoder {
public:
    enum class Call {
        Decode,
        Fec,
        Plc,
        Reset,
    };

    bool decode(std::span<const uint8_t> data, bool use_fec, PcmFrame& output) override {
        calls.push_back(use_fec ? Call::Fec : Call::Decode);
        if (data.empty()) {
            return false;
        }
        output.assign(audio_constants::FRAME_SIZE, static_cast<int16_t>(data[0]));
        return true;
    }

    bool decode_plc(PcmFrame& output) override {
        calls.push_back(Call::Plc);
        output.assign(audio_constants::FRAME_SIZE, 0);
        return true;
    }

    void reset() override {
        calls.push_back(Call::Reset);
    }

    size_t count(Call kind) const {
        return static_cast<size_t>(std::count(calls.begin(), calls.end(), kind));
    }

    std::vector<Call> calls;
};

struct SentFrame {
    std::vector<uint8_t>       opus;
    Priority                   priority = Priority::Normal;
    std::optional<std::string> unicast_ip;
};

class FakeTransmitter : public AudioTransmitter {
public:
    bool send_audio(std::span<const uint8_t> opus, Priority priority,
                    const std::optional<std::string>& unicast_ip) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (fail_) {
            return false;
        }
        sent_.push_back(SentFrame{{opus.begin(), opus.end()}, priority, unicast_ip});
        return true;
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::vector<SentFrame> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

private:
    mutable std::mutex     mutex_;
    std::vector<SentFrame> sent_;
    size_t                 attempts_ = 0;
    bool                   fail_     = false;
};

class FakePeer : public PeerConnection {
public:
    explicit FakePeer(std::string remote = "10.0.0.50:40000") : remote_(std::move(remote)) {}

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alive_) {
            return false;
        }
        texts_.push_back(text);
        return true;
    }

    bool send_binary(std::span<const uint8_t> data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alive_) {
            return false;
        }
        binaries_.emplace_back(data.begin(), data.end());
        return true;
    }

    std::string remote_address() const override {
        return remote_;
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        alive_ = false;
    }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& text: texts_) {
            out.push_back(nlohmann::json::parse(text));
        }
        return out;
    }

    // Messages of one "type"
    std::vector<nlohmann::json> messages(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (auto& message: messages()) {
            if (message.value("type", "") == type) {
                out.push_back(message);
            }
        }
        return out;
    }

    std::vector<std::vector<uint8_t>> binaries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return binaries_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.clear();
        binaries_.clear();
    }

private:
    mutable std::mutex                mutex_;
    std::string                       remote_;
    std::vector<std::string>          texts_;
    std::vector<std::vector<uint8_t>> binaries_;
    bool                              alive_ = true;
};

// Every publish in order, plus the retained view
class RecordingPublisher : public RetainedStatePublisher {
public:
    void publish_state(const std::string& field, const nlohmann::json& value) override {
        RetainedStatePublisher::publish_state(field, value);
        std::lock_guard<std::mutex> lock(mutex_);
        history_.emplace_back(field, value);
    }

    std::vector<nlohmann::json> values(const std::string& field) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& [name, value]: history_) {
            if (name == field) {
                out.push_back(value);
            }
        }
        return out;
    }

    void clear_history() {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.clear();
    }

private:
    mutable std::mutex                                       mutex_;
    std::vector<std::pair<std::string, nlohmann::json>>      history_;
};

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("intercom_hub_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
};

inline DeviceId device_id(uint8_t last) {
    return DeviceId{0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, last};
}

// Timeouts shortened so waits in tests stay in the tens of milliseconds
inline HubConfig test_config(const std::filesystem::path& chimes_dir) {
    HubConfig config;
    config.device_id            = DeviceId{0x48, 0x55, 0x42, 0x00, 0x00, 0x00, 0x00, 0x01};
    config.chimes_path          = (chimes_dir / "chimes").string();
    config.bundled_chimes_path  = (chimes_dir / "bundled").string();
    config.channel_wait_timeout = std::chrono::milliseconds(300);
    config.ptt_queue_timeout    = std::chrono::milliseconds(200);
    config.ptt_drain_gap        = std::chrono::milliseconds(0);
    return config;
}

// A 16-bit PCM WAV image
inline std::vector<uint8_t> make_wav(const std::vector<int16_t>& samples, uint32_t sample_rate,
                                     uint16_t channels = 1) {
    auto put16 = [](std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto put32 = [](std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    };

    const auto data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    std::vector<uint8_t> wav{'R', 'I', 'F', 'F'};
    put32(wav, 36 + data_size);
    wav.insert(wav.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    put32(wav, 16);
    put16(wav, 1);
    put16(wav, channels);
    put32(wav, sample_rate);
    put32(wav, sample_rate * channels * 2);
    put16(wav, static_cast<uint16_t>(channels * 2));
    put16(wav, 16);
    wav.insert(wav.end(), {'d', 'a', 't', 'a'});
    put32(wav, data_size);
    for (int16_t s: samples) {
        put16(wav, static_cast<uint16_t>(s));
    }
    return wav;
}

inline std::vector<int16_t> tone(size_t count, int16_t amplitude = 1000) {
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = static_cast<int16_t>((i % 40) < 20 ? amplitude : -amplitude);
    }
    return samples;
}

// HubContext over fakes, with its own chime directory
struct TestHub {
    TestHub() : TestHub(std::make_shared<FakeEncoder::Counters>()) {}

    explicit TestHub(std::shared_ptr<FakeEncoder::Counters> counters)
        : encoder_counters(std::move(counters)),
          ctx(test_config(dir.path()), publisher, fake_encoder_factory(encoder_counters)) {}

    std::shared_ptr<FakePeer> connect(const std::string& connection_id,
                                      const std::optional<std::string>& client_id = std::nullopt) {
        auto peer = std::make_shared<FakePeer>();
        ctx.sessions.add(connection_id, peer);
        if (client_id) {
            ctx.sessions.identify(connection_id, *client_id);
        }
        return peer;
    }

    TempDir                                dir;
    std::shared_ptr<FakeEncoder::Counters> encoder_counters;
    RecordingPublisher                     publisher;
    HubContext                             ctx;
};

}  // namespace test_support
