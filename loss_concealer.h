#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>

#include "logger.h"
#include "protocol.h"
#include "voice_codec.h"

// Largest run of missing frames still worth synthesising. Longer gaps mean the sender
// restarted or the network stalled; concealing them would only add latency.
constexpr uint32_t MAX_PLC_GAP = 4;

enum class RecoveryKind {
    None,
    Fec,
    Plc,
};

// Classifies the distance between the last seen and the current sequence number.
// Arithmetic is mod 2^32 so wrap-around is a normal step and duplicates/reorders
// produce huge gaps that fall through to None.
inline RecoveryKind classify_gap(uint32_t gap) {
    if (gap == 1) {
        return RecoveryKind::Fec;
    }
    if (gap >= 2 && gap <= MAX_PLC_GAP) {
        return RecoveryKind::Plc;
    }
    return RecoveryKind::None;
}

// Per-hub concealment state for the single active inbound stream
class LossConcealer {
public:
    // Called once per decoded frame in playback order, with the priority it should be forwarded at
    using FrameSink = std::function<void(const PcmFrame& pcm, Priority priority)>;

    struct Stats {
        uint64_t fec_frames   = 0;
        uint64_t plc_frames   = 0;
        uint64_t decode_fails = 0;
        uint64_t resets       = 0;
    };

    explicit LossConcealer(FrameDecoder& decoder) : decoder_(decoder) {}

    void process(const AudioPacket& packet, const FrameSink& sink) {
        if (!last_sender_ || *last_sender_ != packet.device_id) {
            if (last_sender_) {
                Log::debug("Sender changed {} -> {}, resetting decoder", to_hex(*last_sender_),
                           to_hex(packet.device_id));
            }
            decoder_.reset();
            ++stats_.resets;
            last_sender_ = packet.device_id;
            last_seq_.reset();
        }

        if (last_seq_) {
            uint32_t gap = packet.sequence - *last_seq_ - 1;
            switch (classify_gap(gap)) {
                case RecoveryKind::Fec:
                    // The current packet carries a redundant copy of the one we missed
                    if (decoder_.decode(packet.payload, true, scratch_)) {
                        ++stats_.fec_frames;
                        sink(scratch_, Priority::Normal);
                    } else {
                        ++stats_.decode_fails;
                    }
                    break;
                case RecoveryKind::Plc:
                    for (uint32_t i = 0; i < gap; ++i) {
                        if (decoder_.decode_plc(scratch_)) {
                            ++stats_.plc_frames;
                            sink(scratch_, Priority::Normal);
                        } else {
                            ++stats_.decode_fails;
                        }
                    }
                    break;
                case RecoveryKind::None:
                    break;
            }
        }
        last_seq_ = packet.sequence;

        if (decoder_.decode(packet.payload, false, scratch_)) {
            sink(scratch_, packet.priority);
        } else {
            ++stats_.decode_fails;
        }
    }

    // Forget the current sender, e.g. once the channel has gone idle
    void reset() {
        last_sender_.reset();
        last_seq_.reset();
    }

    const Stats& stats() const {
        return stats_;
    }

private:
    FrameDecoder&           decoder_;
    std::optional<DeviceId> last_sender_;
    std::optional<uint32_t> last_seq_;
    PcmFrame                scratch_;
    Stats                   stats_;
};
