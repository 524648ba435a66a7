#include "outbound_streamer.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#include "audio_constants.h"
#include "logger.h"

namespace {

struct OutFrame {
    std::vector<uint8_t> opus;
    const PcmFrame*      pcm = nullptr;  // set for real audio, fanned out to browsers
};

std::string destination_name(const std::optional<std::string>& unicast_ip) {
    return unicast_ip ? "unicast " + *unicast_ip : "multicast";
}

}  // namespace

OutboundStreamer::OutboundStreamer(HubContext& ctx, AudioTransmitter& transmitter)
    : ctx_(ctx), transmitter_(transmitter) {}

OutboundStreamer::~OutboundStreamer() {
    join();
}

bool OutboundStreamer::stream_chime(const std::optional<std::string>& unicast_ip,
                                    const std::string& chime_name) {
    if (joined_) {
        return false;
    }
    auto lease = ctx_.arbiter.try_acquire_transmit();
    if (!lease) {
        Log::warn("Chime '{}' skipped: another stream is transmitting", chime_name);
        return false;
    }

    auto held = std::make_shared<TransmitLease>(std::move(*lease));
    asio::post(worker_, [this, held, unicast_ip, chime_name]() {
        try {
            play_chime(std::move(*held), unicast_ip, chime_name);
        } catch (const std::exception& e) {
            Log::error("Chime stream failed: {}", e.what());
            leave_transmit();
        }
    });
    return true;
}

bool OutboundStreamer::broadcast_pcm(std::vector<int16_t> pcm) {
    if (joined_) {
        return false;
    }
    if (pcm.empty()) {
        Log::warn("Broadcast skipped: no audio");
        return false;
    }
    auto lease = ctx_.arbiter.try_acquire_transmit();
    if (!lease) {
        Log::warn("Broadcast skipped: another stream is transmitting");
        return false;
    }

    auto held  = std::make_shared<TransmitLease>(std::move(*lease));
    auto audio = std::make_shared<std::vector<int16_t>>(std::move(pcm));
    asio::post(worker_, [this, held, audio]() {
        try {
            play_broadcast(std::move(*held), *audio);
        } catch (const std::exception& e) {
            Log::error("Broadcast stream failed: {}", e.what());
            leave_transmit();
        }
    });
    return true;
}

std::optional<PacingResult> OutboundStreamer::play_chime(
    TransmitLease lease, const std::optional<std::string>& unicast_ip,
    const std::string& chime_name) {
    auto frames = ctx_.chimes.frames_or_first(chime_name);
    if (!frames || frames->empty()) {
        Log::warn("No chime available to play for '{}'", chime_name);
        return std::nullopt;
    }

    const Priority priority = Priority::High;
    enter_transmit(priority);

    Log::info("Chime '{}' -> {} ({} frames)", chime_name, destination_name(unicast_ip),
              frames->size());

    int          consecutive_errors = 0;
    PacingResult result             = pacer_.run(frames->size(), [&](size_t i) {
        if (transmitter_.send_audio((*frames)[i], priority, unicast_ip)) {
            consecutive_errors = 0;
            return true;
        }
        if (++consecutive_errors >= hub_config::MAX_CONSECUTIVE_SEND_ERRORS) {
            Log::error("Chime aborted after {} consecutive send errors", consecutive_errors);
            return false;
        }
        return true;
    });

    Log::info("Chime complete: {} frames in {:.2f}s (drift {:+.1f}ms)", result.frames_sent,
              result.elapsed_seconds(), result.drift_ms());

    leave_transmit();
    lease.release();
    return result;
}

std::optional<PacingResult> OutboundStreamer::play_broadcast(TransmitLease lease,
                                                             std::span<const int16_t> pcm) {
    using namespace audio_constants;

    std::unique_ptr<FrameEncoder> encoder = ctx_.encoder_factory();
    if (!encoder) {
        Log::error("Broadcast skipped: no encoder");
        return std::nullopt;
    }
    encoder->reset();

    const Priority priority  = ctx_.arbiter.tx_priority();
    const auto     target_ip = ctx_.resolve_target_ip(ctx_.settings.target());

    // Everything is encoded up front so the paced loop only sends
    std::vector<PcmFrame> audio;
    for (size_t offset = 0; offset < pcm.size(); offset += FRAME_SIZE) {
        size_t   count = std::min<size_t>(FRAME_SIZE, pcm.size() - offset);
        PcmFrame frame(FRAME_SIZE, 0);
        std::copy_n(pcm.begin() + static_cast<std::ptrdiff_t>(offset), count, frame.begin());
        audio.push_back(std::move(frame));
    }

    const PcmFrame        silence(FRAME_SIZE, 0);
    std::vector<OutFrame> out;
    out.reserve(LEAD_IN_FRAMES + audio.size() + TRAIL_OUT_FRAMES);

    auto push = [&](const PcmFrame& frame, const PcmFrame* fan_out) {
        OutFrame encoded;
        if (!encoder->encode(frame, encoded.opus)) {
            return;  // skipped, the stream continues
        }
        encoded.pcm = fan_out;
        out.push_back(std::move(encoded));
    };
    for (size_t i = 0; i < LEAD_IN_FRAMES; ++i) {
        push(silence, nullptr);
    }
    for (const auto& frame: audio) {
        push(frame, &frame);
    }
    for (size_t i = 0; i < TRAIL_OUT_FRAMES; ++i) {
        push(silence, nullptr);
    }

    enter_transmit(priority);
    Log::info("Broadcast -> {}: {} audio frames + {} padding, priority {}",
              destination_name(target_ip), audio.size(), LEAD_IN_FRAMES + TRAIL_OUT_FRAMES,
              priority_name(priority));

    PacingResult result = pacer_.run(out.size(), [&](size_t i) {
        transmitter_.send_audio(out[i].opus, priority, target_ip);
        if (out[i].pcm != nullptr) {
            ctx_.router.fan_out(*out[i].pcm, priority);
        }
        return true;
    });

    Log::info("Broadcast complete: {} frames in {:.2f}s (drift {:+.1f}ms)", result.frames_sent,
              result.elapsed_seconds(), result.drift_ms());

    leave_transmit();
    lease.release();
    return result;
}

void OutboundStreamer::join() {
    if (joined_.exchange(true)) {
        return;
    }
    worker_.join();
}

void OutboundStreamer::enter_transmit(Priority priority) {
    if (ctx_.arbiter.wait_for_channel(priority) == ChannelWait::Free) {
        Log::debug("Channel free for priority {}", priority_name(priority));
    }
    if (ctx_.arbiter.begin_transmit()) {
        ctx_.announce_channel_state(ChannelMode::Transmitting);
    }
}

void OutboundStreamer::leave_transmit() {
    if (ctx_.arbiter.end_transmit()) {
        ctx_.announce_channel_state(ChannelMode::Idle);
    }
}
