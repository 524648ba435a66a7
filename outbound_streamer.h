#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <asio.hpp>

#include "audio_transmitter.h"
#include "channel_arbiter.h"
#include "frame_pacer.h"
#include "hub_context.h"

// Hub-originated streams (chimes, announcements). At most one runs at a time: the caller must
// win the transmit gate, and the stream itself runs on a dedicated worker thread so the paced
// send loop never blocks the io_context.
class OutboundStreamer {
public:
    OutboundStreamer(HubContext& ctx, AudioTransmitter& transmitter);
    ~OutboundStreamer();

    OutboundStreamer(const OutboundStreamer&)            = delete;
    OutboundStreamer& operator=(const OutboundStreamer&) = delete;

    // Queue a chime stream. False when another hub stream holds the channel.
    bool stream_chime(const std::optional<std::string>& unicast_ip, const std::string& chime_name);

    // Queue an announcement of 16 kHz mono PCM to the current target room
    bool broadcast_pcm(std::vector<int16_t> pcm);

    // Blocking bodies of the two streams. The lease is released when they return.
    std::optional<PacingResult> play_chime(TransmitLease lease,
                                           const std::optional<std::string>& unicast_ip,
                                           const std::string& chime_name);
    std::optional<PacingResult> play_broadcast(TransmitLease lease, std::span<const int16_t> pcm);

    // Waits for queued streams to finish; no new streams are accepted afterwards
    void join();

private:
    void enter_transmit(Priority priority);
    void leave_transmit();

    HubContext&       ctx_;
    AudioTransmitter& transmitter_;
    FramePacer        pacer_;
    asio::thread_pool worker_{1};
    std::atomic<bool> joined_{false};
};
