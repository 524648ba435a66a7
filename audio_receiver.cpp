#include "audio_receiver.h"

#include <optional>
#include <string>
#include <utility>

#include "logger.h"
#include "message_validator.h"
#include "packet_codec.h"

namespace {
constexpr uint64_t RX_LOG_EVERY = 500;
}

AudioReceiver::AudioReceiver(HubContext& ctx, std::unique_ptr<FrameDecoder> decoder)
    : ctx_(ctx), decoder_(std::move(decoder)), concealer_(*decoder_) {}

void AudioReceiver::on_datagram(std::span<const uint8_t> datagram) {
    auto result = packet_codec::decode(datagram);
    const AudioPacket* packet = packet_codec::as_packet(result);
    if (packet == nullptr) {
        ctx_.metrics.record_malformed();
        return;
    }

    // Our own multicast coming back through another interface
    if (packet->device_id == ctx_.config.device_id) {
        return;
    }

    const std::string sender = to_hex(packet->device_id);

    // Counted before DND so the stats show everything that arrived
    ctx_.metrics.record_rx(sender, packet->sequence);
    ctx_.rx_stats.record(sender, packet->sequence, packet->priority);

    if (++rx_events_ % RX_LOG_EVERY == 0) {
        Log::debug("RX {} packets, last from {} seq {}", rx_events_, sender, packet->sequence);
    }

    RxDecision decision = ctx_.arbiter.on_packet(packet->priority, sender);
    if (!decision.forward) {
        return;
    }

    const std::string          device_name = DeviceDirectory::device_name_for_sender(sender);
    std::optional<std::string> target      = ctx_.devices.sender_target(device_name);

    if (decision.state_changed) {
        ctx_.publisher.publish_state("current_state", "receiving");
        auto message = AudioRouter::state_message("receiving");
        if (target && !message_validator::is_broadcast_target(*target)) {
            ctx_.router.send_json_to_client(*target, message);
            Log::info("Receiving audio from {} -> {}", device_name, *target);
        } else {
            ctx_.router.broadcast_json(message);
            Log::info("Receiving broadcast audio from {}", device_name);
        }
    }

    if (ctx_.sessions.empty() || packet->payload.empty()) {
        return;
    }

    concealer_.process(*packet, [&](const PcmFrame& pcm, Priority priority) {
        ctx_.router.forward_inbound(pcm, priority, target);
    });
}

void AudioReceiver::check_idle() {
    if (ctx_.arbiter.check_rx_timeout()) {
        Log::debug("Receive ended, back to idle");
        // The next stream starts on a fresh decoder even from the same sender
        concealer_.reset();
        ctx_.announce_channel_state(ChannelMode::Idle);
    }
}
