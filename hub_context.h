#pragma once

#include <optional>
#include <string>
#include <utility>

#include "audio_router.h"
#include "channel_arbiter.h"
#include "chime_store.h"
#include "control_plane.h"
#include "device_directory.h"
#include "hub_config.h"
#include "hub_settings.h"
#include "logger.h"
#include "message_validator.h"
#include "rx_stats.h"
#include "session_registry.h"
#include "transport_metrics.h"
#include "voice_codec.h"

// Everything the hub components share. Built once by the Hub (or a test) and passed by reference.
struct HubContext {
    HubContext(HubConfig cfg, StatePublisher& state_publisher, EncoderFactory encoders)
        : config(std::move(cfg)),
          publisher(state_publisher),
          arbiter(config.arbiter_timeouts()),
          router(sessions),
          chimes(config.chimes_path, config.bundled_chimes_path, encoders),
          encoder_factory(std::move(encoders)) {}

    HubContext(const HubContext&)            = delete;
    HubContext& operator=(const HubContext&) = delete;

    HubConfig        config;
    StatePublisher&  publisher;
    ChannelArbiter   arbiter;
    SessionRegistry  sessions;
    AudioRouter      router;
    DeviceDirectory  devices;
    ChimeStore       chimes;
    AudioRxStats     rx_stats;
    TransportMetrics metrics;
    HubSettings      settings;
    EncoderFactory   encoder_factory;

    // Publishes the channel state and mirrors it to every browser. While the hub itself
    // transmits, browsers are listeners and are told "receiving".
    void announce_channel_state(ChannelMode mode) {
        publisher.publish_state("current_state", channel_mode_name(mode));
        const char* web_status =
            mode == ChannelMode::Transmitting ? "receiving" : channel_mode_name(mode);
        router.broadcast_json(AudioRouter::state_message(web_status));
    }

    // Resolves a room to its device address. "All Rooms" and unknown rooms give nullopt
    // (multicast).
    std::optional<std::string> resolve_target_ip(const std::string& target) const {
        if (message_validator::is_broadcast_target(target)) {
            return std::nullopt;
        }
        auto ip = devices.ip_for_room(target);
        if (!ip) {
            Log::warn("Target '{}' not found, using multicast", target);
        }
        return ip;
    }

    void publish_targets() {
        publisher.publish_state("targets", devices.target_options());
    }
};
