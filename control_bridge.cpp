#include "control_bridge.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

#include "audio_constants.h"
#include "logger.h"
#include "message_validator.h"

namespace {

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

const char* on_off(bool value) {
    return value ? "ON" : "OFF";
}

}  // namespace

ControlBridge::ControlBridge(HubContext& ctx, OutboundStreamer& streamer)
    : ctx_(ctx), streamer_(streamer) {}

bool ControlBridge::handle_command(const std::string& field, const std::string& value) {
    if (field == "volume") {
        return set_volume(value);
    }
    if (field == "mute") {
        ctx_.settings.set_muted(upper(value) == "ON");
        publish_mute();
        return true;
    }
    if (field == "target") {
        return set_target(value);
    }
    if (field == "priority") {
        Priority priority = parse_priority(value).value_or(Priority::Normal);
        ctx_.arbiter.set_tx_priority(priority);
        publish_priority();
        Log::info("Hub TX priority set to: {}", priority_name(priority));
        return true;
    }
    if (field == "dnd") {
        bool enabled = upper(value) == "ON";
        ctx_.arbiter.set_dnd(enabled);
        publish_dnd();
        Log::info("Hub DND {}", enabled ? "enabled" : "disabled");
        return true;
    }
    if (field == "chime") {
        return set_chime(value);
    }

    Log::warn("Unknown control field '{}'", field);
    return false;
}

void ControlBridge::on_call(const std::string& target, const std::string& caller) {
    auto room = message_validator::sanitize_room_name(target);
    if (!room) {
        Log::warn("Invalid call target rejected: '{}'", target.substr(0, 20));
        return;
    }
    std::string who = message_validator::sanitize_room_name(caller).value_or("Intercom");
    Log::info("Call: {} -> {}", who, *room);

    std::optional<std::string> ip;
    if (!message_validator::is_broadcast_target(*room)) {
        ip = ctx_.devices.ip_for_room(*room);
        if (!ip) {
            // A single-room call must never fall back to multicast
            Log::warn("Chime for '{}' skipped: target IP not found", *room);
            return;
        }
    }
    streamer_.stream_chime(ip, ctx_.chimes.current());
}

bool ControlBridge::place_call(const std::string& raw_target, const std::string& caller) {
    std::string safe_caller =
        message_validator::sanitize_string(caller, message_validator::MAX_ROOM_NAME_LENGTH);
    const std::string chime = ctx_.chimes.current();

    if (raw_target == "all" || raw_target == ALL_ROOMS) {
        ctx_.publisher.publish_state("call", {{"target", ALL_ROOMS},
                                              {"caller", safe_caller},
                                              {"source", "hub"},
                                              {"chime", chime}});
        Log::info("Call all rooms: {}", safe_caller);
        return streamer_.stream_chime(std::nullopt, chime);
    }

    auto target = message_validator::sanitize_room_name(raw_target);
    if (!target) {
        Log::warn("Invalid call target rejected: '{}'", raw_target.substr(0, 20));
        return false;
    }

    ctx_.publisher.publish_state("call", {{"target", *target},
                                          {"caller", safe_caller},
                                          {"source", "hub"},
                                          {"chime", chime}});
    Log::info("Call: {} -> {}", safe_caller, *target);

    auto ip = ctx_.devices.ip_for_room(*target);
    if (!ip) {
        Log::warn("Chime for '{}' skipped: target IP not found", *target);
        return false;
    }
    return streamer_.stream_chime(ip, chime);
}

void ControlBridge::on_device_discovered(const std::string& id, const std::string& room,
                                         const std::string& ip) {
    if (ctx_.devices.upsert(id, room, ip) == DeviceUpdate::Rejected) {
        return;
    }
    refresh_targets();
}

void ControlBridge::on_device_offline(const std::string& id) {
    if (!ctx_.devices.remove(id)) {
        return;
    }
    refresh_targets();
}

void ControlBridge::on_device_state(const std::string& device, const std::string& state,
                                    const std::string& target) {
    ctx_.devices.on_device_state(device, state, target);
}

bool ControlBridge::on_announce(std::vector<int16_t> pcm) {
    Log::info("Announcement: {} samples ({:.1f}s)", pcm.size(),
              static_cast<double>(pcm.size()) / audio_constants::SAMPLE_RATE);
    return streamer_.broadcast_pcm(std::move(pcm));
}

void ControlBridge::publish_all() {
    ctx_.publisher.publish_state("current_state", channel_mode_name(ctx_.arbiter.mode()));
    publish_volume();
    publish_mute();
    publish_target();
    publish_priority();
    publish_dnd();
    publish_chime();
    ctx_.publish_targets();
    ctx_.publisher.publish_state("chimes", ctx_.chimes.names());
}

nlohmann::json ControlBridge::state_json() const {
    ChannelSnapshot snapshot = ctx_.arbiter.snapshot();
    return {
        {"version", hub_config::VERSION},
        {"device_name", ctx_.config.device_name},
        {"device_id", to_hex(ctx_.config.device_id)},
        {"current_state", channel_mode_name(snapshot.mode)},
        {"current_sender", snapshot.current_sender},
        {"web_ptt_active", snapshot.web_ptt_active},
        {"volume", ctx_.settings.volume()},
        {"mute", on_off(ctx_.settings.muted())},
        {"target", ctx_.settings.target()},
        {"priority", priority_name(ctx_.arbiter.tx_priority())},
        {"dnd", on_off(ctx_.arbiter.dnd())},
        {"chime", ctx_.chimes.current()},
        {"targets", ctx_.devices.target_options()},
        {"web_clients", ctx_.sessions.count()},
    };
}

bool ControlBridge::set_volume(const std::string& value) {
    double parsed = 0;
    size_t used   = 0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || !std::isfinite(parsed)) {
        Log::warn("Invalid volume '{}'", value.substr(0, 20));
        return false;
    }
    int stored = ctx_.settings.set_volume(static_cast<int>(std::clamp(parsed, 0.0, 100.0)));
    publish_volume();
    Log::debug("Volume set to {}", stored);
    return true;
}

bool ControlBridge::set_target(const std::string& value) {
    auto target = message_validator::sanitize_room_name(value);
    if (!target) {
        Log::warn("Invalid target rejected: '{}'", value.substr(0, 20));
        return false;
    }
    ctx_.settings.set_target(*target);
    publish_target();
    Log::info("Target set to: {}", *target);
    return true;
}

bool ControlBridge::set_chime(const std::string& value) {
    if (ctx_.chimes.count() == 0) {
        Log::warn("Chime '{}' ignored: no chimes loaded", value.substr(0, 20));
        return false;
    }
    std::string name =
        message_validator::sanitize_string(value, message_validator::MAX_CHIME_NAME_LENGTH);
    std::string selected = ctx_.chimes.select_or_fallback(name);
    publish_chime();
    Log::info("Chime set to: {}", selected);
    return true;
}

void ControlBridge::refresh_targets() {
    ctx_.publish_targets();
    if (!ctx_.devices.has_target(ctx_.settings.target())) {
        Log::info("Target '{}' no longer available, back to {}", ctx_.settings.target(), ALL_ROOMS);
        ctx_.settings.set_target(ALL_ROOMS);
        publish_target();
    }
}

void ControlBridge::publish_volume() {
    ctx_.publisher.publish_state("volume", ctx_.settings.volume());
}

void ControlBridge::publish_mute() {
    ctx_.publisher.publish_state("mute", on_off(ctx_.settings.muted()));
}

void ControlBridge::publish_target() {
    ctx_.publisher.publish_state("target", ctx_.settings.target());
}

void ControlBridge::publish_priority() {
    ctx_.publisher.publish_state("priority", priority_name(ctx_.arbiter.tx_priority()));
}

void ControlBridge::publish_dnd() {
    ctx_.publisher.publish_state("dnd", on_off(ctx_.arbiter.dnd()));
}

void ControlBridge::publish_chime() {
    ctx_.publisher.publish_state("chime", ctx_.chimes.current());
}
