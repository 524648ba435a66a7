#include "web_ptt_handler.h"

#include <cstring>
#include <thread>
#include <utility>
#include <vector>

#include "audio_constants.h"
#include "logger.h"
#include "message_validator.h"

namespace {

std::string string_field(const nlohmann::json& message, const char* key,
                         const std::string& fallback = {}) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

nlohmann::json web_client_status(const std::string& client_id, const char* status) {
    return {{"client_id", client_id}, {"status", status}};
}

}  // namespace

WebPttHandler::WebPttHandler(HubContext& ctx, AudioTransmitter& transmitter, CallFn place_call)
    : ctx_(ctx), transmitter_(transmitter), place_call_(std::move(place_call)) {}

void WebPttHandler::on_open(const std::string&              connection_id,
                            std::shared_ptr<PeerConnection> peer) {
    std::string remote = peer ? peer->remote_address() : std::string{};
    ctx_.sessions.add(connection_id, std::move(peer));
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        states_[connection_id] = std::make_shared<PttState>();
    }
    Log::info("Web PTT client connected from {} ({} total)", remote, ctx_.sessions.count());

    ctx_.router.send_json(connection_id, {{"type", "init"},
                                          {"version", hub_config::VERSION},
                                          {"status", channel_mode_name(ctx_.arbiter.mode())}});
    send_targets(connection_id);
}

void WebPttHandler::on_text(const std::string& connection_id, const std::string& text) {
    if (!message_validator::is_control_message_size_ok(text.size())) {
        Log::warn("Oversized control message from {} ({} bytes), ignored", connection_id,
                  text.size());
        return;
    }

    std::string type;
    try {
        auto message = nlohmann::json::parse(text);
        if (!message.is_object()) {
            return;
        }
        type = string_field(message, "type");

        if (type == "ptt_start") {
            handle_ptt_start(connection_id, message);
        } else if (type == "ptt_stop") {
            handle_ptt_stop(connection_id);
        } else if (type == "identify") {
            handle_identify(connection_id, message);
        } else if (type == "call") {
            handle_call(connection_id, message);
        } else if (type == "get_state") {
            handle_get_state(connection_id);
        } else if (type == "set_chime") {
            handle_set_chime(message);
        } else if (type == "set_target") {
            // acknowledged only, the target is read at ptt_start
        } else {
            Log::debug("Unknown message type '{}' from {}", type, connection_id);
        }
    } catch (const nlohmann::json::exception& e) {
        Log::debug("Bad control message from {} ({}): {}", connection_id, type, e.what());
    }
}

void WebPttHandler::on_binary(const std::string& connection_id, std::span<const uint8_t> data) {
    using namespace audio_constants;

    if (!message_validator::is_pcm_frame(data.size())) {
        return;
    }
    auto state = state_for(connection_id);
    if (!state) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->active || !state->encoder) {
        return;
    }

    // Edge nodes need a primed jitter buffer before the first word
    if (!state->lead_in_sent) {
        send_silence(*state, LEAD_IN_FRAMES);
        state->lead_in_sent = true;
    }

    PcmFrame pcm(FRAME_SIZE);
    std::memcpy(pcm.data(), data.data(), FRAME_BYTES);

    std::vector<uint8_t> opus;
    if (state->encoder->encode(pcm, opus)) {
        transmitter_.send_audio(opus, state->priority, state->target_ip);
    }
    ++state->frame_count;

    auto now               = std::chrono::steady_clock::now();
    state->last_frame_time = now;
    ctx_.arbiter.note_web_frame(now);

    ctx_.router.relay_ptt(connection_id, data, state->priority, state->target_room);
}

void WebPttHandler::on_close(const std::string& connection_id) {
    std::shared_ptr<PttState> state;
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        auto                        it = states_.find(connection_id);
        if (it != states_.end()) {
            state = std::move(it->second);
            states_.erase(it);
        }
    }

    auto session = ctx_.sessions.remove(connection_id);

    std::optional<std::string> client_id = session ? session->client_id : std::nullopt;
    if (state) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->client_id) {
            client_id = state->client_id;
        }
        if (state->active) {
            end_ptt_locked(connection_id, *state);
            ctx_.announce_channel_state(ChannelMode::Idle);
            Log::info("Web PTT ended by disconnect ({} frames)", state->frame_count);
        }
        state->lease.reset();
    }

    if (client_id) {
        ctx_.publisher.publish_state("web_client", web_client_status(*client_id, "offline"));
        Log::info("Web client offline: {}", *client_id);
    }
    Log::info("Web PTT client disconnected ({} remaining)", ctx_.sessions.count());
}

void WebPttHandler::check_watchdog(std::chrono::steady_clock::time_point now) {
    bool went_idle = ctx_.arbiter.check_web_ptt_watchdog(now);

    std::vector<std::pair<std::string, std::shared_ptr<PttState>>> states;
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        states.assign(states_.begin(), states_.end());
    }

    for (const auto& [connection_id, state]: states) {
        // A held lock means the connection thread is mid-frame and will finish on its own
        std::unique_lock<std::mutex> lock(state->mutex, std::try_to_lock);
        if (!lock.owns_lock() || !state->active ||
            now - state->last_frame_time <= ctx_.config.web_ptt_idle_timeout) {
            continue;
        }
        went_idle = end_ptt_locked(connection_id, *state) || went_idle;
        Log::warn("Web PTT session {} force-reset after {} frames", connection_id,
                  state->frame_count);
    }

    if (went_idle) {
        ctx_.announce_channel_state(ChannelMode::Idle);
    }
}

bool WebPttHandler::is_transmitting(const std::string& connection_id) const {
    auto state = state_for(connection_id);
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->active;
}

std::shared_ptr<WebPttHandler::PttState> WebPttHandler::state_for(
    const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto                        it = states_.find(connection_id);
    return it != states_.end() ? it->second : nullptr;
}

void WebPttHandler::handle_ptt_start(const std::string&    connection_id,
                                     const nlohmann::json& message) {
    auto state = state_for(connection_id);
    if (!state) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->active) {
        Log::debug("ptt_start from {} while already transmitting, ignored", connection_id);
        return;
    }

    Priority priority =
        parse_priority(string_field(message, "priority", "Normal")).value_or(Priority::Normal);
    std::string raw_target = string_field(message, "target", "all");

    // Queues behind a hub stream or another browser instead of colliding with it
    auto lease = ctx_.arbiter.acquire_transmit_for(ctx_.config.ptt_queue_timeout);
    if (!lease) {
        Log::warn("Web PTT from {} gave up waiting for the transmit lock", connection_id);
        ctx_.router.send_json(connection_id, AudioRouter::busy_message());
        return;
    }

    // A receive at our priority or above is waited out, then talked over
    if (ctx_.arbiter.wait_for_channel(priority) == ChannelWait::TimedOut) {
        Log::info("Web PTT from {} talking over {} audio", connection_id,
                  priority_name(ctx_.arbiter.snapshot().rx_priority));
    }

    auto encoder = ctx_.encoder_factory();
    if (!encoder) {
        Log::error("Web PTT from {} rejected: no encoder", connection_id);
        ctx_.router.send_json(connection_id, AudioRouter::busy_message());
        return;
    }
    encoder->reset();

    std::optional<std::string> room;
    if (!message_validator::is_broadcast_target(raw_target)) {
        room = message_validator::sanitize_room_name(raw_target);
    }

    auto now = std::chrono::steady_clock::now();
    ctx_.arbiter.begin_web_ptt(now);

    state->active          = true;
    state->lead_in_sent    = false;
    state->frame_count     = 0;
    state->priority        = priority;
    state->target_room     = room;
    state->target_ip       = room ? ctx_.resolve_target_ip(*room) : std::nullopt;
    state->last_frame_time = now;
    state->encoder         = std::move(encoder);
    state->lease           = std::move(lease);

    ctx_.sessions.with_session(connection_id, [&](Session& s) {
        s.transmitting = true;
        s.priority     = priority;
        s.target_room  = room;
    });

    // Browsers are told individually below
    ctx_.publisher.publish_state("current_state", "transmitting");
    Log::info("Web PTT started by {} -> {} ({})", connection_id, room.value_or(ALL_ROOMS),
              priority_name(priority));

    ctx_.router.send_json(connection_id, AudioRouter::state_message("transmitting"));
    ctx_.router.broadcast_json(AudioRouter::state_message("receiving"), connection_id);
}

void WebPttHandler::handle_ptt_stop(const std::string& connection_id) {
    auto state = state_for(connection_id);
    if (!state) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->active) {
        return;
    }

    if (state->encoder && state->lead_in_sent) {
        send_silence(*state, audio_constants::TRAIL_OUT_FRAMES);
    }

    state->active = false;
    state->encoder.reset();
    ctx_.sessions.with_session(connection_id, [](Session& s) { s.transmitting = false; });

    ctx_.arbiter.end_web_ptt();
    ctx_.publisher.publish_state("current_state", "idle");
    Log::info("Web PTT stopped ({} frames)", state->frame_count);

    // Browsers hear about it before the drain gap
    ctx_.router.broadcast_json(AudioRouter::state_message("idle"));

    std::this_thread::sleep_for(ctx_.config.ptt_drain_gap);
    state->lease.reset();
}

void WebPttHandler::handle_identify(const std::string&    connection_id,
                                    const nlohmann::json& message) {
    auto client_id = message_validator::sanitize_client_id(string_field(message, "client_id"));
    if (!client_id) {
        Log::warn("Invalid client_id from {}", connection_id);
        return;
    }

    auto previous = ctx_.sessions.identify(connection_id, *client_id);
    if (auto state = state_for(connection_id)) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!previous) {
            previous = state->client_id;
        }
        state->client_id = *client_id;
    }
    if (previous && *previous != *client_id) {
        ctx_.publisher.publish_state("web_client", web_client_status(*previous, "offline"));
    }
    ctx_.publisher.publish_state("web_client", web_client_status(*client_id, "online"));
    Log::info("Web client identified as: {}", *client_id);

    send_targets(connection_id);
}

void WebPttHandler::handle_call(const std::string& connection_id, const nlohmann::json& message) {
    std::string raw_target = string_field(message, "target");
    if (raw_target.empty()) {
        return;
    }
    std::string caller = ctx_.sessions.client_id(connection_id).value_or("Web PTT");
    if (place_call_) {
        place_call_(raw_target, caller);
    }
}

void WebPttHandler::handle_get_state(const std::string& connection_id) {
    ctx_.router.send_json(connection_id,
                          AudioRouter::state_message(channel_mode_name(ctx_.arbiter.mode())));
    send_targets(connection_id);
}

void WebPttHandler::handle_set_chime(const nlohmann::json& message) {
    std::string name =
        message_validator::sanitize_string(string_field(message, "chime"),
                                           message_validator::MAX_CHIME_NAME_LENGTH);
    if (!ctx_.chimes.select(name)) {
        Log::warn("Chime '{}' not found", name);
        return;
    }
    ctx_.publisher.publish_state("chime", name);
    Log::info("Chime set via web: {}", name);
}

bool WebPttHandler::end_ptt_locked(const std::string& connection_id, PttState& state) {
    state.active = false;
    state.encoder.reset();
    state.lease.reset();
    ctx_.sessions.with_session(connection_id, [](Session& s) { s.transmitting = false; });
    return ctx_.arbiter.end_web_ptt();
}

void WebPttHandler::send_silence(PttState& state, size_t frames) {
    const PcmFrame       silence(audio_constants::FRAME_SIZE, 0);
    std::vector<uint8_t> opus;
    pacer_.run(frames, [&](size_t) {
        // Encoded fresh each time so the codec state runs on naturally
        if (state.encoder->encode(silence, opus)) {
            transmitter_.send_audio(opus, state.priority, state.target_ip);
        }
        return true;
    });
}

void WebPttHandler::send_targets(const std::string& connection_id) {
    std::string self = ctx_.sessions.client_id(connection_id).value_or("");
    ctx_.router.send_json(connection_id, AudioRouter::targets_message(ctx_.devices.rooms(self)));
}
