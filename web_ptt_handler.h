#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "audio_transmitter.h"
#include "channel_arbiter.h"
#include "frame_pacer.h"
#include "hub_context.h"
#include "session_info.h"
#include "voice_codec.h"

// Browser push-to-talk sessions. The WebSocket server feeds every connection event through here;
// each connection's calls arrive on that connection's own thread, the watchdog on housekeeping.
class WebPttHandler {
public:
    // Places a call on behalf of a browser (raw target, caller name)
    using CallFn = std::function<void(const std::string& target, const std::string& caller)>;

    WebPttHandler(HubContext& ctx, AudioTransmitter& transmitter, CallFn place_call);

    void on_open(const std::string& connection_id, std::shared_ptr<PeerConnection> peer);
    void on_text(const std::string& connection_id, const std::string& text);
    void on_binary(const std::string& connection_id, std::span<const uint8_t> data);
    void on_close(const std::string& connection_id);

    // Ends sessions that stopped sending audio without a ptt_stop, including sessions the
    // router already dropped after a failed write
    void check_watchdog(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    bool is_transmitting(const std::string& connection_id) const;

private:
    // Owned by the handler, not the registry: a session the router dropped after a failed
    // write keeps its state until on_close or the watchdog ends it.
    struct PttState {
        using time_point = std::chrono::steady_clock::time_point;

        std::mutex                    mutex;
        bool                          active       = false;
        bool                          lead_in_sent = false;
        uint64_t                      frame_count  = 0;
        Priority                      priority     = Priority::Normal;
        std::optional<std::string>    target_ip;    // none = multicast
        std::optional<std::string>    target_room;  // none = every other browser
        std::optional<std::string>    client_id;
        time_point                    last_frame_time;
        std::unique_ptr<FrameEncoder> encoder;
        std::optional<TransmitLease>  lease;
    };

    std::shared_ptr<PttState> state_for(const std::string& connection_id) const;

    void handle_ptt_start(const std::string& connection_id, const nlohmann::json& message);
    void handle_ptt_stop(const std::string& connection_id);
    void handle_identify(const std::string& connection_id, const nlohmann::json& message);
    void handle_call(const std::string& connection_id, const nlohmann::json& message);
    void handle_get_state(const std::string& connection_id);
    void handle_set_chime(const nlohmann::json& message);

    void send_silence(PttState& state, size_t frames);
    // Caller holds state.mutex. True when the channel went back to Idle.
    bool end_ptt_locked(const std::string& connection_id, PttState& state);
    void send_targets(const std::string& connection_id);

    HubContext&       ctx_;
    AudioTransmitter& transmitter_;
    CallFn            place_call_;
    FramePacer        pacer_;

    mutable std::mutex                                         states_mutex_;
    std::unordered_map<std::string, std::shared_ptr<PttState>> states_;
};
