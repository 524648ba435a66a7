#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocol.h"
#include "session_registry.h"
#include "voice_codec.h"

// Delivery of decoded audio and JSON notifications to browser sessions.
// A peer whose write fails is dropped from the registry.
class AudioRouter {
public:
    explicit AudioRouter(SessionRegistry& sessions) : sessions_(sessions) {}

    // Inbound UDP audio. Broadcast targets reach every session; a room target reaches only the
    // session identified as that room, and nobody when it is not connected.
    size_t forward_inbound(const PcmFrame& pcm, Priority priority,
                           const std::optional<std::string>& sender_target);

    // Browser PTT audio relayed to the other sessions, or only to target_room when set
    size_t relay_ptt(const std::string& from_connection, std::span<const uint8_t> pcm_bytes,
                     Priority priority, const std::optional<std::string>& target_room);

    // Hub announce audio, every session
    size_t fan_out(const PcmFrame& pcm, Priority priority);

    bool   send_json(const std::string& connection_id, const nlohmann::json& message);
    size_t broadcast_json(const nlohmann::json& message,
                          const std::optional<std::string>& exclude_connection = std::nullopt);
    size_t send_json_to_client(const std::string& client_id, const nlohmann::json& message);

    // {"type":"state","status":...}
    static nlohmann::json state_message(const std::string& status);
    // {"type":"targets","rooms":[...]}
    static nlohmann::json targets_message(const std::vector<std::string>& rooms);
    // {"type":"busy"}
    static nlohmann::json busy_message();

    // [priority byte][PCM little-endian samples]
    static std::vector<uint8_t> frame_with_priority(Priority priority,
                                                    std::span<const uint8_t> pcm_bytes);
    static std::vector<uint8_t> frame_with_priority(Priority priority, const PcmFrame& pcm);

private:
    size_t deliver_binary(const std::vector<PeerTarget>& targets, std::span<const uint8_t> frame);
    size_t deliver_text(const std::vector<PeerTarget>& targets, const std::string& text);
    void   drop(const std::string& connection_id);

    SessionRegistry& sessions_;
};
