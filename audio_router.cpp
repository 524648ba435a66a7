#include "audio_router.h"

#include <cstring>

#include "logger.h"
#include "message_validator.h"

size_t AudioRouter::forward_inbound(const PcmFrame& pcm, Priority priority,
                                    const std::optional<std::string>& sender_target) {
    std::vector<PeerTarget> targets;
    if (!sender_target || message_validator::is_broadcast_target(*sender_target)) {
        targets = sessions_.all();
    } else {
        // No multicast fallback: an absent room session simply gets nothing
        targets = sessions_.with_client_id(*sender_target);
    }
    if (targets.empty()) {
        return 0;
    }
    auto frame = frame_with_priority(priority, pcm);
    return deliver_binary(targets, frame);
}

size_t AudioRouter::relay_ptt(const std::string& from_connection, std::span<const uint8_t> pcm_bytes,
                              Priority priority, const std::optional<std::string>& target_room) {
    std::vector<PeerTarget> targets;
    if (!target_room) {
        targets = sessions_.all_except(from_connection);
    } else {
        targets = sessions_.select([&](const Session& s) {
            return s.connection_id != from_connection && s.client_id == *target_room;
        });
    }
    if (targets.empty()) {
        return 0;
    }
    auto frame = frame_with_priority(priority, pcm_bytes);
    return deliver_binary(targets, frame);
}

size_t AudioRouter::fan_out(const PcmFrame& pcm, Priority priority) {
    auto targets = sessions_.all();
    if (targets.empty()) {
        return 0;
    }
    auto frame = frame_with_priority(priority, pcm);
    return deliver_binary(targets, frame);
}

bool AudioRouter::send_json(const std::string& connection_id, const nlohmann::json& message) {
    auto peer = sessions_.peer(connection_id);
    if (!peer) {
        return false;
    }
    return deliver_text({PeerTarget{connection_id, peer}}, message.dump()) == 1;
}

size_t AudioRouter::broadcast_json(const nlohmann::json&             message,
                                   const std::optional<std::string>& exclude_connection) {
    auto targets = exclude_connection ? sessions_.all_except(*exclude_connection) : sessions_.all();
    if (targets.empty()) {
        return 0;
    }
    return deliver_text(targets, message.dump());
}

size_t AudioRouter::send_json_to_client(const std::string& client_id, const nlohmann::json& message) {
    auto targets = sessions_.with_client_id(client_id);
    if (targets.empty()) {
        return 0;
    }
    return deliver_text(targets, message.dump());
}

nlohmann::json AudioRouter::state_message(const std::string& status) {
    return {{"type", "state"}, {"status", status}};
}

nlohmann::json AudioRouter::targets_message(const std::vector<std::string>& rooms) {
    return {{"type", "targets"}, {"rooms", rooms}};
}

nlohmann::json AudioRouter::busy_message() {
    return {{"type", "busy"}};
}

std::vector<uint8_t> AudioRouter::frame_with_priority(Priority                 priority,
                                                      std::span<const uint8_t> pcm_bytes) {
    std::vector<uint8_t> frame;
    frame.reserve(1 + pcm_bytes.size());
    frame.push_back(static_cast<uint8_t>(priority));
    frame.insert(frame.end(), pcm_bytes.begin(), pcm_bytes.end());
    return frame;
}

std::vector<uint8_t> AudioRouter::frame_with_priority(Priority priority, const PcmFrame& pcm) {
    std::vector<uint8_t> frame(1 + (pcm.size() * sizeof(int16_t)));
    frame[0] = static_cast<uint8_t>(priority);
    std::memcpy(frame.data() + 1, pcm.data(), pcm.size() * sizeof(int16_t));
    return frame;
}

size_t AudioRouter::deliver_binary(const std::vector<PeerTarget>& targets,
                                   std::span<const uint8_t>       frame) {
    size_t delivered = 0;
    for (const auto& target: targets) {
        if (target.peer && target.peer->send_binary(frame)) {
            ++delivered;
        } else {
            drop(target.connection_id);
        }
    }
    return delivered;
}

size_t AudioRouter::deliver_text(const std::vector<PeerTarget>& targets, const std::string& text) {
    size_t delivered = 0;
    for (const auto& target: targets) {
        if (target.peer && target.peer->send_text(text)) {
            ++delivered;
        } else {
            drop(target.connection_id);
        }
    }
    return delivered;
}

void AudioRouter::drop(const std::string& connection_id) {
    if (sessions_.remove(connection_id)) {
        Log::info("Dropped unreachable web client {}", connection_id);
    }
}
