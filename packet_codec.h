#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>

#include "protocol.h"

// Audio packet framing. Pure functions, no state.
namespace packet_codec {

enum class DecodeError {
    TooShort,
};

using DecodeResult = std::variant<AudioPacket, DecodeError>;

inline Bytes encode(const DeviceId& device_id, uint32_t sequence, Priority priority,
                    std::span<const uint8_t> payload) {
    Bytes packet;
    packet.reserve(HEADER_LENGTH + payload.size());
    packet.insert(packet.end(), device_id.begin(), device_id.end());
    packet.push_back(static_cast<uint8_t>(sequence >> 24));
    packet.push_back(static_cast<uint8_t>(sequence >> 16));
    packet.push_back(static_cast<uint8_t>(sequence >> 8));
    packet.push_back(static_cast<uint8_t>(sequence));
    packet.push_back(static_cast<uint8_t>(priority));
    packet.insert(packet.end(), payload.begin(), payload.end());
    return packet;
}

inline Bytes encode(const AudioPacket& packet) {
    return encode(packet.device_id, packet.sequence, packet.priority, packet.payload);
}

inline DecodeResult decode(std::span<const uint8_t> data) {
    if (data.size() < LEGACY_HEADER_LENGTH) {
        return DecodeError::TooShort;
    }

    AudioPacket packet;
    std::copy_n(data.begin(), DEVICE_ID_LENGTH, packet.device_id.begin());
    packet.sequence = (static_cast<uint32_t>(data[8]) << 24) |
                      (static_cast<uint32_t>(data[9]) << 16) |
                      (static_cast<uint32_t>(data[10]) << 8) | static_cast<uint32_t>(data[11]);

    if (data.size() >= HEADER_LENGTH) {
        packet.priority = priority_from_wire(data[LEGACY_HEADER_LENGTH]);
        packet.payload.assign(data.begin() + HEADER_LENGTH, data.end());
    } else {
        // Legacy 12-byte header: no priority byte, nothing follows it
        packet.priority = Priority::Normal;
        packet.payload.assign(data.begin() + LEGACY_HEADER_LENGTH, data.end());
    }
    return packet;
}

inline const AudioPacket* as_packet(const DecodeResult& result) {
    return std::get_if<AudioPacket>(&result);
}

}  // namespace packet_codec
