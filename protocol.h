#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Wire layout shared with the edge nodes:
//   bytes 0-7   device_id
//   bytes 8-11  sequence (big-endian)
//   byte  12    priority (absent in legacy 12-byte headers)
//   bytes 13+   Opus frame
constexpr size_t DEVICE_ID_LENGTH     = 8;
constexpr size_t SEQUENCE_LENGTH      = 4;
constexpr size_t PRIORITY_LENGTH      = 1;
constexpr size_t LEGACY_HEADER_LENGTH = DEVICE_ID_LENGTH + SEQUENCE_LENGTH;      // 12
constexpr size_t HEADER_LENGTH        = LEGACY_HEADER_LENGTH + PRIORITY_LENGTH;  // 13
constexpr size_t MAX_PACKET_SIZE      = 1024;

constexpr const char* DEFAULT_MULTICAST_GROUP = "239.255.0.100";
constexpr uint16_t    DEFAULT_AUDIO_PORT      = 5005;

using DeviceId = std::array<uint8_t, DEVICE_ID_LENGTH>;
using Bytes    = std::vector<uint8_t>;

enum class Priority : uint8_t {
    Normal    = 0,
    High      = 1,
    Emergency = 2,
};

// Values above Emergency are unknown to this hub and treated as Normal
inline Priority priority_from_wire(uint8_t value) {
    return value > static_cast<uint8_t>(Priority::Emergency) ? Priority::Normal
                                                              : static_cast<Priority>(value);
}

inline const char* priority_name(Priority priority) {
    switch (priority) {
        case Priority::High:
            return "High";
        case Priority::Emergency:
            return "Emergency";
        case Priority::Normal:
        default:
            return "Normal";
    }
}

// "Normal" / "High" / "Emergency"; anything else is nullopt
inline std::optional<Priority> parse_priority(std::string_view name) {
    if (name == "Normal") {
        return Priority::Normal;
    }
    if (name == "High") {
        return Priority::High;
    }
    if (name == "Emergency") {
        return Priority::Emergency;
    }
    return std::nullopt;
}

struct AudioPacket {
    DeviceId device_id{};
    uint32_t sequence = 0;
    Priority priority = Priority::Normal;
    Bytes    payload;

    bool operator==(const AudioPacket&) const = default;
};

inline std::string to_hex(const DeviceId& id) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string           out;
    out.reserve(id.size() * 2);
    for (uint8_t byte: id) {
        out.push_back(DIGITS[byte >> 4]);
        out.push_back(DIGITS[byte & 0x0F]);
    }
    return out;
}

// Parses exactly 16 hex digits
inline std::optional<DeviceId> device_id_from_hex(std::string_view hex) {
    if (hex.size() != DEVICE_ID_LENGTH * 2) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    DeviceId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[(i * 2) + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        id[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return id;
}
