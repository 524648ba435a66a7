#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "audio_constants.h"
#include "protocol.h"

// Validation and sanitisation of everything that arrives from the network or the control plane
namespace message_validator {

constexpr size_t MAX_CLIENT_ID_LENGTH  = 64;
constexpr size_t MAX_ROOM_NAME_LENGTH  = 32;
constexpr size_t MAX_CHIME_NAME_LENGTH = 64;
constexpr size_t MAX_MESSAGE_LENGTH    = 1024;

// Browser PTT frames are exactly one 20ms frame of 16-bit mono PCM
inline bool is_pcm_frame(size_t bytes) {
    return bytes == audio_constants::FRAME_BYTES;
}

inline bool is_control_message_size_ok(size_t bytes) {
    return bytes <= MAX_MESSAGE_LENGTH;
}

// Drops control characters, truncates, trims surrounding whitespace
inline std::string sanitize_string(std::string_view value, size_t max_length) {
    std::string out;
    out.reserve(std::min(value.size(), max_length));
    for (char c: value) {
        auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x20 && uc != 0x7F) {
            out.push_back(c);
        } else if (c == '\t') {
            out.push_back(c);
        }
        if (out.size() >= max_length) {
            break;
        }
    }
    size_t first = out.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    size_t last = out.find_last_not_of(" \t");
    return out.substr(first, last - first + 1);
}

// Word characters, whitespace, dash and dot. Bytes >= 0x80 are accepted so UTF-8 names pass.
inline bool is_safe_name(std::string_view value) {
    if (value.empty()) {
        return false;
    }
    for (char c: value) {
        auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || std::isalnum(uc) || c == '_' || c == '-' || c == '.' || c == ' ' ||
            c == '\t') {
            continue;
        }
        return false;
    }
    return true;
}

inline std::optional<std::string> sanitize_client_id(std::string_view raw) {
    std::string client_id = sanitize_string(raw, MAX_CLIENT_ID_LENGTH);
    if (!is_safe_name(client_id)) {
        return std::nullopt;
    }
    return client_id;
}

inline std::optional<std::string> sanitize_room_name(std::string_view raw) {
    std::string room = sanitize_string(raw, MAX_ROOM_NAME_LENGTH);
    if (!is_safe_name(room)) {
        return std::nullopt;
    }
    return room;
}

// Chime names become file names: alphanumerics, dash and underscore only
inline bool is_valid_chime_name(std::string_view name) {
    if (name.empty() || name.size() > MAX_CHIME_NAME_LENGTH) {
        return false;
    }
    for (char c: name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

// Dotted-quad IPv4 only
inline bool is_valid_ipv4(std::string_view ip) {
    int    parts = 0;
    size_t pos   = 0;
    while (pos <= ip.size()) {
        size_t end = ip.find('.', pos);
        if (end == std::string_view::npos) {
            end = ip.size();
        }
        std::string_view part = ip.substr(pos, end - pos);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        int value = 0;
        for (char c: part) {
            if (c < '0' || c > '9') {
                return false;
            }
            value = (value * 10) + (c - '0');
        }
        if (value > 255) {
            return false;
        }
        ++parts;
        pos = end + 1;
    }
    return parts == 4;
}

// Up to 16 lowercase hex digits (a full or partial device id)
inline bool is_sender_hex(std::string_view value) {
    if (value.empty() || value.size() > DEVICE_ID_LENGTH * 2) {
        return false;
    }
    for (char c: value) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// "all" / "All Rooms" / empty all mean every room
inline bool is_broadcast_target(std::string_view target) {
    if (target.empty()) {
        return true;
    }
    std::string lowered;
    lowered.reserve(target.size());
    for (char c: target) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered == "all" || lowered == "all rooms" || lowered == "unknown";
}

}  // namespace message_validator
