#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "protocol.h"

// Sends one Opus frame as a hub packet. No unicast address means the multicast group.
// Failures are counted and reported, never thrown.
class AudioTransmitter {
public:
    virtual ~AudioTransmitter() = default;

    virtual bool send_audio(std::span<const uint8_t> opus, Priority priority,
                            const std::optional<std::string>& unicast_ip) = 0;
};
