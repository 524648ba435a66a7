#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "protocol.h"

// Write side of one browser connection. Both calls return false once the peer is gone.
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    virtual bool        send_text(const std::string& text)         = 0;
    virtual bool        send_binary(std::span<const uint8_t> data) = 0;
    virtual std::string remote_address() const                     = 0;
};

// Per-connection state for a browser PTT client
struct Session {
    std::string                     connection_id;
    std::optional<std::string>      client_id;    // set by identify
    std::shared_ptr<PeerConnection> peer;
    std::optional<std::string>      target_room;  // absent = all rooms
    Priority                        priority     = Priority::Normal;
    bool                            transmitting = false;
};

// Lightweight view for the HTTP API and logs
struct SessionInfo {
    std::string                connection_id;
    std::optional<std::string> client_id;
    std::string                remote_address;
    bool                       transmitting = false;
};
