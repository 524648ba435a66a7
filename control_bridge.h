#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "control_plane.h"
#include "hub_context.h"
#include "outbound_streamer.h"

// Translates control-plane commands and events into settings, arbiter and streamer calls,
// and publishes every resulting change
class ControlBridge : public ControlPlaneHandler {
public:
    ControlBridge(HubContext& ctx, OutboundStreamer& streamer);

    bool handle_command(const std::string& field, const std::string& value) override;
    void on_call(const std::string& target, const std::string& caller) override;
    void on_device_discovered(const std::string& id, const std::string& room,
                              const std::string& ip) override;
    void on_device_offline(const std::string& id) override;
    void on_device_state(const std::string& device, const std::string& state,
                         const std::string& target) override;
    bool on_announce(std::vector<int16_t> pcm) override;

    // Call started inside the hub (a browser). Published outward, then the chime is streamed.
    bool place_call(const std::string& raw_target, const std::string& caller);

    // Publishes every retained field once, for a freshly connected control plane
    void publish_all();

    // Settings and channel state in one object, for the HTTP API
    nlohmann::json state_json() const;

private:
    bool set_volume(const std::string& value);
    bool set_target(const std::string& value);
    bool set_chime(const std::string& value);

    // Re-publishes the target list and falls back to "All Rooms" when the target vanished
    void refresh_targets();

    void publish_volume();
    void publish_mute();
    void publish_target();
    void publish_priority();
    void publish_dnd();
    void publish_chime();

    HubContext&       ctx_;
    OutboundStreamer& streamer_;
};
