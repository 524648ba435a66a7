#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.h"

// Outbound side of the control plane: every state change the hub produces.
// Fields: current_state, volume, mute, target, priority, dnd, chime, targets, chimes,
// web_client, call.
class StatePublisher {
public:
    virtual ~StatePublisher() = default;

    virtual void publish_state(const std::string& field, const nlohmann::json& value) = 0;
};

// Inbound side: commands and events the external bridge delivers to the hub
class ControlPlaneHandler {
public:
    virtual ~ControlPlaneHandler() = default;

    // volume / mute / dnd / priority / target / chime. False when the field or value is rejected.
    virtual bool handle_command(const std::string& field, const std::string& value) = 0;

    virtual void on_call(const std::string& target, const std::string& caller) = 0;

    virtual void on_device_discovered(const std::string& id, const std::string& room,
                                      const std::string& ip) = 0;
    virtual void on_device_offline(const std::string& id) = 0;

    // Device state report: "transmitting" with its target, or "idle"
    virtual void on_device_state(const std::string& device, const std::string& state,
                                 const std::string& target) = 0;

    // 16 kHz mono PCM from the synthesis service. False when the channel is already taken.
    virtual bool on_announce(std::vector<int16_t> pcm) = 0;
};

// Keeps the last value of each field, like a retained topic, and logs every change
class RetainedStatePublisher : public StatePublisher {
public:
    void publish_state(const std::string& field, const nlohmann::json& value) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retained_[field] = value;
            ++publish_count_;
        }
        Log::debug("State {} = {}", field, value.dump());
    }

    nlohmann::json retained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json              out = nlohmann::json::object();
        for (const auto& [field, value]: retained_) {
            out[field] = value;
        }
        return out;
    }

    nlohmann::json value(const std::string& field) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = retained_.find(field);
        return it != retained_.end() ? it->second : nlohmann::json();
    }

    uint64_t publish_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return publish_count_;
    }

private:
    mutable std::mutex                    mutex_;
    std::map<std::string, nlohmann::json> retained_;
    uint64_t                              publish_count_ = 0;
};
