#pragma once

#include <algorithm>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "logger.h"
#include "message_validator.h"

constexpr const char* ALL_ROOMS = "All Rooms";

struct DeviceBinding {
    std::string id;
    std::string room;
    std::string ip;
};

enum class DeviceUpdate {
    Rejected,
    Added,
    Updated,
};

// Edge devices announced by discovery, plus the outbound target each one is currently
// talking to. Fed by the control plane, read by routing.
class DeviceDirectory {
public:
    // Sanitises and validates the announcement before storing it
    DeviceUpdate upsert(const std::string& raw_id, const std::string& raw_room,
                        const std::string& ip) {
        std::string id =
            message_validator::sanitize_string(raw_id, message_validator::MAX_CLIENT_ID_LENGTH);
        auto room = message_validator::sanitize_room_name(raw_room);
        if (id.empty() || !room || !message_validator::is_valid_ipv4(ip)) {
            Log::warn("Invalid device info rejected: id='{}'", id.substr(0, 20));
            return DeviceUpdate::Rejected;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        bool added   = !devices_.contains(id);
        devices_[id] = DeviceBinding{id, *room, ip};
        if (added) {
            Log::info("Discovered device: {} ({}) at {}", *room, id, ip);
            return DeviceUpdate::Added;
        }
        return DeviceUpdate::Updated;
    }

    std::optional<DeviceBinding> remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = devices_.find(id);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        DeviceBinding binding = std::move(it->second);
        devices_.erase(it);
        sender_targets_.erase(id);
        Log::info("Device offline, removed: {} ({})", binding.room, id);
        return binding;
    }

    std::optional<DeviceBinding> find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = devices_.find(id);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // First device bound to the room
    std::optional<std::string> ip_for_room(const std::string& room) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, binding]: devices_) {
            if (binding.room == room) {
                return binding.ip;
            }
        }
        return std::nullopt;
    }

    // Sorted unique room names, optionally leaving one out (a client never targets itself)
    std::vector<std::string> rooms(const std::string& exclude = {}) const {
        std::set<std::string> unique;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, binding]: devices_) {
                if (exclude.empty() || binding.room != exclude) {
                    unique.insert(binding.room);
                }
            }
        }
        return {unique.begin(), unique.end()};
    }

    // "All Rooms" followed by every known room
    std::vector<std::string> target_options() const {
        std::vector<std::string> options{ALL_ROOMS};
        auto                     known = rooms();
        options.insert(options.end(), known.begin(), known.end());
        return options;
    }

    bool has_target(const std::string& target) const {
        auto options = target_options();
        return std::find(options.begin(), options.end(), target) != options.end();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.size();
    }

    // Device state reports: "transmitting" with a target records it, "idle" clears it
    void on_device_state(const std::string& device, const std::string& state,
                         const std::string& target) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state == "transmitting" && !target.empty()) {
            sender_targets_[device] = target;
            Log::info("Device {} targeting: {}", device, target);
        } else if (state == "idle") {
            if (sender_targets_.erase(device) > 0) {
                Log::debug("Device {} target cleared", device);
            }
        }
    }

    std::optional<std::string> sender_target(const std::string& device) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sender_targets_.find(device);
        if (it == sender_targets_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Control-plane name of the node behind a wire sender id: "intercom_" + last 8 hex digits
    static std::string device_name_for_sender(const std::string& sender_hex) {
        constexpr size_t SUFFIX = 8;
        return "intercom_" +
               (sender_hex.size() > SUFFIX ? sender_hex.substr(sender_hex.size() - SUFFIX)
                                           : sender_hex);
    }

private:
    mutable std::mutex                             mutex_;
    std::unordered_map<std::string, DeviceBinding> devices_;
    std::unordered_map<std::string, std::string>   sender_targets_;
};
