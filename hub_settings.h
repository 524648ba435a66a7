#pragma once

#include <algorithm>
#include <mutex>
#include <string>

#include "device_directory.h"

// Operator-facing settings that are not part of the channel state machine
class HubSettings {
public:
    static constexpr int MAX_VOLUME = 100;

    int volume() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return volume_;
    }

    // Clamped to 0..100; returns the stored value
    int set_volume(int volume) {
        std::lock_guard<std::mutex> lock(mutex_);
        volume_ = std::clamp(volume, 0, MAX_VOLUME);
        return volume_;
    }

    bool muted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return muted_;
    }

    void set_muted(bool muted) {
        std::lock_guard<std::mutex> lock(mutex_);
        muted_ = muted;
    }

    std::string target() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

    void set_target(const std::string& target) {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = target;
    }

private:
    mutable std::mutex mutex_;
    int                volume_ = 80;
    bool               muted_  = false;
    std::string        target_ = ALL_ROOMS;
};
