#include "channel_arbiter.h"

#include <thread>

#include "logger.h"

const char* channel_mode_name(ChannelMode mode) {
    switch (mode) {
        case ChannelMode::Receiving:
            return "receiving";
        case ChannelMode::Transmitting:
            return "transmitting";
        case ChannelMode::Idle:
        default:
            return "idle";
    }
}

ChannelArbiter::ChannelArbiter(const Timeouts& timeouts) : timeouts_(timeouts) {}

std::optional<TransmitLease> ChannelArbiter::try_acquire_transmit() {
    if (!transmit_gate_.try_acquire()) {
        return std::nullopt;
    }
    return TransmitLease(&transmit_gate_);
}

std::optional<TransmitLease> ChannelArbiter::acquire_transmit_for(clock::duration timeout) {
    if (!transmit_gate_.try_acquire_for(timeout)) {
        return std::nullopt;
    }
    return TransmitLease(&transmit_gate_);
}

bool ChannelArbiter::is_channel_busy(Priority ours, clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (web_ptt_active_ || mode_ == ChannelMode::Transmitting) {
        return true;
    }

    if (mode_ == ChannelMode::Receiving) {
        // The RX path may not have timed out yet even though the sender is gone
        if (now - last_rx_ > timeouts_.rx_timeout) {
            return false;
        }
        // Equal priority does not preempt
        return ours <= rx_priority_;
    }

    return false;
}

ChannelWait ChannelArbiter::wait_for_channel(Priority ours) const {
    return wait_for_channel(ours, timeouts_.channel_wait);
}

ChannelWait ChannelArbiter::wait_for_channel(Priority ours, clock::duration timeout) const {
    if (!is_channel_busy(ours)) {
        return ChannelWait::Free;
    }

    Log::debug("Channel busy, waiting up to {}ms",
               std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
    const auto start = clock::now();

    while (clock::now() - start < timeout) {
        std::this_thread::sleep_for(timeouts_.poll_interval);
        if (!is_channel_busy(ours)) {
            Log::debug("Channel free after {}ms",
                       std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start)
                           .count());
            return ChannelWait::Free;
        }
    }

    Log::warn("Channel busy timeout ({}ms), sending anyway",
              std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
    return ChannelWait::TimedOut;
}

RxDecision ChannelArbiter::on_packet(Priority priority, const std::string& sender_hex,
                                     clock::time_point now) {
    RxDecision decision;

    // Do Not Disturb lets only Emergency traffic through
    if (dnd_.load() && priority < Priority::Emergency) {
        return decision;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rx_priority_    = priority;
    current_sender_ = sender_hex;
    last_rx_        = now;
    if (mode_ == ChannelMode::Idle) {
        mode_                  = ChannelMode::Receiving;
        decision.state_changed = true;
    }
    decision.forward = true;
    return decision;
}

bool ChannelArbiter::check_rx_timeout(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ != ChannelMode::Receiving || now - last_rx_ <= timeouts_.rx_timeout) {
        return false;
    }
    return set_idle_locked();
}

bool ChannelArbiter::begin_transmit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == ChannelMode::Transmitting) {
        return false;
    }
    mode_ = ChannelMode::Transmitting;
    return true;
}

bool ChannelArbiter::end_transmit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ != ChannelMode::Transmitting) {
        return false;
    }
    return set_idle_locked();
}

bool ChannelArbiter::begin_web_ptt(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    web_ptt_active_ = true;
    // Counts from the press so the watchdog cannot fire before the first frame arrives
    last_web_frame_ = now;
    if (mode_ == ChannelMode::Transmitting) {
        return false;
    }
    mode_ = ChannelMode::Transmitting;
    return true;
}

void ChannelArbiter::note_web_frame(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_web_frame_ = now;
}

bool ChannelArbiter::end_web_ptt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!web_ptt_active_) {
        return false;
    }
    web_ptt_active_ = false;
    return set_idle_locked();
}

bool ChannelArbiter::check_web_ptt_watchdog(clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!web_ptt_active_ || now - last_web_frame_ <= timeouts_.web_ptt_idle) {
            return false;
        }
        web_ptt_active_ = false;
        set_idle_locked();
    }
    Log::warn("Web PTT idle for >{}ms with no audio frames, reset to idle",
              std::chrono::duration_cast<std::chrono::milliseconds>(timeouts_.web_ptt_idle).count());
    return true;
}

ChannelSnapshot ChannelArbiter::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ChannelSnapshot{mode_, rx_priority_, current_sender_, web_ptt_active_};
}

ChannelMode ChannelArbiter::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

bool ChannelArbiter::set_idle_locked() {
    bool changed = mode_ != ChannelMode::Idle;
    mode_        = ChannelMode::Idle;
    rx_priority_ = Priority::Normal;
    current_sender_.clear();
    return changed;
}
