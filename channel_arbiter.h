#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>

#include "protocol.h"

enum class ChannelMode {
    Idle,
    Receiving,
    Transmitting,
};

// "idle" / "receiving" / "transmitting", as published and sent to web clients
const char* channel_mode_name(ChannelMode mode);

struct ChannelSnapshot {
    ChannelMode mode           = ChannelMode::Idle;
    Priority    rx_priority    = Priority::Normal;
    std::string current_sender;  // hex id of the last accepted sender, empty when idle
    bool        web_ptt_active = false;
};

// Outcome of feeding one inbound packet to the arbiter
struct RxDecision {
    bool forward       = false;  // false when DND filtered the packet
    bool state_changed = false;  // Idle -> Receiving; caller publishes after the call returns
};

enum class ChannelWait {
    Free,
    TimedOut,  // channel still busy; callers transmit anyway
};

// Exclusive right to originate a stream. Releases the transmit gate when destroyed; the release
// may happen on a different thread than the acquire.
class TransmitLease {
public:
    TransmitLease() = default;
    explicit TransmitLease(std::binary_semaphore* gate) : gate_(gate) {}

    ~TransmitLease() {
        release();
    }

    TransmitLease(const TransmitLease&)            = delete;
    TransmitLease& operator=(const TransmitLease&) = delete;

    TransmitLease(TransmitLease&& other) noexcept : gate_(other.gate_) {
        other.gate_ = nullptr;
    }

    TransmitLease& operator=(TransmitLease&& other) noexcept {
        if (this != &other) {
            release();
            gate_       = other.gate_;
            other.gate_ = nullptr;
        }
        return *this;
    }

    void release() {
        if (gate_ != nullptr) {
            gate_->release();
            gate_ = nullptr;
        }
    }

    bool held() const {
        return gate_ != nullptr;
    }

private:
    std::binary_semaphore* gate_ = nullptr;
};

// Half-duplex channel state machine. Every transition happens under one lock that is never held
// across I/O; methods report whether the visible state changed so callers can publish afterwards.
class ChannelArbiter {
public:
    using clock = std::chrono::steady_clock;

    struct Timeouts {
        clock::duration rx_timeout    = std::chrono::milliseconds(500);
        clock::duration channel_wait  = std::chrono::seconds(5);
        clock::duration web_ptt_idle  = std::chrono::seconds(5);
        clock::duration poll_interval = std::chrono::milliseconds(100);
    };

    ChannelArbiter() : ChannelArbiter(Timeouts{}) {}
    explicit ChannelArbiter(const Timeouts& timeouts);

    ChannelArbiter(const ChannelArbiter&)            = delete;
    ChannelArbiter& operator=(const ChannelArbiter&) = delete;

    // Transmit gate. Hub sources try once and reject when busy; web PTT queues with a bound.
    std::optional<TransmitLease> try_acquire_transmit();
    std::optional<TransmitLease> acquire_transmit_for(clock::duration timeout);

    // Whether a local stream at `ours` must hold off. Receiving only blocks equal or lower
    // priorities, and stops blocking once the sender has been silent for rx_timeout.
    bool is_channel_busy(Priority ours, clock::time_point now = clock::now()) const;

    // Polls until the channel frees up or the timeout elapses
    ChannelWait wait_for_channel(Priority ours) const;
    ChannelWait wait_for_channel(Priority ours, clock::duration timeout) const;

    RxDecision on_packet(Priority priority, const std::string& sender_hex,
                         clock::time_point now = clock::now());

    // Receiving -> Idle once the sender has gone quiet
    bool check_rx_timeout(clock::time_point now = clock::now());

    // Hub-originated streams (chime, announce)
    bool begin_transmit();
    bool end_transmit();

    // Browser PTT sessions
    bool begin_web_ptt(clock::time_point now = clock::now());
    void note_web_frame(clock::time_point now = clock::now());
    bool end_web_ptt();

    // Forces Idle when a web PTT session stopped sending frames without a ptt_stop
    bool check_web_ptt_watchdog(clock::time_point now = clock::now());

    void set_dnd(bool enabled) {
        dnd_.store(enabled);
    }
    bool dnd() const {
        return dnd_.load();
    }

    void set_tx_priority(Priority priority) {
        tx_priority_.store(priority);
    }
    Priority tx_priority() const {
        return tx_priority_.load();
    }

    ChannelSnapshot snapshot() const;
    ChannelMode     mode() const;

    const Timeouts& timeouts() const {
        return timeouts_;
    }

private:
    bool set_idle_locked();

    const Timeouts timeouts_;

    mutable std::mutex mutex_;
    ChannelMode        mode_           = ChannelMode::Idle;
    Priority           rx_priority_    = Priority::Normal;
    clock::time_point  last_rx_;
    std::string        current_sender_;
    bool               web_ptt_active_ = false;
    clock::time_point  last_web_frame_;

    std::atomic<bool>     dnd_{false};
    std::atomic<Priority> tx_priority_{Priority::Normal};

    std::binary_semaphore transmit_gate_{1};
};
