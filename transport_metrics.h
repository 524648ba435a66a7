#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "logger.h"

struct TransportCounters {
    uint64_t tx_packets    = 0;
    uint64_t tx_errors     = 0;
    uint64_t rx_packets    = 0;
    uint64_t sequence_gaps = 0;
    uint64_t duplicates    = 0;
    uint64_t malformed     = 0;
};

// UDP TX/RX counters for the current reporting window
class TransportMetrics {
public:
    void record_tx(bool success) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (success) {
            ++counters_.tx_packets;
        } else {
            ++counters_.tx_errors;
        }
    }

    void record_rx(const std::string& sender_hex, uint32_t sequence) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counters_.rx_packets;
        auto it = last_seq_.find(sender_hex);
        if (it != last_seq_.end()) {
            uint32_t last = it->second;
            if (sequence == last) {
                ++counters_.duplicates;
            } else if (sequence > last + 1) {
                counters_.sequence_gaps += sequence - last - 1;
            }
            it->second = sequence;
        } else {
            last_seq_.emplace(sender_hex, sequence);
        }
    }

    void record_malformed() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counters_.malformed;
    }

    TransportCounters snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_;
    }

    // Logs the window's counters and starts a new window
    TransportCounters report_and_reset() {
        TransportCounters counters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            counters  = counters_;
            counters_ = {};
            last_seq_.clear();
        }
        Log::info("Transport stats: TX {} sent / {} errors, RX {} received / {} gaps / {} dupes / "
                  "{} malformed",
                  counters.tx_packets, counters.tx_errors, counters.rx_packets,
                  counters.sequence_gaps, counters.duplicates, counters.malformed);
        return counters;
    }

private:
    mutable std::mutex                        mutex_;
    TransportCounters                         counters_;
    std::unordered_map<std::string, uint32_t> last_seq_;
};
