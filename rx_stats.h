#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "protocol.h"

// Seconds since the Unix epoch, the unit the stats API speaks
inline double unix_now() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

struct RxStatsEntry {
    double   first_rx     = 0.0;
    double   last_rx      = 0.0;
    uint64_t packet_count = 0;
    uint32_t seq_min      = 0;
    uint32_t seq_max      = 0;
    Priority priority     = Priority::Normal;
};

// Entry plus the fields computed at query time
struct RxStatsView {
    RxStatsEntry entry;
    double       age_seconds      = 0.0;
    double       duration_seconds = 0.0;
};

struct RxStatsQuery {
    double                     window = 60.0;  // seconds; 0 disables the recency filter
    std::optional<std::string> sender;         // exact sender hex
    std::optional<double>      since;          // unix seconds, inclusive
};

// Per-sender UDP receive statistics. Written from the receive path on every packet
// (before DND filtering), read from the HTTP API.
class AudioRxStats {
public:
    using Snapshot = std::unordered_map<std::string, RxStatsView>;

    void record(const std::string& sender_hex, uint32_t sequence, Priority priority,
                double now = unix_now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(sender_hex);
        if (it == entries_.end()) {
            entries_.emplace(sender_hex, RxStatsEntry{now, now, 1, sequence, sequence, priority});
            return;
        }
        RxStatsEntry& entry = it->second;
        entry.last_rx       = now;
        entry.packet_count += 1;
        entry.seq_min       = std::min(entry.seq_min, sequence);
        entry.seq_max       = std::max(entry.seq_max, sequence);
        entry.priority      = priority;
    }

    Snapshot query(const RxStatsQuery& query, double now = unix_now()) const {
        std::unordered_map<std::string, RxStatsEntry> copy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            copy = entries_;
        }

        const double cutoff = now - query.window;
        Snapshot     result;
        for (const auto& [sender, entry]: copy) {
            if (query.sender && *query.sender != sender) {
                continue;
            }
            if (query.window > 0 && entry.last_rx < cutoff) {
                continue;
            }
            if (query.since && entry.last_rx < *query.since) {
                continue;
            }
            result.emplace(sender, RxStatsView{entry, now - entry.last_rx,
                                               entry.last_rx - entry.first_rx});
        }
        return result;
    }

    // Drops entries idle for more than older_than seconds; 0 clears everything.
    // Returns how many entries were removed.
    size_t clear(double older_than, double now = unix_now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (older_than <= 0) {
            size_t count = entries_.size();
            entries_.clear();
            return count;
        }
        const double cutoff = now - older_than;
        return std::erase_if(entries_,
                             [cutoff](const auto& item) { return item.second.last_rx < cutoff; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex                            mutex_;
    std::unordered_map<std::string, RxStatsEntry> entries_;
};
