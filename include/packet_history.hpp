#ifndef PACKET_HISTORY_HPP
#define PACKET_HISTORY_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include "feature_trackers.hpp"
#include "packet_record.hpp"

// Aggregate view of one source's recent packets
struct HistorySummary {
    size_t packet_count = 0;
    size_t distinct_dst_ports = 0;
    uint64_t total_bytes = 0;
    double span_seconds = 0.0;   // first to last packet in the window
};

/**
 * @brief Bounded per-source sliding window (last N packets within W seconds)
 *
 * Feeds the aggregate signature rules (port scan, DoS burst, exfiltration).
 */
class SourceHistoryTracker {
public:
    SourceHistoryTracker(std::chrono::seconds window, size_t max_packets, size_t capacity);

    void record(const PacketRecord& packet, TimePoint now);
    HistorySummary summarize(const std::string& src_ip, TimePoint now);

    size_t sweep(TimePoint now);
    size_t size() const { return sources_.size(); }
    std::chrono::seconds window() const { return window_; }

private:
    struct Event {
        TimePoint at;
        uint16_t dst_port;
        uint64_t bytes;
    };

    void prune(std::deque<Event>& events, TimePoint now) const;

    std::chrono::seconds window_;
    size_t max_packets_;
    ShardedLRUCache<std::string, std::deque<Event>> sources_;
};

#endif // PACKET_HISTORY_HPP
