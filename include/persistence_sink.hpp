#ifndef PERSISTENCE_SINK_HPP
#define PERSISTENCE_SINK_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "detection.hpp"

// A detection promoted to its persisted and broadcast form
struct Alert {
    std::string id;  // 32 lowercase hex characters
    Detection detection;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_seen{};
    uint64_t occurrence_count = 1;
    bool resolved = false;
};

// Counters for one flush interval. Never mutated after it has been flushed.
struct TrafficStatsSnapshot {
    std::chrono::system_clock::time_point period_start{};
    std::chrono::system_clock::time_point period_end{};
    uint64_t total_packets = 0;
    uint64_t total_bytes = 0;
    std::map<std::string, uint64_t> protocol_histogram;
    size_t active_connections = 0;
    std::array<uint64_t, DETECTOR_KIND_COUNT> detection_count{};
    uint64_t dropped_packets = 0;
    double packet_rate = 0.0;
    double byte_rate = 0.0;
    double avg_packet_size = 0.0;
    std::vector<std::pair<std::string, uint64_t>> top_sources;
    std::vector<std::pair<uint16_t, uint64_t>> top_dst_ports;

    double periodSeconds() const {
        return std::chrono::duration<double>(period_end - period_start).count();
    }
};

/**
 * @brief Destination for alerts and statistics snapshots
 *
 * Implementations report failure by returning false or throwing; callers
 * retry a bounded number of times.
 */
class IPersistenceSink {
public:
    virtual ~IPersistenceSink() = default;
    virtual bool persistAlert(const Alert& alert) = 0;
    virtual bool persistSnapshot(const TrafficStatsSnapshot& snapshot) = 0;
};

#endif // PERSISTENCE_SINK_HPP
