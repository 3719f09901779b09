#ifndef STATS_AGGREGATOR_HPP
#define STATS_AGGREGATOR_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "packet_record.hpp"
#include "persistence_sink.hpp"

struct StatsAggregatorOptions {
    size_t top_talkers = 10;
    int retry_limit = 3;
    size_t history_size = 60;
};

/**
 * @brief Accumulates traffic counters and flushes them as snapshots
 *
 * flush() swaps the accumulator out under one lock, so a snapshot never mixes
 * counters from two periods, and builds the snapshot after releasing it.
 */
class StatsAggregator {
public:
    using Clock = std::chrono::system_clock;

    explicit StatsAggregator(std::shared_ptr<IPersistenceSink> persistence,
                             StatsAggregatorOptions options = StatsAggregatorOptions{},
                             Clock::time_point start = Clock::now());

    void record(const PacketRecord& packet);
    void recordDetection(const Detection& detection);
    void recordDropped(uint64_t count = 1);

    TrafficStatsSnapshot flush(Clock::time_point now = Clock::now());

    void setActiveConnectionsProvider(std::function<size_t()> provider);

    std::vector<TrafficStatsSnapshot> recentSnapshots() const;
    uint64_t flushCount() const { return flushes_.load(std::memory_order_relaxed); }
    uint64_t persistenceFailures() const { return persistence_failures_.load(std::memory_order_relaxed); }

private:
    // Bound on distinct sources/ports counted per period
    static constexpr size_t MAX_TALKER_KEYS = 65536;

    struct Accumulator {
        Clock::time_point period_start{};
        uint64_t packets = 0;
        uint64_t bytes = 0;
        uint64_t dropped = 0;
        std::array<uint64_t, 4> protocols{};
        std::array<uint64_t, DETECTOR_KIND_COUNT> detections{};
        std::unordered_map<std::string, uint64_t> sources;
        std::unordered_map<uint16_t, uint64_t> dst_ports;
    };

    TrafficStatsSnapshot buildSnapshot(const Accumulator& acc, Clock::time_point now, size_t active) const;
    bool persistWithRetry(const TrafficStatsSnapshot& snapshot);

    std::shared_ptr<IPersistenceSink> persistence_;
    StatsAggregatorOptions options_;

    mutable std::mutex mutex_;
    Accumulator current_;

    mutable std::mutex provider_mutex_;
    std::function<size_t()> active_connections_;

    mutable std::mutex history_mutex_;
    std::deque<TrafficStatsSnapshot> history_;

    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> persistence_failures_{0};
};

#endif // STATS_AGGREGATOR_HPP
