#ifndef FEATURE_TRACKERS_HPP
#define FEATURE_TRACKERS_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include "lru_cache.hpp"

struct SentinelConfig;

using SentinelClock = std::chrono::system_clock;
using TimePoint = SentinelClock::time_point;

inline double secondsBetween(TimePoint from, TimePoint to)
{
    return std::chrono::duration<double>(to - from).count();
}

// (src ip, dst ip, dst port)
struct FlowKey {
    std::string src_ip;
    std::string dst_ip;
    uint16_t dst_port = 0;

    bool operator==(const FlowKey& other) const {
        return dst_port == other.dst_port && src_ip == other.src_ip && dst_ip == other.dst_ip;
    }
};

struct FlowKeyHash {
    size_t operator()(const FlowKey& key) const {
        size_t h = std::hash<std::string>{}(key.src_ip);
        h ^= std::hash<std::string>{}(key.dst_ip) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<uint16_t>{}(key.dst_port) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

struct ConnectionState {
    TimePoint first_seen{};
    TimePoint last_seen{};
    uint64_t bytes = 0;
    uint64_t packets = 0;
};

class ConnectionTracker {
public:
    ConnectionTracker(std::chrono::seconds idle_timeout, size_t capacity);

    void record(const FlowKey& key, size_t bytes, TimePoint now);

    // Seconds since first-seen; empty when the flow is unknown or idle past the timeout
    std::optional<double> query(const FlowKey& key, TimePoint now) const;
    std::optional<ConnectionState> snapshot(const FlowKey& key) const;

    // Removes the flow and returns its final duration
    std::optional<double> end(const FlowKey& key, TimePoint now);

    size_t sweep(TimePoint now);
    size_t activeCount() const { return flows_.size(); }
    std::chrono::seconds idleTimeout() const { return idle_timeout_; }

private:
    std::chrono::seconds idle_timeout_;
    ShardedLRUCache<FlowKey, ConnectionState, FlowKeyHash> flows_;
};

class LoginAttemptTracker {
public:
    LoginAttemptTracker(std::chrono::seconds window, size_t capacity);

    void record(const std::string& src_ip, TimePoint now);

    // Failed attempts inside the trailing window; prunes older entries
    size_t query(const std::string& src_ip, TimePoint now);

    size_t sweep(TimePoint now);
    size_t size() const { return attempts_.size(); }

private:
    std::chrono::seconds window_;
    ShardedLRUCache<std::string, std::deque<TimePoint>> attempts_;
};

class FlowRateCalculator {
public:
    FlowRateCalculator(std::chrono::seconds idle_timeout, size_t capacity);

    void record(const FlowKey& key, size_t bytes, TimePoint now);

    // bytes / max(elapsed seconds, 1); 0 for unknown flows
    double query(const FlowKey& key, TimePoint now) const;

    size_t sweep(TimePoint now);
    size_t size() const { return flows_.size(); }

private:
    struct FlowBytes {
        TimePoint first_seen{};
        TimePoint last_seen{};
        uint64_t bytes = 0;
    };

    std::chrono::seconds idle_timeout_;
    ShardedLRUCache<FlowKey, FlowBytes, FlowKeyHash> flows_;
};

class AccessFrequencyTracker {
public:
    AccessFrequencyTracker(std::chrono::seconds window, size_t capacity);

    void record(const std::string& src_ip, TimePoint now);

    // Accesses per second within the window
    double query(const std::string& src_ip, TimePoint now);

    size_t sweep(TimePoint now);
    size_t size() const { return accesses_.size(); }

private:
    std::chrono::seconds window_;
    ShardedLRUCache<std::string, std::deque<TimePoint>> accesses_;
};

/**
 * @brief The four feature trackers, owned by the pipeline and passed to the extractor
 */
class FeatureTrackers {
public:
    FeatureTrackers();
    explicit FeatureTrackers(const SentinelConfig& config);

    ConnectionTracker& connections() { return connections_; }
    LoginAttemptTracker& logins() { return logins_; }
    FlowRateCalculator& flowRates() { return flow_rates_; }
    AccessFrequencyTracker& accessFrequency() { return access_; }
    const ConnectionTracker& connections() const { return connections_; }

    // Total entries evicted across all trackers
    size_t sweep(TimePoint now);

private:
    ConnectionTracker connections_;
    LoginAttemptTracker logins_;
    FlowRateCalculator flow_rates_;
    AccessFrequencyTracker access_;
};

#endif // FEATURE_TRACKERS_HPP
