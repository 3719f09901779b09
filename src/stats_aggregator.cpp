#include "stats_aggregator.hpp"
#include "file_logger.hpp"
#include <algorithm>

namespace {

const char* protocolKey(size_t index)
{
    switch (index) {
        case 1: return "tcp";
        case 2: return "udp";
        case 3: return "icmp";
        default: return "other";
    }
}

template <typename Key>
std::vector<std::pair<Key, uint64_t>> topN(const std::unordered_map<Key, uint64_t>& counts, size_t n)
{
    std::vector<std::pair<Key, uint64_t>> entries(counts.begin(), counts.end());
    auto by_count = [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    };
    if (entries.size() > n) {
        std::partial_sort(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(n),
                          entries.end(), by_count);
        entries.resize(n);
    } else {
        std::sort(entries.begin(), entries.end(), by_count);
    }
    return entries;
}

} // namespace

StatsAggregator::StatsAggregator(std::shared_ptr<IPersistenceSink> persistence,
                                 StatsAggregatorOptions options, Clock::time_point start)
    : persistence_(std::move(persistence)), options_(options)
{
    current_.period_start = start;
}

void StatsAggregator::record(const PacketRecord& packet)
{
    const uint64_t bytes = packet.size > 0 ? packet.size : packet.payload.size();
    const auto protocol = static_cast<size_t>(packet.protocol);

    std::lock_guard<std::mutex> lock(mutex_);
    current_.packets += 1;
    current_.bytes += bytes;
    current_.protocols[protocol < current_.protocols.size() ? protocol : 0] += 1;

    if (!packet.src_ip.empty()) {
        auto it = current_.sources.find(packet.src_ip);
        if (it != current_.sources.end()) {
            it->second += 1;
        } else if (current_.sources.size() < MAX_TALKER_KEYS) {
            current_.sources.emplace(packet.src_ip, 1);
        }
    }
    if (packet.dst_port != 0) {
        auto it = current_.dst_ports.find(packet.dst_port);
        if (it != current_.dst_ports.end()) {
            it->second += 1;
        } else if (current_.dst_ports.size() < MAX_TALKER_KEYS) {
            current_.dst_ports.emplace(packet.dst_port, 1);
        }
    }
}

void StatsAggregator::recordDetection(const Detection& detection)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_.detections[kindIndex(detection.kind)] += 1;
}

void StatsAggregator::recordDropped(uint64_t count)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_.dropped += count;
}

void StatsAggregator::setActiveConnectionsProvider(std::function<size_t()> provider)
{
    std::lock_guard<std::mutex> lock(provider_mutex_);
    active_connections_ = std::move(provider);
}

TrafficStatsSnapshot StatsAggregator::buildSnapshot(const Accumulator& acc, Clock::time_point now,
                                                    size_t active) const
{
    TrafficStatsSnapshot snapshot;
    snapshot.period_start = acc.period_start;
    snapshot.period_end = now;
    snapshot.total_packets = acc.packets;
    snapshot.total_bytes = acc.bytes;
    snapshot.dropped_packets = acc.dropped;
    snapshot.active_connections = active;
    snapshot.detection_count = acc.detections;
    for (size_t i = 0; i < acc.protocols.size(); ++i) {
        if (acc.protocols[i] > 0) {
            snapshot.protocol_histogram[protocolKey(i)] = acc.protocols[i];
        }
    }

    const double seconds = std::max(snapshot.periodSeconds(), 1.0);
    snapshot.packet_rate = static_cast<double>(acc.packets) / seconds;
    snapshot.byte_rate = static_cast<double>(acc.bytes) / seconds;
    snapshot.avg_packet_size = acc.packets > 0
        ? static_cast<double>(acc.bytes) / static_cast<double>(acc.packets)
        : 0.0;
    snapshot.top_sources = topN(acc.sources, options_.top_talkers);
    snapshot.top_dst_ports = topN(acc.dst_ports, options_.top_talkers);
    return snapshot;
}

bool StatsAggregator::persistWithRetry(const TrafficStatsSnapshot& snapshot)
{
    if (!persistence_) {
        return false;
    }
    const int attempts = std::max(options_.retry_limit, 1);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            if (persistence_->persistSnapshot(snapshot)) {
                return true;
            }
        } catch (const std::exception& e) {
            TRAFFIC_SENTINEL_LOG_WARNING("Persisting stats snapshot threw (attempt " +
                                         std::to_string(attempt) + "): " + e.what());
        }
    }
    return false;
}

TrafficStatsSnapshot StatsAggregator::flush(Clock::time_point now)
{
    Accumulator finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(finished, current_);
        current_.period_start = now;
    }

    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(provider_mutex_);
        if (active_connections_) {
            active = active_connections_();
        }
    }

    TrafficStatsSnapshot snapshot = buildSnapshot(finished, now, active);
    flushes_.fetch_add(1, std::memory_order_relaxed);

    if (!persistWithRetry(snapshot)) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        TRAFFIC_SENTINEL_LOG_ERROR("Stats snapshot for " + std::to_string(snapshot.total_packets) +
                                   " packets could not be persisted, kept in memory");
    }

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(snapshot);
        while (history_.size() > std::max<size_t>(options_.history_size, 1)) {
            history_.pop_front();
        }
    }
    return snapshot;
}

std::vector<TrafficStatsSnapshot> StatsAggregator::recentSnapshots() const
{
    std::lock_guard<std::mutex> lock(history_mutex_);
    return {history_.begin(), history_.end()};
}
