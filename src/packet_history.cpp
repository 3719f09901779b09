#include "packet_history.hpp"
#include <algorithm>
#include <unordered_set>

SourceHistoryTracker::SourceHistoryTracker(std::chrono::seconds window, size_t max_packets,
                                           size_t capacity)
    : window_(window), max_packets_(max_packets == 0 ? 1 : max_packets), sources_(capacity)
{
}

void SourceHistoryTracker::prune(std::deque<Event>& events, TimePoint now) const
{
    const TimePoint cutoff = now - window_;
    while (!events.empty() && (events.front().at < cutoff || events.size() > max_packets_)) {
        events.pop_front();
    }
}

void SourceHistoryTracker::record(const PacketRecord& packet, TimePoint now)
{
    if (packet.src_ip.empty()) {
        return;
    }
    const uint64_t bytes = packet.size > 0 ? packet.size : packet.payload.size();
    sources_.upsert(
        packet.src_ip, []() { return std::deque<Event>{}; },
        [&](std::deque<Event>& events) {
            events.push_back(Event{now, packet.dst_port, bytes});
            prune(events, now);
        });
}

HistorySummary SourceHistoryTracker::summarize(const std::string& src_ip, TimePoint now)
{
    HistorySummary summary;
    sources_.with_write(src_ip, [&](std::deque<Event>& events) {
        prune(events, now);
        if (events.empty()) {
            return;
        }
        std::unordered_set<uint16_t> ports;
        for (const auto& event : events) {
            ports.insert(event.dst_port);
            summary.total_bytes += event.bytes;
        }
        summary.packet_count = events.size();
        summary.distinct_dst_ports = ports.size();
        summary.span_seconds = std::max(0.0, secondsBetween(events.front().at, events.back().at));
    });
    return summary;
}

size_t SourceHistoryTracker::sweep(TimePoint now)
{
    const TimePoint cutoff = now - window_;
    return sources_.erase_if([&](const std::string&, const std::deque<Event>& events) {
        return events.empty() || events.back().at < cutoff;
    });
}
