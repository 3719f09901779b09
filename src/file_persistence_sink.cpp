#include "file_persistence_sink.hpp"
#include "file_logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

long long epochSeconds(const std::chrono::system_clock::time_point& tp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

FilePersistenceSink::FilePersistenceSink(FileLogger& logger) : logger_(logger) {}

std::string FilePersistenceSink::formatAlert(const Alert& alert)
{
    const Detection& d = alert.detection;
    std::ostringstream line;
    line << '[' << toString(d.severity) << "] " << d.description
         << " id=" << alert.id
         << " created=\"" << FileLogger::format_timestamp(alert.created_at) << '"'
         << " detector=" << toString(d.kind)
         << " rule=" << d.rule_id
         << " src=" << d.src_ip << ':' << d.src_port
         << " dst=" << d.dst_ip << ':' << d.dst_port
         << " proto=" << protocolToString(d.protocol)
         << " confidence=" << std::fixed << std::setprecision(3) << d.confidence
         << " correlation=" << d.correlation_id;
    if (!d.details.empty()) {
        // One alert per line in the alerts log
        std::string details = d.details;
        std::replace(details.begin(), details.end(), '\n', ' ');
        std::replace(details.begin(), details.end(), '\r', ' ');
        line << " details=\"" << details << '"';
    }
    return line.str();
}

std::string FilePersistenceSink::formatSnapshot(const TrafficStatsSnapshot& snapshot)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "period_start:" << epochSeconds(snapshot.period_start) << '\n';
    out << "period_end:" << epochSeconds(snapshot.period_end) << '\n';
    out << "total_packets:" << snapshot.total_packets << '\n';
    out << "total_bytes:" << snapshot.total_bytes << '\n';
    out << "dropped_packets:" << snapshot.dropped_packets << '\n';
    out << "active_connections:" << snapshot.active_connections << '\n';
    out << "packet_rate:" << snapshot.packet_rate << '\n';
    out << "byte_rate:" << snapshot.byte_rate << '\n';
    out << "avg_packet_size:" << snapshot.avg_packet_size << '\n';
    for (size_t i = 0; i < DETECTOR_KIND_COUNT; ++i) {
        out << "detections_" << toString(static_cast<DetectorKind>(i)) << ':'
            << snapshot.detection_count[i] << '\n';
    }
    for (const auto& [protocol, count] : snapshot.protocol_histogram) {
        out << "protocol_" << protocol << ':' << count << '\n';
    }
    for (size_t i = 0; i < snapshot.top_sources.size(); ++i) {
        out << "top_source_" << i + 1 << ':' << snapshot.top_sources[i].first
            << ' ' << snapshot.top_sources[i].second << '\n';
    }
    for (size_t i = 0; i < snapshot.top_dst_ports.size(); ++i) {
        out << "top_dst_port_" << i + 1 << ':' << snapshot.top_dst_ports[i].first
            << ' ' << snapshot.top_dst_ports[i].second << '\n';
    }
    return out.str();
}

bool FilePersistenceSink::persistAlert(const Alert& alert)
{
    // Structured entries are dropped while the writer is down
    if (!logger_.is_running()) {
        return false;
    }
    logger_.write_alert(formatAlert(alert));
    return true;
}

bool FilePersistenceSink::persistSnapshot(const TrafficStatsSnapshot& snapshot)
{
    if (!logger_.is_running()) {
        return false;
    }
    logger_.write_traffic_stats(formatSnapshot(snapshot));
    return true;
}
