#include "feature_extractor.hpp"
#include "file_logger.hpp"
#include <array>
#include <cmath>

namespace {

constexpr std::array<std::string_view, 9> kAuthFailureMarkers = {
    "401 Unauthorized",
    "530 Login incorrect",
    "535 Authentication",
    "Authentication failed",
    "Login failed",
    "Invalid user",
    "Failed password",
    "-ERR",
    "403 Forbidden"};

double protocolCode(Protocol protocol)
{
    return static_cast<double>(static_cast<std::uint8_t>(protocol));
}

} // namespace

FeatureExtractor::FeatureExtractor(FeatureSet feature_set)
    : feature_set_(feature_set), names_(features::namesFor(feature_set))
{
}

bool FeatureExtractor::isAuthFailure(std::string_view payload)
{
    if (payload.empty()) {
        return false;
    }
    for (auto marker : kAuthFailureMarkers) {
        if (payload.find(marker) == std::string_view::npos) {
            continue;
        }
        // A bare 403 only counts as a failed login on login endpoints
        if (marker == "403 Forbidden" && payload.find("login") == std::string_view::npos) {
            continue;
        }
        // POP3 -ERR must start the response
        if (marker == "-ERR" && payload.rfind("-ERR", 0) != 0) {
            continue;
        }
        return true;
    }
    return false;
}

double FeatureExtractor::payloadEntropy(std::string_view payload)
{
    if (payload.empty()) {
        return 0.0;
    }
    std::array<size_t, 256> counts{};
    for (unsigned char c : payload) {
        counts[c]++;
    }
    double entropy = 0.0;
    const auto total = static_cast<double>(payload.size());
    for (size_t count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

FeatureVector FeatureExtractor::extract(const PacketRecord& packet, FeatureTrackers& trackers) const
{
    try {
        return extractUnchecked(packet, trackers);
    } catch (const std::exception& e) {
        TRAFFIC_SENTINEL_LOG_ERROR("Feature extraction failed for " + packet.src_ip + ": " + e.what());
        return features::zeroVector(feature_set_);
    }
}

FeatureVector FeatureExtractor::extractUnchecked(const PacketRecord& packet, FeatureTrackers& trackers) const
{
    const TimePoint now = packet.timestamp == TimePoint{} ? SentinelClock::now() : packet.timestamp;
    const size_t packet_size = packet.size > 0 ? packet.size : packet.payload.size();

    FeatureVector fv;
    fv.names = names_;
    fv.values.assign(names_.size(), 0.0);

    fv.values[0] = static_cast<double>(packet_size);
    fv.values[1] = protocolCode(packet.protocol);

    if (packet.src_ip.empty()) {
        // Nothing to key the trackers on
        return fv;
    }

    const FlowKey flow{packet.src_ip, packet.dst_ip, packet.dst_port};

    trackers.connections().record(flow, packet_size, now);
    fv.values[2] = trackers.connections().query(flow, now).value_or(0.0);

    // Failure responses travel server -> client, so the client is dst_ip
    if (!packet.dst_ip.empty() && isAuthFailure(packet.payload)) {
        trackers.logins().record(packet.dst_ip, now);
    }
    fv.values[3] = static_cast<double>(trackers.logins().query(packet.src_ip, now));

    trackers.flowRates().record(flow, packet_size, now);
    fv.values[4] = trackers.flowRates().query(flow, now);

    trackers.accessFrequency().record(packet.src_ip, now);
    fv.values[5] = trackers.accessFrequency().query(packet.src_ip, now);

    if (feature_set_ == FeatureSet::Extended) {
        fv.values[6] = static_cast<double>(packet.src_port);
        fv.values[7] = static_cast<double>(packet.dst_port);
        fv.values[8] = static_cast<double>(packet.tcp_flags);
        fv.values[9] = payloadEntropy(packet.payload);
    }

    if (packet.is_tcp() && (packet.has_flag(tcp_flags::FIN) || packet.has_flag(tcp_flags::RST))) {
        trackers.connections().end(flow, now);
    }

    for (double& value : fv.values) {
        if (!std::isfinite(value)) {
            value = 0.0;
        }
    }
    return fv;
}
