#include "detection.hpp"

std::string toString(DetectorKind kind)
{
    switch (kind) {
        case DetectorKind::Signature: return "signature";
        case DetectorKind::Anomaly: return "anomaly";
        case DetectorKind::Classification: return "classification";
        default: return "unknown";
    }
}

std::string toString(Severity severity)
{
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
        default: return "unknown";
    }
}

bool parseSeverity(const std::string& text, Severity& severity)
{
    if (text == "low") severity = Severity::Low;
    else if (text == "medium") severity = Severity::Medium;
    else if (text == "high") severity = Severity::High;
    else if (text == "critical") severity = Severity::Critical;
    else return false;
    return true;
}

void attachFlow(Detection& detection, const PacketRecord& packet)
{
    detection.src_ip = packet.src_ip;
    detection.dst_ip = packet.dst_ip;
    detection.src_port = packet.src_port;
    detection.dst_port = packet.dst_port;
    detection.protocol = packet.protocol;
    detection.timestamp = packet.timestamp == std::chrono::system_clock::time_point{}
                              ? std::chrono::system_clock::now()
                              : packet.timestamp;
}
