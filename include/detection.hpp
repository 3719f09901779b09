#ifndef DETECTION_HPP
#define DETECTION_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "packet_record.hpp"

enum class DetectorKind : std::uint8_t {
    Signature = 0,
    Anomaly = 1,
    Classification = 2
};

constexpr size_t DETECTOR_KIND_COUNT = 3;

enum class Severity : std::uint8_t {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

// A single verdict from one detector. Immutable once produced.
struct Detection {
    DetectorKind kind = DetectorKind::Signature;
    Severity severity = Severity::Low;
    double confidence = 0.0;       // 0-1
    std::string rule_id;           // stable machine name, e.g. "port_scan"
    std::string description;       // stable per rule; used for alert dedup
    std::string details;           // observed values
    std::string src_ip;
    std::string dst_ip;
    std::uint16_t src_port = 0;
    std::uint16_t dst_port = 0;
    Protocol protocol = Protocol::Other;
    std::uint64_t correlation_id = 0;  // 0 until assigned by the coordinator
    std::chrono::system_clock::time_point timestamp{};
};

std::string toString(DetectorKind kind);
std::string toString(Severity severity);
bool parseSeverity(const std::string& text, Severity& severity);

inline size_t kindIndex(DetectorKind kind) { return static_cast<size_t>(kind); }

// Copies the flow identity of @p packet into @p detection
void attachFlow(Detection& detection, const PacketRecord& packet);

#endif // DETECTION_HPP
