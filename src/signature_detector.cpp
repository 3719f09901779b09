#include "signature_detector.hpp"
#include "file_logger.hpp"
#include "sentinel_config.hpp"
#include <algorithm>
#include <mutex>
#include <sstream>

namespace detection {

namespace {

// std::regex backtracks recursively; long inputs can exhaust the stack
constexpr size_t MAX_SCAN_BYTES = 4096;

std::string_view clip(std::string_view text)
{
    return text.substr(0, std::min(text.size(), MAX_SCAN_BYTES));
}

} // namespace

std::string toString(RuleTarget target)
{
    switch (target) {
        case RuleTarget::Payload: return "payload";
        case RuleTarget::Uri: return "uri";
        case RuleTarget::UserAgent: return "user_agent";
        default: return "unknown";
    }
}

std::vector<SignatureRule> SignatureDetector::defaultRules()
{
    std::vector<SignatureRule> rules;

    rules.push_back({"sql_injection", "SQL injection pattern detected", Severity::Critical,
                     {R"(union\s+(all\s+)?select)", R"(select\s+.*\s+from)", R"(drop\s+table)",
                      R"(delete\s+from)", R"(\bor\s+'?\d+'?\s*=\s*'?\d+)", R"(\band\s+1\s*=\s*1)",
                      R"(information_schema)", R"(mysql\.user)", R"(sys\.databases)"},
                     {RuleTarget::Uri, RuleTarget::Payload}, 0.8, 0.9});

    rules.push_back({"xss", "Cross-site scripting pattern detected", Severity::High,
                     {R"(<\s*script[^>]*>)", R"(javascript:)", R"(vbscript:)", R"(onload\s*=)",
                      R"(onerror\s*=)", R"(onclick\s*=)", R"(document\.cookie)",
                      R"(document\.location)", R"(window\.open)", R"(eval\s*\()"},
                     {RuleTarget::Uri, RuleTarget::Payload}, 0.8, 0.9});

    rules.push_back({"malware_marker", "Malware command marker detected", Severity::Critical,
                     {R"(\bbotnet\b)", R"(\btrojan\b)", R"(cmd\.exe)", R"(powershell)",
                      R"(\bwscript\b)", R"(\bcscript\b)"},
                     {RuleTarget::Payload}, 0.8, 0.9});

    rules.push_back({"scanner_user_agent", "Known scanner user agent", Severity::Medium,
                     {R"(sqlmap)", R"(nikto)", R"(nmap)", R"(masscan)", R"(zgrab)", R"(owasp\s*zap)"},
                     {RuleTarget::UserAgent}, 0.7, 0.7});

    rules.push_back({"data_exfiltration_command", "Bulk transfer command detected", Severity::High,
                     {R"((ftp|sftp|scp|rsync).*\bput\b)", R"(bulk_download)", R"(large_data_transfer)"},
                     {RuleTarget::Payload}, 0.8, 0.9});

    return rules;
}

AggregateThresholds SignatureDetector::thresholdsFrom(const SentinelConfig& config)
{
    AggregateThresholds thresholds;
    thresholds.port_scan_ports = config.signatures.port_scan_threshold;
    thresholds.dos_packets_per_second = config.signatures.dos_packet_rate_threshold;
    thresholds.exfiltration_bytes = config.signatures.exfiltration_bytes_threshold;
    thresholds.brute_force_attempts = config.signatures.brute_force_threshold;
    return thresholds;
}

SignatureDetector::SignatureDetector() : SignatureDetector(AggregateThresholds{}) {}

SignatureDetector::SignatureDetector(const AggregateThresholds& thresholds,
                                     const std::vector<SignatureRule>& rules)
    : BaseDetector("signature", DetectorKind::Signature, 300), thresholds_(thresholds)
{
    for (const auto& rule : rules) {
        addRule(rule);
    }
}

bool SignatureDetector::addRule(const SignatureRule& rule)
{
    CompiledRule compiled;
    compiled.rule = rule;

    for (const auto& pattern : rule.patterns) {
        try {
            compiled.patterns.push_back(
                {pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase |
                                                  std::regex::optimize)});
        } catch (const std::regex_error& e) {
            TRAFFIC_SENTINEL_LOG_WARNING("Signature rule '" + rule.id + "': skipping pattern '" +
                                         pattern + "': " + e.what());
        }
    }

    if (compiled.patterns.empty()) {
        TRAFFIC_SENTINEL_LOG_WARNING("Signature rule '" + rule.id + "' has no usable pattern, rule skipped");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    rules_.push_back(std::move(compiled));
    return true;
}

size_t SignatureDetector::ruleCount() const
{
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    return rules_.size();
}

double SignatureDetector::scaledConfidence(double observed, double threshold, double base)
{
    if (threshold <= 0.0) {
        return 1.0;
    }
    double excess = std::max(0.0, observed - threshold) / threshold;
    return std::clamp(base + 0.4 * excess, 0.0, 1.0);
}

std::vector<Detection> SignatureDetector::detect(const DetectionInput& input)
{
    std::vector<Detection> detections;
    matchContentRules(input, detections);
    matchAggregateRules(input, detections);
    return detections;
}

void SignatureDetector::matchContentRules(const DetectionInput& input, std::vector<Detection>& out) const
{
    const PacketRecord& packet = input.packet;
    const HttpRequestInfo http = parseHttpRequest(packet.payload);

    auto textFor = [&](RuleTarget target) -> std::string_view {
        switch (target) {
            case RuleTarget::Payload: return packet.payload;
            case RuleTarget::Uri: return http.uri;
            case RuleTarget::UserAgent: return http.user_agent;
        }
        return {};
    };

    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    for (const auto& compiled : rules_) {
        bool fired = false;
        for (RuleTarget target : compiled.rule.targets) {
            std::string_view text = clip(textFor(target));
            if (text.empty()) {
                continue;
            }
            for (const auto& pattern : compiled.patterns) {
                bool matched = false;
                try {
                    matched = std::regex_search(text.begin(), text.end(), pattern.regex);
                } catch (const std::regex_error& e) {
                    TRAFFIC_SENTINEL_LOG_WARNING("Signature rule '" + compiled.rule.id +
                                                 "': match aborted: " + e.what());
                }
                if (!matched) {
                    continue;
                }

                Detection d;
                d.kind = DetectorKind::Signature;
                d.severity = compiled.rule.severity;
                d.confidence = target == RuleTarget::Uri ? compiled.rule.uri_confidence
                                                         : compiled.rule.confidence;
                d.rule_id = compiled.rule.id;
                d.description = compiled.rule.description;
                d.details = "target=" + toString(target) + " pattern=" + pattern.source;
                attachFlow(d, packet);
                out.push_back(std::move(d));
                fired = true;
                break;
            }
            if (fired) {
                break;
            }
        }
    }
}

void SignatureDetector::matchAggregateRules(const DetectionInput& input, std::vector<Detection>& out) const
{
    const HistorySummary& history = input.history;

    auto emit = [&](const char* rule_id, const char* description, Severity severity,
                    double observed, double threshold, const std::string& details) {
        Detection d;
        d.kind = DetectorKind::Signature;
        d.severity = severity;
        d.confidence = scaledConfidence(observed, threshold);
        d.rule_id = rule_id;
        d.description = description;
        d.details = details;
        attachFlow(d, input.packet);
        out.push_back(std::move(d));
    };

    if (history.distinct_dst_ports > thresholds_.port_scan_ports) {
        std::ostringstream details;
        details << "distinct_ports=" << history.distinct_dst_ports
                << " packets=" << history.packet_count
                << " window_span=" << history.span_seconds << "s";
        emit("port_scan", "Port scan detected", Severity::Medium,
             static_cast<double>(history.distinct_dst_ports),
             static_cast<double>(thresholds_.port_scan_ports), details.str());
    }

    if (history.packet_count > 0) {
        double rate = static_cast<double>(history.packet_count) / std::max(history.span_seconds, 1.0);
        if (rate > thresholds_.dos_packets_per_second) {
            std::ostringstream details;
            details << "packet_rate=" << rate << "pps packets=" << history.packet_count;
            emit("dos_burst", "DoS packet burst detected", Severity::High, rate,
                 thresholds_.dos_packets_per_second, details.str());
        }
    }

    if (history.total_bytes > thresholds_.exfiltration_bytes) {
        std::ostringstream details;
        details << "bytes=" << history.total_bytes << " window_span=" << history.span_seconds << "s";
        emit("data_exfiltration", "Large outbound data volume", Severity::High,
             static_cast<double>(history.total_bytes),
             static_cast<double>(thresholds_.exfiltration_bytes), details.str());
    }

    double failed_logins = input.features.get(features::FAILED_LOGIN_ATTEMPTS);
    if (failed_logins >= static_cast<double>(thresholds_.brute_force_attempts)) {
        emit("brute_force", "Brute force login attempts", Severity::High, failed_logins,
             static_cast<double>(thresholds_.brute_force_attempts),
             "failed_logins=" + std::to_string(static_cast<long long>(failed_logins)));
    }
}

} // namespace detection
