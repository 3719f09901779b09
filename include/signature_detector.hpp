#ifndef SIGNATURE_DETECTOR_HPP
#define SIGNATURE_DETECTOR_HPP

#include <cstdint>
#include <regex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "detector_interface.hpp"

struct SentinelConfig;

namespace detection {
    enum class RuleTarget : std::uint8_t {
        Payload = 0,
        Uri = 1,
        UserAgent = 2
    };

    std::string toString(RuleTarget target);

    struct SignatureRule {
        std::string id;
        std::string description;
        Severity severity = Severity::Medium;
        std::vector<std::string> patterns;      // ECMAScript, matched case-insensitively
        std::vector<RuleTarget> targets;
        double confidence = 0.8;                // payload and user-agent matches
        double uri_confidence = 0.9;            // URI matches
    };

    struct AggregateThresholds {
        size_t port_scan_ports = 20;            // distinct destination ports
        double dos_packets_per_second = 100.0;
        uint64_t exfiltration_bytes = 10ULL * 1024 * 1024;
        size_t brute_force_attempts = 5;
    };

    /**
     * @brief Rule engine over packet content and the per-source history window
     *
     * Single-packet rules fire at most once per packet (first matching
     * target and pattern). Aggregate rules fire at most once per evaluation.
     */
    class SignatureDetector : public BaseDetector {
    public:
        SignatureDetector();
        explicit SignatureDetector(const AggregateThresholds& thresholds,
                                   const std::vector<SignatureRule>& rules = defaultRules());

        static std::vector<SignatureRule> defaultRules();
        static AggregateThresholds thresholdsFrom(const SentinelConfig& config);

        // Returns false when none of the rule's patterns compile
        bool addRule(const SignatureRule& rule);
        size_t ruleCount() const;

        std::vector<Detection> detect(const DetectionInput& input) override;

        // min(1, base + 0.4 * (observed - threshold) / threshold)
        static double scaledConfidence(double observed, double threshold, double base = 0.6);

    private:
        struct CompiledPattern {
            std::string source;
            std::regex regex;
        };

        struct CompiledRule {
            SignatureRule rule;
            std::vector<CompiledPattern> patterns;
        };

        void matchContentRules(const DetectionInput& input, std::vector<Detection>& out) const;
        void matchAggregateRules(const DetectionInput& input, std::vector<Detection>& out) const;

        AggregateThresholds thresholds_;
        std::vector<CompiledRule> rules_;
        mutable std::shared_mutex rules_mutex_;
    };
}

#endif // SIGNATURE_DETECTOR_HPP
