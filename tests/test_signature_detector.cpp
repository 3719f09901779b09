#include <gtest/gtest.h>
#include <algorithm>
#include "signature_detector.hpp"

using namespace detection;

class SignatureDetectorTest : public ::testing::Test {
protected:
    PacketRecord createHttpPacket(const std::string& request) {
        PacketRecord packet;
        packet.timestamp = std::chrono::system_clock::now();
        packet.src_ip = "192.168.1.66";
        packet.dst_ip = "10.0.0.1";
        packet.src_port = 40000;
        packet.dst_port = 80;
        packet.protocol = Protocol::Tcp;
        packet.payload = request;
        packet.size = request.size();
        return packet;
    }

    std::vector<Detection> run(const PacketRecord& packet, const HistorySummary& history = {}) {
        DetectionInput input{packet, features, history};
        return detector.detect(input);
    }

    static const Detection* findRule(const std::vector<Detection>& detections, const std::string& rule_id) {
        auto it = std::find_if(detections.begin(), detections.end(),
                               [&](const Detection& d) { return d.rule_id == rule_id; });
        return it == detections.end() ? nullptr : &*it;
    }

    SignatureDetector detector;
    FeatureVector features = features::zeroVector(FeatureSet::Live);
};

TEST_F(SignatureDetectorTest, SqlInjectionInUriIsCritical) {
    auto packet = createHttpPacket("GET /login?user=admin' OR 1=1-- HTTP/1.1\r\nHost: shop\r\n\r\n");
    auto detections = run(packet);

    const Detection* sqli = findRule(detections, "sql_injection");
    ASSERT_NE(sqli, nullptr);
    EXPECT_EQ(sqli->kind, DetectorKind::Signature);
    EXPECT_EQ(sqli->severity, Severity::Critical);
    EXPECT_DOUBLE_EQ(sqli->confidence, 0.9);
    EXPECT_EQ(sqli->src_ip, "192.168.1.66");
    EXPECT_NE(sqli->details.find("target=uri"), std::string::npos);
}

TEST_F(SignatureDetectorTest, RuleFiresOncePerPacket) {
    auto packet = createHttpPacket("GET /a?q=1 UNION SELECT password FROM users HTTP/1.1\r\n\r\n"
                                   "drop table users; delete from accounts");
    auto detections = run(packet);
    EXPECT_EQ(std::count_if(detections.begin(), detections.end(),
                            [](const Detection& d) { return d.rule_id == "sql_injection"; }),
              1);
}

TEST_F(SignatureDetectorTest, XssAndScannerUserAgent) {
    auto packet = createHttpPacket("GET /comment?text=<script>alert(1)</script> HTTP/1.1\r\n"
                                   "User-Agent: Nikto/2.1.6\r\n\r\n");
    auto detections = run(packet);

    const Detection* xss = findRule(detections, "xss");
    ASSERT_NE(xss, nullptr);
    EXPECT_EQ(xss->severity, Severity::High);

    const Detection* scanner = findRule(detections, "scanner_user_agent");
    ASSERT_NE(scanner, nullptr);
    EXPECT_DOUBLE_EQ(scanner->confidence, 0.7);
}

TEST_F(SignatureDetectorTest, CleanRequestProducesNothing) {
    auto packet = createHttpPacket("GET /index.html HTTP/1.1\r\nUser-Agent: Mozilla/5.0\r\n\r\n");
    EXPECT_TRUE(run(packet).empty());
}

TEST_F(SignatureDetectorTest, PortScanAboveThreshold) {
    auto packet = createHttpPacket("");
    HistorySummary history;
    history.packet_count = 25;
    history.distinct_dst_ports = 25;
    history.total_bytes = 25 * 60;
    history.span_seconds = 5.0;

    auto detections = run(packet, history);
    const Detection* scan = findRule(detections, "port_scan");
    ASSERT_NE(scan, nullptr);
    EXPECT_EQ(scan->severity, Severity::Medium);
    EXPECT_DOUBLE_EQ(scan->confidence, SignatureDetector::scaledConfidence(25.0, 20.0));
    EXPECT_EQ(findRule(detections, "dos_burst"), nullptr);

    history.distinct_dst_ports = 20;
    EXPECT_EQ(findRule(run(packet, history), "port_scan"), nullptr);
}

TEST_F(SignatureDetectorTest, DosBurstAndExfiltration) {
    auto packet = createHttpPacket("");
    HistorySummary history;
    history.packet_count = 1000;
    history.distinct_dst_ports = 1;
    history.total_bytes = 20ULL * 1024 * 1024;
    history.span_seconds = 2.0;

    auto detections = run(packet, history);
    ASSERT_NE(findRule(detections, "dos_burst"), nullptr);
    ASSERT_NE(findRule(detections, "data_exfiltration"), nullptr);
    EXPECT_DOUBLE_EQ(findRule(detections, "dos_burst")->confidence, 1.0);
}

TEST_F(SignatureDetectorTest, BruteForceFromFailedLoginFeature) {
    auto packet = createHttpPacket("");
    features.values[3] = 5.0;
    const Detection* brute = findRule(run(packet), "brute_force");
    ASSERT_NE(brute, nullptr);
    EXPECT_EQ(brute->severity, Severity::High);

    features.values[3] = 4.0;
    EXPECT_EQ(findRule(run(packet), "brute_force"), nullptr);
}

TEST_F(SignatureDetectorTest, InvalidPatternIsSkipped) {
    const size_t before = detector.ruleCount();

    SignatureRule broken{"broken", "Broken rule", Severity::Low, {"(unclosed"}, {RuleTarget::Payload}};
    EXPECT_FALSE(detector.addRule(broken));
    EXPECT_EQ(detector.ruleCount(), before);

    SignatureRule partial{"partial", "Partially valid rule", Severity::Low,
                          {"[bad", "needle"}, {RuleTarget::Payload}};
    EXPECT_TRUE(detector.addRule(partial));
    EXPECT_EQ(detector.ruleCount(), before + 1);

    EXPECT_NE(findRule(run(createHttpPacket("haystack with needle")), "partial"), nullptr);
}

TEST_F(SignatureDetectorTest, ScaledConfidenceIsCapped) {
    EXPECT_DOUBLE_EQ(SignatureDetector::scaledConfidence(20.0, 20.0), 0.6);
    EXPECT_DOUBLE_EQ(SignatureDetector::scaledConfidence(30.0, 20.0), 0.8);
    EXPECT_DOUBLE_EQ(SignatureDetector::scaledConfidence(1000.0, 20.0), 1.0);
}
