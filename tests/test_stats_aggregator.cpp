#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "file_persistence_sink.hpp"
#include "mock_persistence_sink.hpp"
#include "stats_aggregator.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class StatsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0 = StatsAggregator::Clock::now();
        persistence = std::make_shared<RecordingPersistenceSink>();
    }

    PacketRecord createTestPacket(const std::string& src_ip, uint16_t dst_port, size_t size,
                                  Protocol protocol = Protocol::Tcp) {
        PacketRecord packet;
        packet.src_ip = src_ip;
        packet.dst_ip = "10.0.0.1";
        packet.dst_port = dst_port;
        packet.protocol = protocol;
        packet.size = size;
        return packet;
    }

    StatsAggregator::Clock::time_point t0;
    std::shared_ptr<RecordingPersistenceSink> persistence;
};

TEST_F(StatsAggregatorTest, SnapshotCountsOnePeriod) {
    StatsAggregator stats(persistence, StatsAggregatorOptions{}, t0);
    stats.setActiveConnectionsProvider([] { return size_t{7}; });

    for (int i = 0; i < 6; ++i) stats.record(createTestPacket("192.168.1.1", 80, 100));
    for (int i = 0; i < 3; ++i) stats.record(createTestPacket("192.168.1.2", 53, 200, Protocol::Udp));
    stats.record(createTestPacket("192.168.1.3", 0, 100, Protocol::Icmp));

    Detection d;
    d.kind = DetectorKind::Anomaly;
    stats.recordDetection(d);
    stats.recordDropped(4);

    auto snapshot = stats.flush(t0 + 10s);
    EXPECT_EQ(snapshot.total_packets, 10u);
    EXPECT_EQ(snapshot.total_bytes, 1300u);
    EXPECT_EQ(snapshot.dropped_packets, 4u);
    EXPECT_EQ(snapshot.active_connections, 7u);
    EXPECT_DOUBLE_EQ(snapshot.packet_rate, 1.0);
    EXPECT_DOUBLE_EQ(snapshot.byte_rate, 130.0);
    EXPECT_DOUBLE_EQ(snapshot.avg_packet_size, 130.0);
    EXPECT_EQ(snapshot.protocol_histogram.at("tcp"), 6u);
    EXPECT_EQ(snapshot.protocol_histogram.at("udp"), 3u);
    EXPECT_EQ(snapshot.protocol_histogram.at("icmp"), 1u);
    EXPECT_EQ(snapshot.protocol_histogram.count("other"), 0u);
    EXPECT_EQ(snapshot.detection_count[kindIndex(DetectorKind::Anomaly)], 1u);

    ASSERT_FALSE(snapshot.top_sources.empty());
    EXPECT_EQ(snapshot.top_sources[0].first, "192.168.1.1");
    EXPECT_EQ(snapshot.top_sources[0].second, 6u);
    ASSERT_EQ(snapshot.top_dst_ports.size(), 2u);
    EXPECT_EQ(snapshot.top_dst_ports[0].first, 80);

    ASSERT_EQ(persistence->snapshots().size(), 1u);
}

TEST_F(StatsAggregatorTest, FlushStartsNewPeriod) {
    StatsAggregator stats(persistence, StatsAggregatorOptions{}, t0);
    stats.record(createTestPacket("192.168.1.1", 80, 100));
    stats.flush(t0 + 60s);

    stats.record(createTestPacket("192.168.1.1", 80, 100));
    auto second = stats.flush(t0 + 120s);
    EXPECT_EQ(second.total_packets, 1u);
    EXPECT_EQ(second.period_start, t0 + 60s);
    EXPECT_EQ(second.period_end, t0 + 120s);
    EXPECT_EQ(stats.flushCount(), 2u);
    EXPECT_EQ(stats.recentSnapshots().size(), 2u);
}

TEST_F(StatsAggregatorTest, ShortPeriodRateUsesOneSecond) {
    StatsAggregator stats(persistence, StatsAggregatorOptions{}, t0);
    for (int i = 0; i < 5; ++i) stats.record(createTestPacket("192.168.1.1", 80, 10));
    auto snapshot = stats.flush(t0);
    EXPECT_DOUBLE_EQ(snapshot.packet_rate, 5.0);

    auto empty = stats.flush(t0 + 1s);
    EXPECT_EQ(empty.total_packets, 0u);
    EXPECT_DOUBLE_EQ(empty.avg_packet_size, 0.0);
}

TEST_F(StatsAggregatorTest, TopTalkersAreBounded) {
    StatsAggregatorOptions options;
    options.top_talkers = 3;
    StatsAggregator stats(persistence, options, t0);
    for (int i = 0; i < 20; ++i) {
        for (int j = 0; j <= i; ++j) {
            stats.record(createTestPacket("10.1.0." + std::to_string(i), static_cast<uint16_t>(1000 + i), 60));
        }
    }
    auto snapshot = stats.flush(t0 + 1s);
    ASSERT_EQ(snapshot.top_sources.size(), 3u);
    EXPECT_EQ(snapshot.top_sources[0].first, "10.1.0.19");
    EXPECT_EQ(snapshot.top_dst_ports[2].first, 1017);
}

TEST_F(StatsAggregatorTest, FailedPersistenceKeepsSnapshot) {
    auto failing = std::make_shared<NiceMock<MockPersistenceSink>>();
    EXPECT_CALL(*failing, persistSnapshot(_)).Times(3).WillRepeatedly(Return(false));

    StatsAggregator stats(failing, StatsAggregatorOptions{}, t0);
    stats.record(createTestPacket("192.168.1.1", 80, 100));
    stats.flush(t0 + 60s);

    EXPECT_EQ(stats.persistenceFailures(), 1u);
    ASSERT_EQ(stats.recentSnapshots().size(), 1u);
    EXPECT_EQ(stats.recentSnapshots()[0].total_packets, 1u);
}

TEST_F(StatsAggregatorTest, StatsFileFormatIsKeyValue) {
    StatsAggregator stats(persistence, StatsAggregatorOptions{}, t0);
    stats.record(createTestPacket("192.168.1.1", 443, 1500));
    auto snapshot = stats.flush(t0 + 60s);

    std::string text = FilePersistenceSink::formatSnapshot(snapshot);
    EXPECT_NE(text.find("total_packets:1\n"), std::string::npos);
    EXPECT_NE(text.find("total_bytes:1500\n"), std::string::npos);
    EXPECT_NE(text.find("protocol_tcp:1\n"), std::string::npos);
    EXPECT_NE(text.find("detections_signature:0\n"), std::string::npos);
    EXPECT_NE(text.find("top_source_1:192.168.1.1"), std::string::npos);
}
