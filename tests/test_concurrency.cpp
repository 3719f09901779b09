#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "mock_persistence_sink.hpp"
#include "periodic_task.hpp"
#include "pipeline.hpp"
#include "stats_aggregator.hpp"

using namespace std::chrono_literals;

class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.pipeline.worker_count = 4;
        config.pipeline.queue_capacity = 100000;
        config.detection.min_anomaly_samples = 50;
        config.detection.anomaly_sample_buffer_size = 500;
        config.detection.anomaly_trees = 20;
        config.detection.anomaly_subsample_size = 32;
        config.detection.detector_timeout_ms = 500;
        persistence = std::make_shared<RecordingPersistenceSink>();
        pipeline = std::make_unique<Pipeline>(config, persistence);
    }

    void TearDown() override {
        pipeline.reset();
    }

    PacketRecord createTestPacket(const std::string& src_ip, uint16_t dst_port) {
        PacketRecord packet;
        packet.timestamp = std::chrono::system_clock::now();
        packet.src_ip = src_ip;
        packet.dst_ip = "10.0.0.1";
        packet.src_port = 40000;
        packet.dst_port = dst_port;
        packet.protocol = Protocol::Tcp;
        packet.tcp_flags = tcp_flags::SYN;
        packet.size = 60;
        return packet;
    }

    SentinelConfig config;
    std::shared_ptr<RecordingPersistenceSink> persistence;
    std::unique_ptr<Pipeline> pipeline;
};

TEST_F(ConcurrencyTest, ConcurrentSubmitAndMaintenance) {
    pipeline->start();
    std::atomic<bool> test_running{true};
    std::atomic<uint64_t> submitted{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&, i]() {
            for (int n = 0; n < 2000; ++n) {
                if (pipeline->submit(createTestPacket("192.168.1." + std::to_string(100 + i),
                                                      static_cast<uint16_t>(1 + n % 40)))) {
                    submitted.fetch_add(1);
                }
            }
        });
    }

    // Sweeps, metrics and stats flushes race with the workers
    threads.emplace_back([&]() {
        while (test_running.load()) {
            pipeline->runMaintenance(SentinelClock::now());
            pipeline->metrics();
            pipeline->stats().flush();
            pipeline->alertSink().activeAlerts();
            std::this_thread::sleep_for(1ms);
        }
    });

    for (size_t i = 0; i < 4; ++i) {
        threads[i].join();
    }
    test_running.store(false);
    threads.back().join();

    pipeline->shutdown();
    auto metrics = pipeline->metrics();
    EXPECT_EQ(metrics.processed, submitted.load());
    EXPECT_EQ(metrics.processed + metrics.dropped(), metrics.received);
    EXPECT_EQ(metrics.processing_errors, 0u);
}

TEST_F(ConcurrencyTest, RetrainWhileScoring) {
    for (int i = 0; i < 60; ++i) {
        pipeline->processNow(createTestPacket("172.16.0." + std::to_string(i % 10), 443));
    }
    // Training runs on the detector executor
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (pipeline->anomalyDetector().state() != detection::AnomalyState::Trained &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(pipeline->anomalyDetector().state(), detection::AnomalyState::Trained);

    std::atomic<bool> test_running{true};
    std::thread retrainer([&]() {
        while (test_running.load()) {
            pipeline->anomalyDetector().retrain();
        }
    });

    for (int i = 0; i < 500; ++i) {
        EXPECT_NO_THROW(pipeline->processNow(createTestPacket("172.16.1." + std::to_string(i % 10), 443)));
    }
    test_running.store(false);
    retrainer.join();

    EXPECT_GE(pipeline->anomalyDetector().trainingCount(), 1u);
    EXPECT_EQ(pipeline->anomalyDetector().state(), detection::AnomalyState::Trained);
}

TEST_F(ConcurrencyTest, ConcurrentAlertSubmissionDeduplicates) {
    std::vector<std::thread> threads;
    Detection d;
    d.kind = DetectorKind::Signature;
    d.description = "Port scan detected";
    d.src_ip = "192.168.9.9";
    const auto now = AlertSink::Clock::now();

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int n = 0; n < 250; ++n) {
                pipeline->alertSink().submit(d, now);
            }
        });
    }
    for (auto& t : threads) t.join();
    ASSERT_TRUE(pipeline->alertSink().flush());

    auto metrics = pipeline->alertSink().metrics();
    EXPECT_EQ(metrics.new_alerts, 1u);
    EXPECT_EQ(metrics.deduplicated, 1999u);
    EXPECT_EQ(persistence->alerts().size(), 1u);
}

TEST(PeriodicTaskTest, RunsUntilStopped) {
    std::atomic<int> runs{0};
    PeriodicTask task("test-tick", 10ms, [&]() { runs.fetch_add(1); });
    task.start();
    std::this_thread::sleep_for(100ms);
    task.stop();

    const int observed = runs.load();
    EXPECT_GE(observed, 2);
    EXPECT_FALSE(task.isRunning());
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(runs.load(), observed);
}

TEST(PeriodicTaskTest, FailuresAreCountedAndStopIsPrompt) {
    PeriodicTask task("failing", 5ms, []() { throw std::runtime_error("boom"); });
    task.start();
    std::this_thread::sleep_for(50ms);

    const auto before = std::chrono::steady_clock::now();
    task.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
    EXPECT_GE(task.failureCount(), 1u);
}

TEST(StatsAggregatorConcurrencyTest, FlushWhileRecordingLosesNoPackets) {
    auto persistence = std::make_shared<RecordingPersistenceSink>();
    StatsAggregator stats(persistence);

    constexpr int kThreads = 4;
    constexpr int kPacketsPerThread = 5000;
    std::atomic<bool> recording{true};
    std::atomic<int> flushes{0};

    std::thread flusher([&]() {
        while (recording.load()) {
            stats.flush();
            flushes.fetch_add(1);
            std::this_thread::sleep_for(1ms);
        }
    });

    std::vector<std::thread> recorders;
    for (int t = 0; t < kThreads; ++t) {
        recorders.emplace_back([&, t]() {
            PacketRecord packet;
            packet.src_ip = "192.168.2." + std::to_string(10 + t);
            packet.dst_ip = "10.0.0.1";
            packet.dst_port = 443;
            packet.protocol = Protocol::Tcp;
            packet.size = 100;
            for (int n = 0; n < kPacketsPerThread; ++n) {
                stats.record(packet);
            }
        });
    }
    for (auto& recorder : recorders) {
        recorder.join();
    }
    recording.store(false);
    flusher.join();
    stats.flush();

    uint64_t total_packets = 0;
    uint64_t total_bytes = 0;
    for (const auto& snapshot : persistence->snapshots()) {
        total_packets += snapshot.total_packets;
        total_bytes += snapshot.total_bytes;
    }
    EXPECT_EQ(total_packets, static_cast<uint64_t>(kThreads) * kPacketsPerThread);
    EXPECT_EQ(total_bytes, static_cast<uint64_t>(kThreads) * kPacketsPerThread * 100);
    EXPECT_EQ(persistence->snapshots().size(), static_cast<size_t>(flushes.load() + 1));
}
