#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "detection_coordinator.hpp"
#include "sentinel_config.hpp"

using namespace detection;
using namespace std::chrono_literals;

namespace {

class FixedDetector : public BaseDetector {
public:
    FixedDetector(DetectorKind kind, std::string rule_id)
        : BaseDetector("fixed_" + rule_id, kind), rule_id_(std::move(rule_id)) {}

    std::vector<Detection> detect(const DetectionInput& input) override {
        calls.fetch_add(1);
        Detection d;
        d.kind = kind();
        d.severity = Severity::Medium;
        d.confidence = 0.8;
        d.rule_id = rule_id_;
        d.description = "Fixed verdict " + rule_id_;
        attachFlow(d, input.packet);
        return {d};
    }

    std::atomic<int> calls{0};

private:
    std::string rule_id_;
};

class ThrowingDetector : public BaseDetector {
public:
    explicit ThrowingDetector(DetectorKind kind) : BaseDetector("throwing", kind) {}

    std::vector<Detection> detect(const DetectionInput&) override {
        throw std::runtime_error("model exploded");
    }
};

class SlowDetector : public BaseDetector {
public:
    SlowDetector(DetectorKind kind, std::chrono::milliseconds delay)
        : BaseDetector("slow", kind), delay_(delay) {}

    std::vector<Detection> detect(const DetectionInput& input) override {
        std::this_thread::sleep_for(delay_);
        Detection d;
        d.kind = kind();
        d.rule_id = "late";
        attachFlow(d, input.packet);
        return {d};
    }

private:
    std::chrono::milliseconds delay_;
};

} // namespace

class DetectionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor = std::make_shared<DetectorExecutor>(2);
    }

    void TearDown() override {
        executor->shutdown();
    }

    std::unique_ptr<DetectionCoordinator> makeCoordinator(DetectorSet detectors,
                                                          std::chrono::milliseconds timeout = 500ms,
                                                          bool with_executor = true) {
        return std::make_unique<DetectionCoordinator>(FeatureExtractor(), trackers, history,
                                                      std::move(detectors),
                                                      with_executor ? executor : nullptr, timeout);
    }

    PacketRecord createTestPacket() {
        PacketRecord packet;
        packet.timestamp = std::chrono::system_clock::now();
        packet.src_ip = "192.168.1.77";
        packet.dst_ip = "10.0.0.1";
        packet.dst_port = 80;
        packet.protocol = Protocol::Tcp;
        packet.size = 200;
        return packet;
    }

    SentinelConfig config;
    FeatureTrackers trackers{config};
    SourceHistoryTracker history{10s, 1000, 1000};
    std::shared_ptr<DetectorExecutor> executor;
};

TEST_F(DetectionCoordinatorTest, MergesAllLayersUnderOneCorrelationId) {
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Signature, "sig"),
                                        std::make_shared<FixedDetector>(DetectorKind::Anomaly, "ano"),
                                        std::make_shared<FixedDetector>(DetectorKind::Classification, "cls")});

    auto first = coordinator->analyze(createTestPacket());
    ASSERT_EQ(first.size(), 3u);
    const uint64_t id = first[0].correlation_id;
    EXPECT_NE(id, 0u);
    for (const auto& d : first) {
        EXPECT_EQ(d.correlation_id, id);
        EXPECT_EQ(d.src_ip, "192.168.1.77");
    }

    auto second = coordinator->analyze(createTestPacket());
    ASSERT_EQ(second.size(), 3u);
    EXPECT_NE(second[0].correlation_id, id);

    auto metrics = coordinator->metrics();
    EXPECT_EQ(metrics.analyzed, 2u);
    EXPECT_EQ(metrics.detections[kindIndex(DetectorKind::Anomaly)], 2u);
}

TEST_F(DetectionCoordinatorTest, ThrowingDetectorIsIsolated) {
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Signature, "sig"),
                                        std::make_shared<ThrowingDetector>(DetectorKind::Anomaly),
                                        std::make_shared<FixedDetector>(DetectorKind::Classification, "cls")});

    std::vector<Detection> detections;
    EXPECT_NO_THROW(detections = coordinator->analyze(createTestPacket()));
    ASSERT_EQ(detections.size(), 2u);

    auto metrics = coordinator->metrics();
    EXPECT_EQ(metrics.detector_failures[kindIndex(DetectorKind::Anomaly)], 1u);
    EXPECT_EQ(metrics.detector_failures[kindIndex(DetectorKind::Signature)], 0u);
}

TEST_F(DetectionCoordinatorTest, ThrowingSignatureLayerIsIsolated) {
    auto coordinator = makeCoordinator({std::make_shared<ThrowingDetector>(DetectorKind::Signature),
                                        nullptr,
                                        std::make_shared<FixedDetector>(DetectorKind::Classification, "cls")});

    auto detections = coordinator->analyze(createTestPacket());
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].kind, DetectorKind::Classification);
    EXPECT_EQ(coordinator->metrics().detector_failures[kindIndex(DetectorKind::Signature)], 1u);
}

TEST_F(DetectionCoordinatorTest, SlowDetectorTimesOut) {
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Signature, "sig"),
                                        nullptr,
                                        std::make_shared<SlowDetector>(DetectorKind::Classification, 300ms)},
                                       20ms);

    auto detections = coordinator->analyze(createTestPacket());
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].rule_id, "sig");
    EXPECT_EQ(coordinator->metrics().detector_timeouts[kindIndex(DetectorKind::Classification)], 1u);
}

TEST_F(DetectionCoordinatorTest, DisabledDetectorIsSkipped) {
    auto anomaly = std::make_shared<FixedDetector>(DetectorKind::Anomaly, "ano");
    anomaly->setEnabled(false);
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Signature, "sig"),
                                        anomaly, nullptr});

    EXPECT_EQ(coordinator->analyze(createTestPacket()).size(), 1u);
    EXPECT_EQ(anomaly->calls.load(), 0);
}

TEST_F(DetectionCoordinatorTest, RunsInlineWithoutExecutor) {
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Signature, "sig"),
                                        std::make_shared<FixedDetector>(DetectorKind::Anomaly, "ano"),
                                        nullptr},
                                       20ms, false);

    EXPECT_EQ(coordinator->analyze(createTestPacket()).size(), 2u);
}

TEST_F(DetectionCoordinatorTest, DetectorInWrongSlotIsIgnored) {
    auto coordinator = makeCoordinator({std::make_shared<FixedDetector>(DetectorKind::Anomaly, "misplaced"),
                                        nullptr, nullptr});

    EXPECT_EQ(coordinator->detector(DetectorKind::Signature), nullptr);
    EXPECT_TRUE(coordinator->analyze(createTestPacket()).empty());
}

TEST_F(DetectionCoordinatorTest, FeedsSourceHistory) {
    auto coordinator = makeCoordinator({nullptr, nullptr, nullptr});
    auto packet = createTestPacket();
    coordinator->analyze(packet);
    coordinator->analyze(packet);

    EXPECT_EQ(history.summarize(packet.src_ip, packet.timestamp).packet_count, 2u);
    EXPECT_EQ(trackers.connections().activeCount(), 1u);
}

TEST(DetectorExecutorTest, SubmitAfterShutdownGivesInvalidFuture) {
    DetectorExecutor executor(1);
    auto ok = executor.submit([] { return std::vector<Detection>(1); });
    ASSERT_TRUE(ok.valid());
    EXPECT_EQ(ok.get().size(), 1u);

    executor.shutdown();
    EXPECT_FALSE(executor.submit([] { return std::vector<Detection>{}; }).valid());
}

TEST_F(DetectionCoordinatorTest, SlowModelLayerKeepsExecutorBacklogBounded) {
    auto coordinator = makeCoordinator({nullptr, nullptr,
                                        std::make_shared<SlowDetector>(DetectorKind::Classification, 10ms)},
                                       2ms);

    size_t max_backlog = 0;
    for (int i = 0; i < 400; ++i) {
        coordinator->analyze(createTestPacket());
        max_backlog = std::max(max_backlog, executor->pendingTasks());
    }

    EXPECT_LE(max_backlog, executor->maxPending());
    const auto metrics = coordinator->metrics();
    const size_t index = kindIndex(DetectorKind::Classification);
    EXPECT_EQ(metrics.detector_timeouts[index] + metrics.detector_skipped[index], 400u);

    // Stale work is dropped rather than run, so shutdown stays quick
    const auto started = std::chrono::steady_clock::now();
    executor->shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
    EXPECT_GT(executor->expiredTasks() + executor->rejectedTasks(), 0u);
}

class DetectorExecutorCapacityTest : public ::testing::Test {
protected:
    // Occupies the single worker until release() is called
    void blockWorker(DetectorExecutor& executor) {
        blocker = executor.submit([this] {
            started.store(true);
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return released; });
            return std::vector<Detection>{};
        });
        while (!started.load()) {
            std::this_thread::sleep_for(1ms);
        }
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            released = true;
        }
        cv.notify_all();
    }

    std::future<std::vector<Detection>> blocker;
    std::atomic<bool> started{false};
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
};

TEST_F(DetectorExecutorCapacityTest, FullQueueRefusesSubmit) {
    DetectorExecutor executor(1, 2);
    blockWorker(executor);

    EXPECT_TRUE(executor.submit([] { return std::vector<Detection>{}; }).valid());
    EXPECT_TRUE(executor.submit([] { return std::vector<Detection>{}; }).valid());
    EXPECT_FALSE(executor.submit([] { return std::vector<Detection>{}; }).valid());
    EXPECT_EQ(executor.pendingTasks(), 2u);
    EXPECT_EQ(executor.rejectedTasks(), 1u);

    release();
    executor.shutdown();
    EXPECT_EQ(executor.pendingTasks(), 0u);
}

TEST_F(DetectorExecutorCapacityTest, ExpiredTaskIsDroppedWithoutRunning) {
    DetectorExecutor executor(1, 4);
    blockWorker(executor);

    std::atomic<bool> ran{false};
    auto late = executor.submit([&ran] {
        ran.store(true);
        return std::vector<Detection>{};
    }, std::chrono::steady_clock::now() + 1ms);
    ASSERT_TRUE(late.valid());

    std::this_thread::sleep_for(20ms);
    release();
    executor.shutdown();

    EXPECT_FALSE(ran.load());
    EXPECT_EQ(executor.expiredTasks(), 1u);
    EXPECT_THROW(late.get(), std::future_error);
}
