#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "classification_detector.hpp"

using namespace detection;

namespace {

// packet_size <= 1000 -> benign leaf; otherwise split on protocol_type:
// TCP lands on a weak malicious leaf, anything above 1.5 on a strong one
const char* kModel =
    "random_forest v1\n"
    "features 6 packet_size protocol_type connection_duration failed_login_attempts "
    "data_transfer_rate access_frequency\n"
    "threshold 0.5\n"
    "trees 1\n"
    "tree 5\n"
    "0 0 1000 1 2 0 0\n"
    "1 -1 0 -1 -1 0.9 0.1\n"
    "2 1 1.5 3 4 0 0\n"
    "3 -1 0 -1 -1 0.4 0.6\n"
    "4 -1 0 -1 -1 0.05 0.95\n";

} // namespace

class ClassificationDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("traffic_sentinel_rf_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
        model_path = (dir / "model.rf").string();
        writeFile(model_path, kModel);
        packet.src_ip = "203.0.113.9";
        packet.dst_ip = "10.0.0.1";
        packet.protocol = Protocol::Udp;
        packet.timestamp = std::chrono::system_clock::now();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    static void writeFile(const std::string& path, const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    static FeatureVector vector(double packet_size, double protocol, size_t width = 6) {
        FeatureVector fv;
        fv.values.assign(width, 0.0);
        fv.names.assign(width, "f");
        if (width > 0) fv.values[0] = packet_size;
        if (width > 1) fv.values[1] = protocol;
        return fv;
    }

    std::filesystem::path dir;
    std::string model_path;
    PacketRecord packet;
};

TEST_F(ClassificationDetectorTest, UnavailableWithoutModel) {
    ClassificationDetector detector;
    EXPECT_FALSE(detector.hasModel());

    auto result = detector.classify(vector(5000, 2));
    EXPECT_EQ(result.status, ClassificationStatus::Unavailable);
    EXPECT_EQ(result.label, labels::UNAVAILABLE);
    EXPECT_FALSE(result.isMalicious());

    HistorySummary history;
    FeatureVector fv = vector(5000, 2);
    EXPECT_TRUE(detector.detect(DetectionInput{packet, fv, history}).empty());
}

TEST_F(ClassificationDetectorTest, ClassifiesWithLoadedModel) {
    ClassificationDetector detector(0.7);
    ASSERT_TRUE(detector.loadModel(model_path));
    EXPECT_EQ(detector.modelFeatureCount(), 6u);

    auto benign = detector.classify(vector(400, 1));
    EXPECT_TRUE(benign.available());
    EXPECT_EQ(benign.label, labels::BENIGN);
    EXPECT_DOUBLE_EQ(benign.confidence, 0.9);

    auto malicious = detector.classify(vector(5000, 2));
    EXPECT_TRUE(malicious.isMalicious());
    EXPECT_DOUBLE_EQ(malicious.confidence, 0.95);
}

TEST_F(ClassificationDetectorTest, LowConfidenceIsReportedBenign) {
    ClassificationDetector detector(0.7);
    ASSERT_TRUE(detector.loadModel(model_path));

    auto result = detector.classify(vector(5000, 1));
    EXPECT_TRUE(result.available());
    EXPECT_EQ(result.label, labels::BENIGN);
    EXPECT_DOUBLE_EQ(result.confidence, 0.6);
}

TEST_F(ClassificationDetectorTest, MismatchedWidthNeverThrows) {
    ClassificationDetector detector;
    ASSERT_TRUE(detector.loadModel(model_path));

    ClassificationResult shorter;
    EXPECT_NO_THROW(shorter = detector.classify(vector(5000, 2, 2)));
    EXPECT_TRUE(shorter.isMalicious());
    EXPECT_EQ(shorter.input_features, 2u);
    EXPECT_EQ(shorter.model_features, 6u);

    ClassificationResult longer;
    EXPECT_NO_THROW(longer = detector.classify(vector(5000, 2, 10)));
    EXPECT_TRUE(longer.isMalicious());

    ClassificationResult empty;
    EXPECT_NO_THROW(empty = detector.classify(FeatureVector{}));
    EXPECT_EQ(empty.label, labels::BENIGN);
}

TEST_F(ClassificationDetectorTest, AlignFeaturesPadsAndTruncates) {
    EXPECT_EQ(ClassificationDetector::alignFeatures({1, 2}, 4), (std::vector<double>{1, 2, 0, 0}));
    EXPECT_EQ(ClassificationDetector::alignFeatures({1, 2, 3, 4, 5}, 3), (std::vector<double>{1, 2, 3}));
    EXPECT_TRUE(ClassificationDetector::alignFeatures({1, 2}, 0).empty());
}

TEST_F(ClassificationDetectorTest, DetectionForMaliciousVerdict) {
    ClassificationDetector detector(0.7, model_path);
    ASSERT_TRUE(detector.reload());

    HistorySummary history;
    FeatureVector fv = vector(5000, 2);
    auto detections = detector.detect(DetectionInput{packet, fv, history});
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].kind, DetectorKind::Classification);
    EXPECT_EQ(detections[0].severity, Severity::High);
    EXPECT_EQ(detections[0].rule_id, "random_forest");
    EXPECT_EQ(detections[0].src_ip, "203.0.113.9");

    FeatureVector weak = vector(5000, 1);
    EXPECT_TRUE(detector.detect(DetectionInput{packet, weak, history}).empty());
}

TEST_F(ClassificationDetectorTest, FailedReloadKeepsPreviousModel) {
    ClassificationDetector detector(0.7, model_path);
    ASSERT_TRUE(detector.reload());

    writeFile(model_path, "random_forest v1\nfeatures 0\n");
    EXPECT_FALSE(detector.reload());
    EXPECT_TRUE(detector.hasModel());
    EXPECT_TRUE(detector.classify(vector(5000, 2)).isMalicious());

    EXPECT_FALSE(detector.loadModel((dir / "missing.rf").string()));
    EXPECT_TRUE(detector.hasModel());
}

TEST(RandomForestModelTest, RejectsMalformedArtifacts) {
    RandomForestModel model;
    std::istringstream bad_header("gradient_boost v1\n");
    EXPECT_FALSE(model.read(bad_header));

    // Child index pointing backwards would loop
    std::istringstream cyclic("random_forest v1\nfeatures 1 x\nthreshold 0.5\ntrees 1\ntree 2\n"
                              "0 0 1.0 0 1 0 0\n1 -1 0 -1 -1 0.5 0.5\n");
    EXPECT_FALSE(model.read(cyclic));

    std::istringstream bad_threshold("random_forest v1\nfeatures 1 x\nthreshold 1.5\n");
    EXPECT_FALSE(model.read(bad_threshold));
}
