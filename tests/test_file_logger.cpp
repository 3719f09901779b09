#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "file_logger.hpp"
#include "file_persistence_sink.hpp"

class FileLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir = std::filesystem::temp_directory_path() /
                  ("traffic_sentinel_logs_" +
                   std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(log_dir);
        ASSERT_TRUE(logger.initialize(log_dir.string()));
        logger.start();
    }

    void TearDown() override {
        logger.stop();
        std::error_code ec;
        std::filesystem::remove_all(log_dir, ec);
    }

    std::string readFile(const std::string& name) {
        std::ifstream in(log_dir / name);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::filesystem::path log_dir;
    FileLogger logger;
};

TEST_F(FileLoggerTest, EngineLogRespectsMinimumLevel) {
    logger.set_min_level(FileLogger::LogLevel::LOG_INFO);
    FILE_LOG_DEBUG(logger, FileLogger::FileType::ENGINE_LOG, "hidden debug line");
    FILE_LOG_WARNING(logger, FileLogger::FileType::ENGINE_LOG, "visible warning line");
    ASSERT_TRUE(logger.wait_until_drained());
    logger.stop();

    std::string content = readFile("engine.log");
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.find("visible warning line"), std::string::npos);
    EXPECT_NE(content.find("test_file_logger.cpp"), std::string::npos);
}

TEST_F(FileLoggerTest, StatsFileHoldsOnlyLatestSnapshot) {
    logger.set_min_level(FileLogger::LogLevel::LOG_CRITICAL);
    logger.write_traffic_stats("total_packets:1\n");
    logger.write_traffic_stats("total_packets:2\n");
    ASSERT_TRUE(logger.wait_until_drained());
    logger.stop();

    std::string content = readFile("traffic_sentinel_stats");
    EXPECT_EQ(content.find("total_packets:1"), std::string::npos);
    EXPECT_NE(content.find("total_packets:2"), std::string::npos);
}

TEST_F(FileLoggerTest, AlertsAreAppendedThroughPersistenceSink) {
    FilePersistenceSink sink(logger);
    Alert alert;
    alert.id = "aaaabbbbccccddddaaaabbbbccccdddd";
    alert.detection.severity = Severity::High;
    alert.detection.description = "DoS packet burst detected";
    alert.created_at = std::chrono::system_clock::now();

    ASSERT_TRUE(sink.persistAlert(alert));
    alert.id = "11112222333344441111222233334444";
    ASSERT_TRUE(sink.persistAlert(alert));
    ASSERT_TRUE(logger.wait_until_drained());
    logger.stop();

    std::string content = readFile("alerts.log");
    EXPECT_NE(content.find("aaaabbbbccccddddaaaabbbbccccdddd"), std::string::npos);
    EXPECT_NE(content.find("11112222333344441111222233334444"), std::string::npos);
    EXPECT_NE(content.find("[high] DoS packet burst detected"), std::string::npos);
}

TEST_F(FileLoggerTest, MetricsCountEntries) {
    logger.write_performance_metrics("received=1 processed=1");
    ASSERT_TRUE(logger.wait_until_drained());

    auto metrics = logger.get_metrics();
    EXPECT_TRUE(metrics.is_running);
    EXPECT_GE(metrics.total_entries, 1u);
    logger.stop();
    EXPECT_FALSE(logger.is_running());
    EXPECT_NE(readFile("performance.log").find("received=1 processed=1"), std::string::npos);
}

TEST(FileLoggerLevelTest, ParsesLevelNames) {
    FileLogger::LogLevel level = FileLogger::LogLevel::LOG_INFO;
    EXPECT_TRUE(FileLogger::parse_log_level("DEBUG", level));
    EXPECT_EQ(level, FileLogger::LogLevel::LOG_DEBUG);
    EXPECT_TRUE(FileLogger::parse_log_level("warn", level));
    EXPECT_EQ(level, FileLogger::LogLevel::LOG_WARNING);
    EXPECT_FALSE(FileLogger::parse_log_level("verbose", level));
    EXPECT_EQ(level, FileLogger::LogLevel::LOG_WARNING);
}
