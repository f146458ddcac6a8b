// EN: Unit tests for the NDJSON logger.
// FR: Tests unitaires du logger NDJSON.

#include <gtest/gtest.h>
#include "test_support.hpp"
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/logging/logger.hpp"

using namespace CIP;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() / ("cip_logger_" + testName() + ".ndjson");
        std::filesystem::remove(log_path_);

        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setCorrelationId("");
        logger.clearGlobalMetadata();
        ASSERT_TRUE(logger.setOutputFile(log_path_.string()));
        logger.setConsoleOutput(false);
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.setOutputFile("");
        logger.setConsoleOutput(true);
        logger.setLogLevel(LogLevel::INFO);
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        std::filesystem::remove(log_path_);
    }

    std::vector<nlohmann::json> readLines() {
        Logger::getInstance().flush();
        std::vector<nlohmann::json> lines;
        std::ifstream in(log_path_);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(nlohmann::json::parse(line));
            }
        }
        return lines;
    }

    std::filesystem::path log_path_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("scheduler", "Running pipeline 'Rust'");
    LOG_ERROR("job", "Job fmt failed at step 2");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"], "INFO");
    EXPECT_EQ(lines[0]["module"], "scheduler");
    EXPECT_EQ(lines[0]["message"], "Running pipeline 'Rust'");
    EXPECT_TRUE(lines[0].contains("timestamp"));
    EXPECT_TRUE(lines[0].contains("thread_id"));
    EXPECT_EQ(lines[1]["level"], "ERROR");
}

TEST_F(LoggerTest, FiltersBelowConfiguredLevel) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);
    LOG_DEBUG("test", "hidden");
    LOG_INFO("test", "hidden");
    LOG_WARN("test", "shown");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["message"], "shown");
}

TEST_F(LoggerTest, MessagesWithQuotesAndNewlinesStayValid) {
    LOG_WARN("step", "Command \"cargo fmt\" printed\nDiff in src/main.rs");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["message"], "Command \"cargo fmt\" printed\nDiff in src/main.rs");
}

TEST_F(LoggerTest, IncludesCorrelationAndMetadata) {
    auto& logger = Logger::getInstance();
    logger.setCorrelationId("run-1234");
    logger.addGlobalMetadata("pipeline", "Rust");

    std::unordered_map<std::string, std::string> metadata{{"job", "test"}, {"level", "ignored"}};
    LOG_INFO_META("job", "Starting job test", metadata);

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["correlation_id"], "run-1234");
    EXPECT_EQ(lines[0]["pipeline"], "Rust");
    EXPECT_EQ(lines[0]["job"], "test");
    EXPECT_EQ(lines[0]["level"], "INFO");
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("concurrency", "thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(readLines().size(), 200u);
}

TEST(LoggerUtilsTest, GeneratesDistinctCorrelationIds) {
    auto& logger = Logger::getInstance();
    const std::string first = logger.generateCorrelationId();
    const std::string second = logger.generateCorrelationId();

    EXPECT_EQ(first.size(), 36u);
    EXPECT_EQ(first[8], '-');
    EXPECT_NE(first, second);
}

TEST(LoggerUtilsTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
}
