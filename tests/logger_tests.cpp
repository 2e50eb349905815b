#include "gtest/gtest.h"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using chunkvault::testing::ScratchDir;
using chunkvault::testing::readFile;

namespace {

std::vector<nlohmann::json> readRecords(const std::filesystem::path& path) {
    std::vector<nlohmann::json> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) records.push_back(nlohmann::json::parse(line));
    }
    return records;
}

} // namespace

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Point the singleton back at the suite log so scratch files can be removed.
        Logger::init(chunkvault::logsDir() + "/chunkvault_tests.log", LogLevel::DEBUG);
    }

    ScratchDir dir_;
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const auto logFile = dir_.path() / "level_filter.log";
    ASSERT_NO_THROW(Logger::init(logFile.string(), LogLevel::INFO));
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message.");
    logger.log(LogLevel::DEBUG, "This is a debug message.");
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");
    logger.log(LogLevel::FATAL, "This is a fatal message.");

    auto records = readRecords(logFile);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0]["level"], "INFO");
    EXPECT_EQ(records[3]["level"], "FATAL");
    EXPECT_EQ(readFile(logFile).find("debug message"), std::string::npos);
}

TEST_F(LoggerTest, JsonRecordCarriesFields) {
    const auto logFile = dir_.path() / "fields.log";
    ASSERT_NO_THROW(Logger::init(logFile.string(), LogLevel::DEBUG));
    Logger::getInstance().log(LogLevel::WARN, "Chunk rejected: quote \" and newline \n",
                              {{"tenant", "alice"}, {"index", "3"}});
    Logger::getInstance().log(LogLevel::INFO, "plain");

    auto records = readRecords(logFile);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["level"], "WARN");
    EXPECT_EQ(records[0]["message"], "Chunk rejected: quote \" and newline \n");
    EXPECT_EQ(records[0]["fields"]["tenant"], "alice");
    EXPECT_EQ(records[0]["fields"]["index"], "3");
    EXPECT_TRUE(records[0].contains("timestamp"));
    EXPECT_FALSE(records[1].contains("fields"));
}

TEST_F(LoggerTest, InvalidUtf8DoesNotThrow) {
    const auto logFile = dir_.path() / "utf8.log";
    ASSERT_NO_THROW(Logger::init(logFile.string(), LogLevel::DEBUG));
    EXPECT_NO_THROW(Logger::getInstance().log(LogLevel::INFO, std::string("bad \xff\xfe name")));
    EXPECT_EQ(readRecords(logFile).size(), 1u);
}

TEST_F(LoggerTest, LogRotation) {
    const auto logFile = dir_.path() / "rotation.log";
    const std::string base = logFile.string();
    ASSERT_NO_THROW(Logger::init(base, LogLevel::DEBUG, 1024, 2));

    const std::string message(800, 'r');
    for (int i = 0; i < 6; ++i) {
        Logger::getInstance().log(LogLevel::INFO, message + " #" + std::to_string(i));
    }
    // Release the handle before inspecting the files.
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);

    EXPECT_TRUE(std::filesystem::exists(base));
    EXPECT_TRUE(std::filesystem::exists(base + ".1"));
    EXPECT_TRUE(std::filesystem::exists(base + ".2"));
    EXPECT_FALSE(std::filesystem::exists(base + ".3"));
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const auto logFile = dir_.path() / "no_backup.log";
    const std::string base = logFile.string();
    ASSERT_NO_THROW(Logger::init(base, LogLevel::DEBUG, 512, 0));
    const std::string message(300, 'n');
    for (int i = 0; i < 5; ++i) {
        Logger::getInstance().log(LogLevel::INFO, message);
    }
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);

    EXPECT_TRUE(std::filesystem::exists(base));
    EXPECT_FALSE(std::filesystem::exists(base + ".1"));
}

TEST_F(LoggerTest, ReinitializationSwitchesFileAndLevel) {
    const auto first = dir_.path() / "reinit1.log";
    const auto second = dir_.path() / "reinit2.log";
    ASSERT_NO_THROW(Logger::init(first.string(), LogLevel::INFO));
    Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

    ASSERT_NO_THROW(Logger::init(second.string(), LogLevel::WARN));
    EXPECT_EQ(Logger::getInstance().logLevel(), LogLevel::WARN);
    Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
    Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");

    const std::string contents1 = readFile(first);
    const std::string contents2 = readFile(second);
    EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
    EXPECT_EQ(contents1.find("logfile2"), std::string::npos);
    EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Info message"), std::string::npos);
}

TEST_F(LoggerTest, TraceHelperFormats) {
    const auto logFile = dir_.path() / "trace.log";
    ASSERT_NO_THROW(Logger::init(logFile.string(), LogLevel::TRACE));
    Logger::trace("swept %d sessions in %s", 3, "pass");
    auto records = readRecords(logFile);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["level"], "TRACE");
    EXPECT_EQ(records[0]["message"], "swept 3 sessions in pass");
}
