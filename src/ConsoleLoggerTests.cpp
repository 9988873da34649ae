#include <gtest/gtest.h>
#include "utils/ConsoleLogger.hpp"
#include "TestSupport.hpp"

class ConsoleLoggerTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path logPath;

    void SetUp() override {
        testDir = uniqueTestDirectory("filesorter_logger");
        fs::remove_all(testDir);
        fs::create_directories(testDir);
        logPath = testDir / "file_monitor.log";
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(ConsoleLoggerTest, WritesLeveledLinesToLogFile) {
    {
        ConsoleLogger logger;
        ASSERT_TRUE(logger.setLogFile(logPath.string()));
        EXPECT_EQ(logger.getLogFile(), logPath.string());
        logger.info("Moved a to b");
        logger.warn("Unknown / unsupported file type: c");
        logger.error("Error moving file d");
    }

    std::string content = readFile(logPath);
    EXPECT_NE(content.find("[INFO] Moved a to b"), std::string::npos);
    EXPECT_NE(content.find("[WARN] Unknown / unsupported file type: c"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] Error moving file d"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, DebugIsFilteredByDefault) {
    {
        ConsoleLogger logger;
        ASSERT_TRUE(logger.setLogFile(logPath.string()));
        EXPECT_EQ(logger.getLogLevel(), LogLevel::INFO);
        logger.debug("hidden detail");
        logger.setLogLevel(LogLevel::DEBUG);
        logger.debug("visible detail");
    }

    std::string content = readFile(logPath);
    EXPECT_EQ(content.find("hidden detail"), std::string::npos);
    EXPECT_NE(content.find("[DEBUG] visible detail"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, AppendsToExistingLogFile) {
    writeFile(logPath, "previous run\n");
    {
        ConsoleLogger logger;
        ASSERT_TRUE(logger.setLogFile(logPath.string()));
        logger.info("second run");
    }

    std::string content = readFile(logPath);
    EXPECT_EQ(content.rfind("previous run", 0), 0u);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, UnwritableLogFileIsReported) {
    ConsoleLogger logger;
    EXPECT_FALSE(logger.setLogFile((testDir / "missing" / "x.log").string()));
    EXPECT_TRUE(logger.getLogFile().empty());
    EXPECT_NO_THROW(logger.info("still logs to console"));
}
