#include "backend/Logger.hpp"

#include "TestFiles.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace backend;

TEST(LoggerTest, FormatsTimestampAndLevel) {
    std::ostringstream sink;
    Logger logger(sink);
    logger.info("hello");

    const std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \| INFO \| hello\n)");
    EXPECT_TRUE(std::regex_match(sink.str(), pattern)) << sink.str();
}

TEST(LoggerTest, ThresholdFiltersDebug) {
    std::ostringstream sink;
    Logger logger(sink, LogLevel::Info);
    logger.debug("hidden");
    logger.warning("shown");
    EXPECT_EQ(sink.str().find("hidden"), std::string::npos);
    EXPECT_NE(sink.str().find("| WARNING | shown"), std::string::npos);

    logger.setThreshold(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_NE(sink.str().find("| DEBUG | now visible"), std::string::npos);
}

TEST(LoggerTest, IsEnabled) {
    std::ostringstream sink;
    Logger logger(sink, LogLevel::Warning);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error));
    EXPECT_EQ(logger.threshold(), LogLevel::Warning);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(toString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(toString(LogLevel::Info), "INFO");
    EXPECT_STREQ(toString(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(toString(LogLevel::Error), "ERROR");
}

TEST(LoggerTest, MirrorsToFile) {
    testing_support::ScratchDirectory scratch;
    const auto logPath = scratch.root() / "logs" / "run.log";

    std::ostringstream sink;
    Logger logger(sink);
    logger.openFile(logPath.string());
    logger.error("disk line");
    EXPECT_EQ(logger.logFilePath(), logPath.string());

    std::ifstream stream(logPath);
    const std::string contents{std::istreambuf_iterator<char>(stream),
                               std::istreambuf_iterator<char>()};
    EXPECT_NE(contents.find("| ERROR | disk line"), std::string::npos);
    EXPECT_NE(sink.str().find("| ERROR | disk line"), std::string::npos);
}

TEST(LoggerTest, OpenFileFailureThrows) {
    testing_support::ScratchDirectory scratch;
    // A directory cannot be opened as the log file.
    std::ostringstream sink;
    Logger logger(sink);
    EXPECT_THROW(logger.openFile(scratch.root().string()), std::runtime_error);
}
