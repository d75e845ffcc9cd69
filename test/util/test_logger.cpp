#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "util/Expected.hpp"
#include "util/Logger.hpp"

using namespace promptline;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel = Logger::instance().level();
        oldCout = std::cout.rdbuf(coutCapture.rdbuf());
        oldCerr = std::cerr.rdbuf(cerrCapture.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        std::cerr.rdbuf(oldCerr);
        Logger::instance().setLevel(previousLevel);
    }

    LogLevel previousLevel{LogLevel::Info};
    std::stringstream coutCapture;
    std::stringstream cerrCapture;
    std::streambuf* oldCout{nullptr};
    std::streambuf* oldCerr{nullptr};
};

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("3"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("1"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("loud"), LogLevel::Info);
}

// Test: Nothing reaches stdout, which carries the prompt text
TEST_F(LoggerTest, AllLevelsWriteToStderr) {
    Logger::instance().setLevel(LogLevel::Debug);
    Logger::instance().error("e");
    Logger::instance().warn("w");
    Logger::instance().info("i");
    Logger::instance().debug("d");

    EXPECT_TRUE(coutCapture.str().empty());
    EXPECT_EQ(cerrCapture.str(), "[error] e\n[warn ] w\n[info ] i\n[debug] d\n");
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::instance().setLevel(LogLevel::Warn);
    Logger::instance().info("hidden");
    Logger::instance().debug("hidden");
    Logger::instance().warn("shown");

    EXPECT_EQ(cerrCapture.str(), "[warn ] shown\n");
}

TEST(ExpectedTest, ValueAndError) {
    Expected<int> ok(5);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 5);

    Expected<int> bad(Error{ErrorCode::MissingData, "gone"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::MissingData);
    EXPECT_EQ(bad.error().message, "gone");
    EXPECT_STREQ(errorCodeName(bad.error().code), "missing-data");
}
