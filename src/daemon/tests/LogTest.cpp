/*
 * bctd — Logger tests
 * (c) 2025 bctd contributors
 */

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "include/Log.hpp"

namespace bct {
namespace {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp_.isValid());
        logPath_ = tmp_.file("logs/bctd.log");
    }

    void TearDown() override {
        auto& log = Logger::instance();
        log.init("", LogLevel::Info, true);
        log.enableRotation(5 * 1024 * 1024, 5);
    }

    test::ScopedTempDir tmp_;
    std::string logPath_;
};

TEST_F(LogTest, WritesTaggedLinesToFile) {
    auto& log = Logger::instance();
    log.init(logPath_, LogLevel::Info, false);
    LOG_INFO("request '%s': applied %s", "40..80", "40..80");
    LOG_WARN("rejected: %d", 7);
    LOG_DEBUG("hidden at info level");
    log.shutdown();

    const std::string content = test::readFile(logPath_);
    EXPECT_NE(std::string::npos, content.find("[I] [INFO] request '40..80': applied 40..80\n"));
    EXPECT_NE(std::string::npos, content.find("[W] [WARN] rejected: 7\n"));
    EXPECT_EQ(std::string::npos, content.find("hidden"));
}

TEST_F(LogTest, DebugLevelShowsDebug) {
    auto& log = Logger::instance();
    log.init(logPath_, LogLevel::Debug, false);
    EXPECT_EQ(LogLevel::Debug, log.level());
    LOG_DEBUG("now visible");
    LOG_TRACE("still hidden");
    log.shutdown();

    const std::string content = test::readFile(logPath_);
    EXPECT_NE(std::string::npos, content.find("[D] [DEBUG] now visible"));
    EXPECT_EQ(std::string::npos, content.find("still hidden"));
}

TEST_F(LogTest, RotatesBySize) {
    auto& log = Logger::instance();
    log.init(logPath_, LogLevel::Info, false);
    log.enableRotation(256, 2);
    for (int i = 0; i < 40; ++i) {
        LOG_INFO("line %02d padding padding padding", i);
    }
    log.shutdown();

    EXPECT_TRUE(std::filesystem::exists(logPath_));
    EXPECT_TRUE(std::filesystem::exists(logPath_ + ".1"));
    EXPECT_TRUE(std::filesystem::exists(logPath_ + ".2"));
    EXPECT_FALSE(std::filesystem::exists(logPath_ + ".3"));
    EXPECT_LE(std::filesystem::file_size(logPath_), 256u);
    EXPECT_NE(std::string::npos, test::readFile(logPath_).find("line 39"));
}

TEST(LogLevelTest, Parse) {
    LogLevel l = LogLevel::Info;
    EXPECT_TRUE(parseLogLevel("DEBUG", l));
    EXPECT_EQ(LogLevel::Debug, l);
    EXPECT_TRUE(parseLogLevel(" warning ", l));
    EXPECT_EQ(LogLevel::Warn, l);
    EXPECT_FALSE(parseLogLevel("loud", l));
    EXPECT_EQ(LogLevel::Warn, l);
}

} // namespace
} // namespace bct
