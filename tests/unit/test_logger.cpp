// ============================================================================
// LIFELINE - Logger Unit Tests
// ============================================================================

#include "lifeline/utils/logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace lifeline::utils;

namespace {

LogConfig quiet_config(bool async) {
    LogConfig config;
    config.console = false;
    config.log_file.clear();
    config.async = async;
    config.level = LogLevel::Debug;
    return config;
}

}  // namespace

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::Info);
}

TEST(LoggerTest, WritesBeforeInitializeUseDefaultLogger) {
    Logger::shutdown();
    EXPECT_NO_THROW(LOG_INFO("no logger configured yet: {}", 1));
}

TEST(LoggerTest, WritersSurviveReinitializeAndShutdown) {
    std::atomic<bool> running{true};
    std::atomic<int> written{0};

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t] {
            while (running.load()) {
                LOG_DEBUG("writer {} message {}", t, written.load());
                ++written;
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        Logger::initialize(quiet_config(false));
        Logger::shutdown();
    }
    running = false;
    for (auto& w : writers) {
        w.join();
    }

    EXPECT_GT(written.load(), 0);
}

TEST(LoggerTest, AsyncReinitialize) {
    Logger::initialize(quiet_config(true));
    LOG_INFO("first");
    Logger::initialize(quiet_config(true));
    LOG_INFO("second");
    Logger::instance().flush();
    Logger::shutdown();
    SUCCEED();
}
