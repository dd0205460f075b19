#include <gtest/gtest.h>

#include "utils/logger.h"

using quarry::utils::Logger;

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("DEBUG"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("verbose"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::CRITICAL), "critical");
}

TEST(LoggerTest, MessagesBeforeInitAreDropped) {
    ASSERT_FALSE(Logger::isInitialized());
    QUARRY_INFO("dropped {}", 1);

    Logger::init("", Logger::Level::DEBUG);
    ASSERT_TRUE(Logger::isInitialized());
    EXPECT_TRUE(Logger::get()->should_log(spdlog::level::debug));
    QUARRY_DEBUG("query {} took {} ms", "SELECT FROM Person", 3);

    Logger::setLevel(Logger::Level::ERROR);
    EXPECT_FALSE(Logger::get()->should_log(spdlog::level::warn));

    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());
}
