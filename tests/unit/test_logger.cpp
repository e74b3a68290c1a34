#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Spindle::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    Logger::info("This should not be printed");
    Logger::error("This should be printed");
    EXPECT_EQ(Logger::level() & LOG_INFO, 0);
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("none"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("error"), LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("warn"), LOG_ERROR | LOG_WARN);
    EXPECT_EQ(Logger::parse_level("success"), LOG_ERROR | LOG_WARN | LOG_SUCCESS);
    EXPECT_EQ(Logger::parse_level("info"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("all"), LOG_ALL);
    EXPECT_THROW(Logger::parse_level("verbose"), std::invalid_argument);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::info("Logging from thread "
                             + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_ALL);
}
