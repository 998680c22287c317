#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Robocache::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_FALSE(Logger::enabled(LOG_ERROR));
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, DebugIsOffByDefault) {
    Logger::set_level(LOG_DEFAULT);
    EXPECT_FALSE(Logger::enabled(LOG_DEBUG));
    EXPECT_TRUE(Logger::enabled(LOG_INFO));

    Logger::set_level(LOG_ALL);
    EXPECT_TRUE(Logger::enabled(LOG_DEBUG));
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    EXPECT_FALSE(Logger::enabled(LOG_INFO));
    EXPECT_TRUE(Logger::enabled(LOG_ERROR));
    Logger::info("This should not be printed");
    Logger::error("This should be printed");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_ALL);
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 50; ++j) {
                Logger::debug("Logging from thread "
                              + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_DEFAULT);
}
