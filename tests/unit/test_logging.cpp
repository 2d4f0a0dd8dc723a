#include <gtest/gtest.h>
#include "utils/logger.hpp"

using namespace pdfstack;

TEST(LoggerTest, InfoLevelWorks) {
    Logger& log = Logger::get();
    log.set_level(LogLevel::INFO);
    log.set_colors(false);
    log.info("Test info message: %d", 42);
    EXPECT_EQ(log.get_level(), LogLevel::INFO);
    EXPECT_TRUE(log.enabled(LogLevel::WARN));
    EXPECT_FALSE(log.enabled(LogLevel::DEBUG));
}

TEST(LoggerTest, SingletonIsShared) {
    Logger::get().set_level(LogLevel::DEBUG);
    EXPECT_EQ(Logger::get().get_level(), LogLevel::DEBUG);
    Logger::get().debug("debug %s", "visible");
    Logger::get().set_level(LogLevel::INFO);
}

TEST(LoggerTest, VerbosityMapping) {
    EXPECT_EQ(log_level_from_verbosity(0), LogLevel::ERROR);
    EXPECT_EQ(log_level_from_verbosity(-3), LogLevel::ERROR);
    EXPECT_EQ(log_level_from_verbosity(1), LogLevel::INFO);
    EXPECT_EQ(log_level_from_verbosity(2), LogLevel::DEBUG);
}
