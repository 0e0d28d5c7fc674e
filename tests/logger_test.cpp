#include "logger.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <filesystem>

TEST(LoggerTest, WritesToRotatingFile) {
    lx::test::TempDir dir;
    lx::LoggingConfig cfg;
    cfg.level = "debug";
    cfg.file = dir.path() + "/logs/lanxfer.log";

    EXPECT_TRUE(lx::init_logger(cfg));
    EXPECT_EQ(spdlog::default_logger()->name(), "lanxfer");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

    spdlog::warn("written through");
    EXPECT_TRUE(std::filesystem::exists(cfg.file));
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    lx::LoggingConfig cfg;
    cfg.level = "chatty";
    EXPECT_TRUE(lx::init_logger(cfg));
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);

    cfg.level = "off";
    lx::init_logger(cfg);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);
}

TEST(LoggerTest, UnwritableFileKeepsConsoleLogging) {
    lx::test::TempDir dir;
    std::string blocker = dir.write("not-a-dir", "x");

    lx::LoggingConfig cfg;
    cfg.file = blocker + "/lanxfer.log";
    EXPECT_FALSE(lx::init_logger(cfg));
    EXPECT_EQ(spdlog::default_logger()->name(), "lanxfer");
    EXPECT_EQ(spdlog::default_logger()->sinks().size(), 1u);
}
