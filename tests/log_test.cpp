#include "polywatch/util/log.hpp"

#include "gtest/gtest.h"

using namespace polywatch;

TEST(LogTest, ParseLevel_KnownNames) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("info"), log::Level::Info);
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
}

TEST(LogTest, ParseLevel_UnknownFallsBackToInfo) {
  EXPECT_EQ(log::parse_level("verbose"), log::Level::Info);
}

TEST(LogTest, LevelNames) {
  EXPECT_EQ(log::level_name(log::Level::Warn), "warn");
  EXPECT_EQ(log::level_name(log::Level::Error), "error");
}

TEST(LogTest, SetLevel_ByName) {
  auto previous = log::logger().level();
  log::set_level("error");
  EXPECT_EQ(log::logger().level(), log::Level::Error);
  log::set_level(previous);
}

TEST(LogTest, StartedLogger_DrainsOnStop) {
  log::start();
  for (int i = 0; i < 100; ++i) {
    log::debug("message {}", i);
  }
  log::stop();
  log::info("written inline after stop");
  SUCCEED();
}
