#include "cronfire/util/log.hpp"

#include <cstdio>
#include <string>

#include "gtest/gtest.h"

using namespace cronfire;

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    saved_ = log::logger().level();
    sink_ = std::tmpfile();
    ASSERT_NE(sink_, nullptr);
    log::logger().set_sink(sink_);
  }

  void TearDown() override {
    log::logger().set_sink(stderr);
    log::set_level(saved_);
    std::fclose(sink_);
  }

  auto captured() -> std::string {
    std::string out;
    std::rewind(sink_);
    char buf[256];
    while (std::fgets(buf, sizeof(buf), sink_) != nullptr) {
      out += buf;
    }
    return out;
  }

  log::Level saved_{log::Level::Warn};
  std::FILE* sink_{nullptr};
};

TEST_F(LogTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("info"), log::Level::Info);
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("bogus"), log::Level::Info);
}

TEST_F(LogTest, MessagesBelowLevelAreDropped) {
  log::set_level(log::Level::Warn);
  log::info("hidden {}", 1);
  log::warn("shown {}", 2);

  auto out = captured();
  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("shown 2"), std::string::npos);
  EXPECT_NE(out.find("warn"), std::string::npos);
}

TEST_F(LogTest, SetLevelByName) {
  log::set_level("debug");
  EXPECT_EQ(log::logger().level(), log::Level::Debug);
  log::debug("token \"{}\"", "*/5");
  EXPECT_NE(captured().find("token \"*/5\""), std::string::npos);
}
