#include <gtest/gtest.h>

#include <iostream>

#include "log.hpp"
#include "test_util.hpp"

using namespace tftpff;

TEST(LogTest, ParsesLevelNames) {
  EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
  EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("Debug"), LogLevel::Debug);
  EXPECT_FALSE(parse_log_level("verbose"));
}

TEST(LogTest, DisabledLevelsGoNowhere) {
  test::QuietLogs quiet;
  set_log_level(LogLevel::Warn);

  EXPECT_EQ(&log_stream(LogLevel::Error), &std::cerr);
  EXPECT_EQ(&log_stream(LogLevel::Warn), &std::cerr);

  std::ostream &info = log_stream(LogLevel::Info);
  EXPECT_NE(&info, &std::cout);
  EXPECT_EQ(info.rdbuf(), nullptr);
  info << "dropped" << std::endl;
  EXPECT_EQ(&log_stream(LogLevel::Debug), &info);

  set_log_level(LogLevel::Off);
  EXPECT_EQ(&log_stream(LogLevel::Error), &info);
}

TEST(LogTest, InfoGoesToStdout) {
  test::QuietLogs quiet;
  set_log_level(LogLevel::Info);
  EXPECT_EQ(&log_stream(LogLevel::Info), &std::cout);
  EXPECT_FALSE(log_enabled(LogLevel::Debug));
}
