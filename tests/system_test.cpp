#include <chrono>

#include <gtest/gtest.h>

#include "vidpress/system.hpp"

using namespace vidpress;

TEST(SystemTest, ParseCpuset) {
  EXPECT_EQ(parse_cpuset("0-3"), (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(parse_cpuset("0,2,4"), (std::vector<int>{0, 2, 4}));
  EXPECT_EQ(parse_cpuset("1-2,8"), (std::vector<int>{1, 2, 8}));
  EXPECT_TRUE(parse_cpuset("").empty());
  EXPECT_TRUE(parse_cpuset("3-1").empty());
  EXPECT_TRUE(parse_cpuset("a-b").empty());
}

TEST(SystemTest, CpuLimitIsSane) {
  int limit = detect_cpu_limit();
  EXPECT_GE(limit, 1);
  EXPECT_LE(limit, 64);
}

TEST(SystemTest, ParallelStreamsRespectLimit) {
  int limit = detect_cpu_limit();
  EXPECT_EQ(calculate_parallel_streams(0), limit);
  EXPECT_EQ(calculate_parallel_streams(1), 1);
  EXPECT_EQ(calculate_parallel_streams(10000), limit);
}

TEST(SystemTest, FormatTime) {
  EXPECT_EQ(format_time(0), "00:00:00");
  EXPECT_EQ(format_time(3725.9), "01:02:05");
}

TEST(SystemTest, FormatIso8601) {
  auto tp = std::chrono::system_clock::from_time_t(1700000000);
  EXPECT_EQ(format_iso8601_utc(tp), "2023-11-14T22:13:20Z");
}
