/**
 * @file time_format_test.cpp
 * @brief Unit tests for snapshot timestamp formatting
 */

#include "utils/time_format.h"

#include <gtest/gtest.h>

using namespace graphvault::utils;

namespace {

// 2024-03-05T06:07:08Z
constexpr int64_t kEpochSeconds = 1709618828;

std::chrono::system_clock::time_point MakeTime(int64_t seconds, int64_t micros) {
  return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
}

}  // namespace

TEST(TimeFormatTest, SnapshotTimestampLayout) {
  EXPECT_EQ(FormatSnapshotTimestamp(MakeTime(kEpochSeconds, 123)), "20240305_060708_000123");
}

TEST(TimeFormatTest, Iso8601Layout) {
  EXPECT_EQ(FormatIso8601(MakeTime(kEpochSeconds, 987654)), "2024-03-05T06:07:08.987654Z");
}

TEST(TimeFormatTest, EpochZero) {
  EXPECT_EQ(FormatSnapshotTimestamp(MakeTime(0, 0)), "19700101_000000_000000");
}

TEST(TimeFormatTest, SameSecondTimestampsOrderLexicographically) {
  auto earlier = FormatSnapshotTimestamp(MakeTime(kEpochSeconds, 9));
  auto later = FormatSnapshotTimestamp(MakeTime(kEpochSeconds, 10));
  EXPECT_LT(earlier, later);
}
