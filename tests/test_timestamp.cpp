#include <gtest/gtest.h>
#include "rtl433/timestamp.hpp"

#include <cstdlib>
#include <ctime>

using namespace rtl433;

namespace {

std::int64_t epoch(const TimePoint& tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

TEST(Timestamp, ParsesUtc) {
  auto tp = parse_iso8601("2024-03-01T14:05:09Z");
  ASSERT_TRUE(tp.has_value());
  EXPECT_EQ(epoch(*tp), 1709301909);
}

TEST(Timestamp, ParsesOffsets) {
  auto compact = parse_iso8601("2024-03-01T14:05:09+0100");
  auto colon = parse_iso8601("2024-03-01T14:05:09+01:00");
  auto west = parse_iso8601("2024-03-01T14:05:09-05:30");
  ASSERT_TRUE(compact && colon && west);
  EXPECT_EQ(epoch(*compact), 1709301909 - 3600);
  EXPECT_EQ(epoch(*colon), 1709301909 - 3600);
  EXPECT_EQ(epoch(*west), 1709301909 + 5 * 3600 + 30 * 60);
}

TEST(Timestamp, FractionalSeconds) {
  auto tp = parse_iso8601("2024-03-01T14:05:09.250000Z");
  ASSERT_TRUE(tp.has_value());
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp->time_since_epoch()).count();
  EXPECT_EQ(ms, 1709301909250LL);
}

TEST(Timestamp, NaiveTimeIsLocal) {
  ::setenv("TZ", "UTC", 1);
  ::tzset();
  auto tp = parse_iso8601("2024-03-01 14:05:09");
  ASSERT_TRUE(tp.has_value());
  EXPECT_EQ(epoch(*tp), 1709301909);
}

TEST(Timestamp, RejectsGarbage) {
  EXPECT_FALSE(parse_iso8601("").has_value());
  EXPECT_FALSE(parse_iso8601("yesterday").has_value());
  EXPECT_FALSE(parse_iso8601("2024-03-01").has_value());
  EXPECT_FALSE(parse_iso8601("2024-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(parse_iso8601("2024-02-30T00:00:00Z").has_value());
  EXPECT_FALSE(parse_iso8601("2024-03-01T14:05:09Zjunk").has_value());
  EXPECT_FALSE(parse_iso8601("2024-03-01T14:05:09.Z").has_value());
}

TEST(Timestamp, FormatsUtcWithMillis) {
  TimePoint tp = Clock::from_time_t(1709301909) + std::chrono::milliseconds(42);
  EXPECT_EQ(format_iso8601(tp), "2024-03-01T14:05:09.042Z");
  EXPECT_DOUBLE_EQ(to_epoch_seconds(Clock::from_time_t(1709301909)), 1709301909.0);
}
