#include <gtest/gtest.h>
#include "rtl433/supervisor/reconnect_policy.hpp"

using namespace rtl433::supervisor;
using namespace std::chrono_literals;

namespace {

ReconnectPolicy::Settings settings(ReconnectPolicy::Duration base, ReconnectPolicy::Duration max,
                                   unsigned ceiling) {
  ReconnectPolicy::Settings s;
  s.base = base;
  s.max = max;
  s.max_consecutive_failures = ceiling;
  s.healthy_reset = 60s;
  return s;
}

} // namespace

TEST(ReconnectPolicy, DoublesUntilCeiling) {
  ReconnectPolicy policy(settings(1s, 300s, 4));
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(1s));
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(2s));
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(4s));
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(8s));
  EXPECT_EQ(policy.consecutive_failures(), 4u);
  EXPECT_FALSE(policy.exhausted());

  EXPECT_FALSE(policy.on_failure().has_value());
  EXPECT_TRUE(policy.exhausted());
  EXPECT_EQ(policy.current_delay(), ReconnectPolicy::Duration(0));
}

TEST(ReconnectPolicy, DelayCapped) {
  ReconnectPolicy policy(settings(5s, 30s, 100));
  EXPECT_EQ(policy.delay_for(1), ReconnectPolicy::Duration(5s));
  EXPECT_EQ(policy.delay_for(3), ReconnectPolicy::Duration(20s));
  EXPECT_EQ(policy.delay_for(4), ReconnectPolicy::Duration(30s));
  EXPECT_EQ(policy.delay_for(90), ReconnectPolicy::Duration(30s));
  for (int i = 0; i < 50; ++i) {
    auto d = policy.on_failure();
    ASSERT_TRUE(d.has_value());
    EXPECT_LE(*d, ReconnectPolicy::Duration(30s));
  }
}

TEST(ReconnectPolicy, DefaultsMatchDecoderDefaults) {
  ReconnectPolicy policy;
  EXPECT_EQ(policy.settings().base, ReconnectPolicy::Duration(5s));
  EXPECT_EQ(policy.settings().max, ReconnectPolicy::Duration(5min));
  EXPECT_EQ(policy.settings().max_consecutive_failures, 5u);
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(5s));
}

TEST(ReconnectPolicy, HealthyRunClearsStreak) {
  ReconnectPolicy policy(settings(1s, 60s, 3));
  policy.on_failure();
  policy.on_failure();
  EXPECT_FALSE(policy.on_healthy(59s));
  EXPECT_EQ(policy.consecutive_failures(), 2u);
  EXPECT_TRUE(policy.on_healthy(60s));
  EXPECT_EQ(policy.consecutive_failures(), 0u);
  // Back at the base delay.
  EXPECT_EQ(policy.on_failure(), ReconnectPolicy::Duration(1s));
}

TEST(ReconnectPolicy, HealthyWithoutFailuresIsNoop) {
  ReconnectPolicy policy(settings(1s, 60s, 3));
  EXPECT_FALSE(policy.on_healthy(10min));
}

TEST(ReconnectPolicy, ResetAfterExhaustion) {
  ReconnectPolicy policy(settings(1s, 60s, 0));
  EXPECT_FALSE(policy.on_failure().has_value());
  policy.reset();
  EXPECT_FALSE(policy.exhausted());
  EXPECT_EQ(policy.consecutive_failures(), 0u);
}
