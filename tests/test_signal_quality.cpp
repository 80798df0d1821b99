#include <gtest/gtest.h>
#include "rtl433/signal_quality.hpp"

#include <cmath>
#include <limits>

using namespace rtl433;

TEST(SignalQuality, RssiBuckets) {
  EXPECT_EQ(classify_rssi(-5.0), QualityTier::Excellent);
  EXPECT_EQ(classify_rssi(-10.0), QualityTier::Excellent);
  EXPECT_EQ(classify_rssi(-15.0), QualityTier::Good);
  EXPECT_EQ(classify_rssi(-25.0), QualityTier::Fair);
  EXPECT_EQ(classify_rssi(-35.0), QualityTier::Poor);
  EXPECT_EQ(classify_rssi(-40.0), QualityTier::Poor);
  EXPECT_EQ(classify_rssi(-40.1), QualityTier::Unusable);
}

TEST(SignalQuality, SnrBuckets) {
  EXPECT_EQ(classify_snr(35.0), QualityTier::Excellent);
  EXPECT_EQ(classify_snr(20.0), QualityTier::Good);
  EXPECT_EQ(classify_snr(12.0), QualityTier::Fair);
  EXPECT_EQ(classify_snr(5.0), QualityTier::Poor);
  EXPECT_EQ(classify_snr(4.9), QualityTier::Unusable);
}

TEST(SignalQuality, NoiseLowerIsBetter) {
  EXPECT_EQ(classify_noise(-45.0), QualityTier::Excellent);
  EXPECT_EQ(classify_noise(-36.0), QualityTier::Good);
  EXPECT_EQ(classify_noise(-31.0), QualityTier::Fair);
  EXPECT_EQ(classify_noise(-26.0), QualityTier::Poor);
  EXPECT_EQ(classify_noise(-10.0), QualityTier::Unusable);
}

TEST(SignalQuality, WorstPresentMetricWins) {
  // Excellent RSSI, poor SNR.
  EXPECT_EQ(classify(-5.0, 6.0, std::nullopt), QualityTier::Poor);
  // Only noise present.
  EXPECT_EQ(classify(std::nullopt, std::nullopt, -36.0), QualityTier::Good);
  EXPECT_EQ(classify(-12.0, 25.0, -38.0), QualityTier::Good);
}

TEST(SignalQuality, NothingPresentIsUnknown) {
  EXPECT_EQ(classify(std::nullopt, std::nullopt, std::nullopt), QualityTier::Unknown);
  EXPECT_EQ(classify(SignalLevels{}), QualityTier::Unknown);
}

TEST(SignalQuality, NonFiniteCountsAsAbsent) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_EQ(classify(nan, std::nullopt, std::nullopt), QualityTier::Unknown);
  EXPECT_EQ(classify(nan, 31.0, -inf), QualityTier::Excellent);
}

TEST(SignalQuality, DegradedTiers) {
  EXPECT_FALSE(is_degraded(QualityTier::Excellent));
  EXPECT_FALSE(is_degraded(QualityTier::Fair));
  EXPECT_FALSE(is_degraded(QualityTier::Unknown));
  EXPECT_TRUE(is_degraded(QualityTier::Poor));
  EXPECT_TRUE(is_degraded(QualityTier::Unusable));
  EXPECT_STREQ(to_string(QualityTier::Unusable), "unusable");
}
