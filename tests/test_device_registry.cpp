#include <gtest/gtest.h>
#include "rtl433/device_registry.hpp"
#include "rtl433/normalizer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <thread>

using namespace rtl433;
using namespace std::chrono_literals;

namespace {

const TimePoint kT0 = Clock::from_time_t(1709301909);

Reading reading_at(const std::string& line, TimePoint at) {
  auto res = normalize(line, at);
  EXPECT_TRUE(res.ok) << line;
  return res.reading;
}

bool changed(const ChangeEvent& e, const std::string& field) {
  return std::find(e.changed_fields.begin(), e.changed_fields.end(), field) != e.changed_fields.end();
}

} // namespace

TEST(DeviceRegistry, CreateThenMerge) {
  DeviceRegistry reg(60s);
  auto first = reg.upsert(reading_at(
      R"({"model":"Acme-Sensor","id":42,"temperature_C":20.0,"humidity":50})", kT0));
  EXPECT_EQ(first.kind, ChangeEvent::Kind::Created);
  EXPECT_EQ(first.identity, "Acme-Sensor_42");
  EXPECT_TRUE(changed(first, "temperature_C"));
  EXPECT_TRUE(changed(first, "humidity"));
  EXPECT_TRUE(changed(first, "available"));

  auto second = reg.upsert(reading_at(
      R"({"model":"Acme-Sensor","id":42,"temperature_C":21.0,"battery_ok":1})", kT0 + 10s));
  EXPECT_EQ(second.kind, ChangeEvent::Kind::Updated);
  EXPECT_TRUE(changed(second, "temperature_C"));
  EXPECT_TRUE(changed(second, "battery_ok"));
  EXPECT_FALSE(changed(second, "humidity"));
  EXPECT_FALSE(changed(second, "available"));

  auto state = reg.snapshot("Acme-Sensor_42");
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->measurements.size(), 3u);
  EXPECT_DOUBLE_EQ(std::get<double>(state->measurements.at("temperature_C")), 21.0);
  EXPECT_DOUBLE_EQ(std::get<double>(state->measurements.at("humidity")), 50.0);
  EXPECT_EQ(state->first_seen, kT0);
  EXPECT_EQ(state->last_seen, kT0 + 10s);
  EXPECT_EQ(state->reading_count, 2u);
  EXPECT_TRUE(state->available);
}

TEST(DeviceRegistry, UnchangedReadingStillCounts) {
  DeviceRegistry reg;
  reg.upsert(reading_at(R"({"model":"X","id":1,"humidity":50})", kT0));
  auto again = reg.upsert(reading_at(R"({"model":"X","id":1,"humidity":50})", kT0 + 1s));
  EXPECT_EQ(again.kind, ChangeEvent::Kind::Updated);
  EXPECT_TRUE(again.changed_fields.empty());
  EXPECT_EQ(again.new_state.reading_count, 2u);
}

TEST(DeviceRegistry, SweepTimesOutAndReadingRestores) {
  DeviceRegistry reg(60s);
  reg.upsert(reading_at(R"({"model":"X","id":1,"humidity":50})", kT0));

  EXPECT_TRUE(reg.sweep(kT0 + 60s).empty());

  auto flipped = reg.sweep(kT0 + 61s);
  ASSERT_EQ(flipped.size(), 1u);
  EXPECT_EQ(flipped[0].kind, ChangeEvent::Kind::Unavailable);
  EXPECT_FALSE(flipped[0].new_state.available);
  EXPECT_FALSE(reg.snapshot("X_1")->available);

  // Already unavailable: nothing more to report.
  EXPECT_TRUE(reg.sweep(kT0 + 61s).empty());
  EXPECT_TRUE(reg.sweep(kT0 + 600s).empty());

  auto back = reg.upsert(reading_at(R"({"model":"X","id":1,"humidity":50})", kT0 + 62s));
  EXPECT_TRUE(changed(back, "available"));
  EXPECT_TRUE(back.new_state.available);
  EXPECT_EQ(back.new_state.last_seen, kT0 + 62s);
  // Measurements survive the outage.
  EXPECT_DOUBLE_EQ(std::get<double>(back.new_state.measurements.at("humidity")), 50.0);
}

TEST(DeviceRegistry, SweepOnlyTouchesSilentDevices) {
  DeviceRegistry reg(30s);
  reg.upsert(reading_at(R"({"model":"A","id":1})", kT0));
  reg.upsert(reading_at(R"({"model":"B","id":2})", kT0 + 20s));
  auto events = reg.sweep(kT0 + 40s);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].identity, "A_1");
  EXPECT_TRUE(reg.snapshot("B_2")->available);
}

TEST(DeviceRegistry, InterleavedIdentitiesStayIndependent) {
  DeviceRegistry reg;
  reg.upsert(reading_at(R"({"model":"A","id":1,"temperature_C":10})", kT0));
  reg.upsert(reading_at(R"({"model":"B","id":1,"temperature_C":30})", kT0 + 1s));
  reg.upsert(reading_at(R"({"model":"A","id":1,"humidity":40})", kT0 + 2s));

  auto a = reg.snapshot("A_1");
  auto b = reg.snapshot("B_1");
  ASSERT_TRUE(a && b);
  EXPECT_DOUBLE_EQ(std::get<double>(a->measurements.at("temperature_C")), 10.0);
  EXPECT_DOUBLE_EQ(std::get<double>(a->measurements.at("humidity")), 40.0);
  EXPECT_EQ(b->measurements.size(), 1u);
  EXPECT_EQ(reg.size(), 2u);

  auto all = reg.all();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].identity, "A_1");
  EXPECT_EQ(all[1].identity, "B_1");
}

TEST(DeviceRegistry, OutOfOrderReceiptKeepsLatestLastSeen) {
  DeviceRegistry reg;
  reg.upsert(reading_at(R"({"model":"X","id":1})", kT0 + 10s));
  auto e = reg.upsert(reading_at(R"({"model":"X","id":1})", kT0));
  EXPECT_EQ(e.new_state.last_seen, kT0 + 10s);
}

TEST(DeviceRegistry, SignalKeptWhenReadingHasNone) {
  DeviceRegistry reg;
  reg.upsert(reading_at(R"({"model":"X","id":1,"rssi":-5,"snr":35,"noise":-45})", kT0));
  auto e = reg.upsert(reading_at(R"({"model":"X","id":1,"humidity":20})", kT0 + 1s));
  EXPECT_EQ(e.new_state.quality, QualityTier::Excellent);
  ASSERT_TRUE(e.new_state.signal.rssi.has_value());
  EXPECT_DOUBLE_EQ(*e.new_state.signal.rssi, -5.0);
  EXPECT_EQ(e.new_state.quality_history.size(), 1u);

  auto worse = reg.upsert(reading_at(R"({"model":"X","id":1,"rssi":-35})", kT0 + 2s));
  EXPECT_TRUE(changed(worse, "quality"));
  EXPECT_EQ(worse.new_state.quality, QualityTier::Poor);
}

TEST(DeviceRegistry, QualityHistoryCapped) {
  DeviceRegistry reg;
  for (int i = 0; i < 25; ++i) {
    reg.upsert(reading_at(R"({"model":"X","id":1,"snr":25})", kT0 + std::chrono::seconds(i)));
  }
  EXPECT_EQ(reg.snapshot("X_1")->quality_history.size(), DeviceRegistry::kQualityHistory);
}

TEST(DeviceRegistry, PoorStreakWarnsOncePerStreak) {
  test::CapturedLog log(log::Level::Warn);
  DeviceRegistry reg;
  auto poor = [&](int i) {
    reg.upsert(reading_at(R"({"model":"X","id":1,"rssi":-45})", kT0 + std::chrono::seconds(i)));
  };
  for (int i = 0; i < 4; ++i) poor(i);
  EXPECT_EQ(log.count_containing("poor signal quality"), 0u);
  poor(4);
  EXPECT_EQ(log.count_containing("poor signal quality"), 1u);
  for (int i = 5; i < 12; ++i) poor(i);
  EXPECT_EQ(log.count_containing("poor signal quality"), 1u);

  // A good reading breaks the streak; the next streak warns again.
  reg.upsert(reading_at(R"({"model":"X","id":1,"rssi":-5})", kT0 + 20s));
  for (int i = 21; i < 26; ++i) poor(i);
  EXPECT_EQ(log.count_containing("poor signal quality"), 2u);
}

TEST(DeviceRegistry, ConcurrentUpsertsAllCounted) {
  DeviceRegistry reg;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&reg, t] {
      for (int i = 0; i < kPerThread; ++i) {
        Reading r = normalize(R"({"model":"X","id":1,"humidity":)" + std::to_string(i % 100) + "}",
                              kT0 + std::chrono::seconds(t * kPerThread + i))
                        .reading;
        reg.upsert(r);
      }
    });
  }
  for (auto& w : workers) w.join();
  EXPECT_EQ(reg.snapshot("X_1")->reading_count, static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(DeviceRegistry, TimeoutAdjustable) {
  DeviceRegistry reg(10s);
  reg.upsert(reading_at(R"({"model":"X","id":1})", kT0));
  EXPECT_TRUE(reg.set_timeout(100s, kT0).empty());
  EXPECT_EQ(reg.timeout(), 100s);
  EXPECT_TRUE(reg.sweep(kT0 + 50s).empty());
  EXPECT_EQ(reg.sweep(kT0 + 101s).size(), 1u);
}

TEST(DeviceRegistry, RaisedTimeoutRestoresAvailability) {
  DeviceRegistry reg(60s);
  reg.upsert(reading_at(R"({"model":"X","id":1})", kT0));
  reg.upsert(reading_at(R"({"model":"Y","id":2})", kT0 - 1h));
  ASSERT_EQ(reg.sweep(kT0 + 61s).size(), 2u);

  auto revived = reg.set_timeout(3600s, kT0 + 62s);
  ASSERT_EQ(revived.size(), 1u);
  EXPECT_EQ(revived[0].identity, "X_1");
  EXPECT_EQ(revived[0].kind, ChangeEvent::Kind::Updated);
  EXPECT_TRUE(changed(revived[0], "available"));
  EXPECT_TRUE(revived[0].new_state.available);

  EXPECT_TRUE(reg.sweep(kT0 + 62s).empty());
  EXPECT_TRUE(reg.snapshot("X_1")->available);
  EXPECT_FALSE(reg.snapshot("Y_2")->available);
}
