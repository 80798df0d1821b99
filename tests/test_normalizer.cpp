#include <gtest/gtest.h>
#include "rtl433/normalizer.hpp"

#include <algorithm>

using namespace rtl433;

namespace {

const TimePoint kReceived = Clock::from_time_t(1709301909);

double number(const Reading& r, const std::string& key) {
  return std::get<double>(r.measurements.at(key));
}

bool has_warning(const Reading& r, const std::string& key) {
  return std::any_of(r.warnings.begin(), r.warnings.end(),
                     [&](const FieldWarning& w) { return w.key == key; });
}

} // namespace

TEST(Normalizer, MinimalRecord) {
  auto res = normalize(R"({"model":"X","id":1,"temperature_C":19.4})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(res.reason, RejectReason::None);
  EXPECT_EQ(res.reading.identity, "X_1");
  EXPECT_EQ(res.reading.model, "X");
  EXPECT_EQ(res.reading.device_id, "1");
  ASSERT_EQ(res.reading.measurements.size(), 1u);
  EXPECT_DOUBLE_EQ(number(res.reading, "temperature_C"), 19.4);
  EXPECT_EQ(res.reading.received_at, kReceived);
  EXPECT_EQ(res.reading.timestamp, kReceived);
  EXPECT_EQ(res.reading.quality, QualityTier::Unknown);
  EXPECT_TRUE(res.reading.warnings.empty());
}

TEST(Normalizer, FullRtl433Record) {
  const char* line =
      R"({"time":"2024-03-01T14:05:09Z","protocol":19,"model":"Acme-Sensor","id":42,)"
      R"("channel":"A","brand":"Acme","battery_ok":1,"temperature_F":68.0,"humidity":55,)"
      R"("mic":"CRC","rssi":-12.1,"snr":22.0,"noise":-36.5})";
  auto res = normalize(line, kReceived + std::chrono::seconds(3));
  ASSERT_TRUE(res.ok);
  const Reading& r = res.reading;
  EXPECT_EQ(r.identity, "Acme-Sensor_42");
  EXPECT_EQ(r.channel, "A");
  EXPECT_EQ(r.brand, "Acme");
  EXPECT_EQ(r.protocol, 19);
  EXPECT_EQ(r.timestamp, kReceived);
  EXPECT_NEAR(number(r, "temperature_C"), 20.0, 1e-9);
  EXPECT_EQ(r.measurements.count("temperature_F"), 0u);
  EXPECT_DOUBLE_EQ(number(r, "humidity"), 55.0);
  EXPECT_EQ(std::get<bool>(r.measurements.at("battery_ok")), true);
  EXPECT_EQ(r.measurements.count("mic"), 0u);
  EXPECT_EQ(r.measurements.count("rssi"), 0u);
  EXPECT_EQ(r.quality, QualityTier::Good);
}

TEST(Normalizer, MalformedJsonRejected) {
  EXPECT_EQ(normalize("{not json", kReceived).reason, RejectReason::MalformedJson);
  EXPECT_EQ(normalize("", kReceived).reason, RejectReason::MalformedJson);
  EXPECT_EQ(normalize("   ", kReceived).reason, RejectReason::MalformedJson);
  EXPECT_EQ(normalize("[1,2,3]", kReceived).reason, RejectReason::MalformedJson);
  EXPECT_EQ(normalize(R"({"model":"X"} trailing)", kReceived).reason, RejectReason::MalformedJson);
  auto res = normalize("rtl_433 version 23.11 branch master", kReceived);
  EXPECT_FALSE(res.ok);
  EXPECT_FALSE(res.detail.empty());
}

TEST(Normalizer, MissingIdentityRejected) {
  auto res = normalize(R"({"temperature_C":19.4})", kReceived);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.reason, RejectReason::MissingIdentity);
  EXPECT_EQ(normalize(R"({"model":"","id":null})", kReceived).reason, RejectReason::MissingIdentity);
}

TEST(Normalizer, SingleIdentityPart) {
  auto model_only = normalize(R"({"model":"Doorbell","button":1})", kReceived);
  ASSERT_TRUE(model_only.ok);
  EXPECT_EQ(model_only.reading.identity, "Doorbell");

  auto id_only = normalize(R"({"id":"abc","humidity":40})", kReceived);
  ASSERT_TRUE(id_only.ok);
  EXPECT_EQ(id_only.reading.identity, "abc");
}

TEST(Normalizer, TrailingCrLfTolerated) {
  auto res = normalize("{\"model\":\"X\",\"id\":7}\r\n", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(res.reading.identity, "X_7");
}

TEST(Normalizer, BadFieldsDroppedWithWarning) {
  auto res = normalize(
      R"({"model":"X","id":1,"temperature_C":150,"humidity":"wet","wind_dir_deg":null,)"
      R"("extra":{"a":1},"pressure_hPa":1012.5})",
      kReceived);
  ASSERT_TRUE(res.ok);
  const Reading& r = res.reading;
  EXPECT_EQ(r.measurements.count("temperature_C"), 0u);
  EXPECT_EQ(r.measurements.count("humidity"), 0u);
  EXPECT_EQ(r.measurements.count("wind_dir_deg"), 0u);
  EXPECT_EQ(r.measurements.count("extra"), 0u);
  EXPECT_DOUBLE_EQ(number(r, "pressure_mbar"), 1012.5);
  EXPECT_TRUE(has_warning(r, "temperature_C"));
  EXPECT_TRUE(has_warning(r, "humidity"));
  EXPECT_TRUE(has_warning(r, "wind_dir_deg"));
  EXPECT_TRUE(has_warning(r, "extra"));
  EXPECT_EQ(r.warnings.size(), 4u);
}

TEST(Normalizer, NumericStringsAccepted) {
  auto res = normalize(R"({"model":"X","id":1,"humidity":"45.5"})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_DOUBLE_EQ(number(res.reading, "humidity"), 45.5);
}

TEST(Normalizer, NativeUnitWinsOverConverted) {
  auto res = normalize(R"({"model":"X","id":1,"temperature_C":21.5,"temperature_F":99.0})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_DOUBLE_EQ(number(res.reading, "temperature_C"), 21.5);
}

TEST(Normalizer, UnparseableTimeFallsBackToReceived) {
  auto res = normalize(R"({"model":"X","id":1,"time":"@0.123s"})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(res.reading.timestamp, kReceived);
  EXPECT_TRUE(has_warning(res.reading, "time"));
}

TEST(Normalizer, NonIntegerProtocolWarns) {
  auto res = normalize(R"({"model":"X","id":1,"protocol":"abc"})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_FALSE(res.reading.protocol.has_value());
  EXPECT_TRUE(has_warning(res.reading, "protocol"));
}

TEST(Normalizer, ProtocolOutsideIntRangeWarns) {
  for (const char* value : {"1e20", "-3", "0", "2147483648"}) {
    auto res = normalize(std::string(R"({"model":"X","id":1,"protocol":)") + value + "}", kReceived);
    ASSERT_TRUE(res.ok) << value;
    EXPECT_FALSE(res.reading.protocol.has_value()) << value;
    EXPECT_TRUE(has_warning(res.reading, "protocol")) << value;
  }
  auto largest = normalize(R"({"model":"X","id":1,"protocol":2147483647})", kReceived);
  ASSERT_TRUE(largest.reading.protocol.has_value());
  EXPECT_EQ(*largest.reading.protocol, 2147483647);
}

TEST(Normalizer, MeasurementsRoundedToTwoDecimals) {
  auto res = normalize(R"({"model":"X","id":1,"temperature_C":21.456789,"humidity":"45.004"})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_DOUBLE_EQ(number(res.reading, "temperature_C"), 21.46);
  EXPECT_DOUBLE_EQ(number(res.reading, "humidity"), 45.0);
}

TEST(Normalizer, FlagsOutsideZeroOneStayNumeric) {
  auto res = normalize(R"({"model":"X","id":1,"button":3,"tamper":false})", kReceived);
  ASSERT_TRUE(res.ok);
  EXPECT_DOUBLE_EQ(number(res.reading, "button"), 3.0);
  EXPECT_EQ(std::get<bool>(res.reading.measurements.at("tamper")), false);
}

TEST(Normalizer, ReasonNames) {
  EXPECT_STREQ(to_string(RejectReason::MalformedJson), "malformed_json");
  EXPECT_STREQ(to_string(RejectReason::MissingIdentity), "missing_identity");
}
