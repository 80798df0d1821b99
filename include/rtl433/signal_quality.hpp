#pragma once

#include <optional>

namespace rtl433 {

// Ordered from best to worst; `Unknown` sits outside the ordering and means
// the decoder reported no level information at all.
enum class QualityTier {
    Excellent,
    Good,
    Fair,
    Poor,
    Unusable,
    Unknown,
};

// Level metrics attached by `rtl_433 -M level`. Any component may be missing.
struct SignalLevels {
    std::optional<double> rssi;   // dBm
    std::optional<double> snr;    // dB
    std::optional<double> noise;  // dB noise floor

    [[nodiscard]] bool empty() const { return !rssi && !snr && !noise; }
    bool operator==(const SignalLevels&) const = default;
};

// Bucket each present metric independently and return the worst tier.
// All metrics absent (or non-finite) -> QualityTier::Unknown.
[[nodiscard]] QualityTier classify(std::optional<double> rssi,
                                   std::optional<double> snr,
                                   std::optional<double> noise);

[[nodiscard]] inline QualityTier classify(const SignalLevels& levels) {
    return classify(levels.rssi, levels.snr, levels.noise);
}

// Per-metric buckets, exposed for diagnostics and tests.
[[nodiscard]] QualityTier classify_rssi(double rssi_dbm);
[[nodiscard]] QualityTier classify_snr(double snr_db);
[[nodiscard]] QualityTier classify_noise(double noise_db);

// Poor or Unusable.
[[nodiscard]] bool is_degraded(QualityTier tier);

const char* to_string(QualityTier tier);

} // namespace rtl433
