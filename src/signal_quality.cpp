#include "rtl433/signal_quality.hpp"

#include <cmath>

namespace rtl433 {

namespace {

// Thresholds observed on RTL-SDR dongles with rtl_433's level metadata.
constexpr double kRssiExcellent = -10.0;
constexpr double kRssiGood = -20.0;
constexpr double kRssiFair = -30.0;
constexpr double kRssiPoor = -40.0;

constexpr double kSnrExcellent = 30.0;
constexpr double kSnrGood = 20.0;
constexpr double kSnrFair = 10.0;
constexpr double kSnrPoor = 5.0;

constexpr double kNoiseExcellent = -40.0;
constexpr double kNoiseGood = -35.0;
constexpr double kNoiseFair = -30.0;
constexpr double kNoisePoor = -25.0;

QualityTier worse(QualityTier a, QualityTier b) {
    if (a == QualityTier::Unknown) return b;
    if (b == QualityTier::Unknown) return a;
    return static_cast<int>(a) > static_cast<int>(b) ? a : b;
}

} // namespace

QualityTier classify_rssi(double rssi_dbm) {
    if (rssi_dbm >= kRssiExcellent) return QualityTier::Excellent;
    if (rssi_dbm >= kRssiGood) return QualityTier::Good;
    if (rssi_dbm >= kRssiFair) return QualityTier::Fair;
    if (rssi_dbm >= kRssiPoor) return QualityTier::Poor;
    return QualityTier::Unusable;
}

QualityTier classify_snr(double snr_db) {
    if (snr_db >= kSnrExcellent) return QualityTier::Excellent;
    if (snr_db >= kSnrGood) return QualityTier::Good;
    if (snr_db >= kSnrFair) return QualityTier::Fair;
    if (snr_db >= kSnrPoor) return QualityTier::Poor;
    return QualityTier::Unusable;
}

// Lower noise floor is better, so the comparisons run the other way.
QualityTier classify_noise(double noise_db) {
    if (noise_db <= kNoiseExcellent) return QualityTier::Excellent;
    if (noise_db <= kNoiseGood) return QualityTier::Good;
    if (noise_db <= kNoiseFair) return QualityTier::Fair;
    if (noise_db <= kNoisePoor) return QualityTier::Poor;
    return QualityTier::Unusable;
}

QualityTier classify(std::optional<double> rssi,
                     std::optional<double> snr,
                     std::optional<double> noise) {
    QualityTier tier = QualityTier::Unknown;
    if (rssi && std::isfinite(*rssi)) tier = worse(tier, classify_rssi(*rssi));
    if (snr && std::isfinite(*snr)) tier = worse(tier, classify_snr(*snr));
    if (noise && std::isfinite(*noise)) tier = worse(tier, classify_noise(*noise));
    return tier;
}

bool is_degraded(QualityTier tier) {
    return tier == QualityTier::Poor || tier == QualityTier::Unusable;
}

const char* to_string(QualityTier tier) {
    switch (tier) {
    case QualityTier::Excellent: return "excellent";
    case QualityTier::Good:      return "good";
    case QualityTier::Fair:      return "fair";
    case QualityTier::Poor:      return "poor";
    case QualityTier::Unusable:  return "unusable";
    case QualityTier::Unknown:   return "unknown";
    }
    return "unknown";
}

} // namespace rtl433
