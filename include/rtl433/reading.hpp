#pragma once

#include "rtl433/signal_quality.hpp"
#include "rtl433/timestamp.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rtl433 {

// A measurement is either numeric (double) or a flag such as battery_ok.
using MeasurementValue = std::variant<double, bool>;

// Ordered so snapshots and JSON output are stable.
using MeasurementMap = std::map<std::string, MeasurementValue>;

// A field the normalizer dropped from an otherwise accepted record.
struct FieldWarning {
    std::string key;
    std::string reason;
};

// One decoded telemetry record after normalization.
struct Reading {
    // "{model}_{device_id}"; the single present part when the other is missing.
    std::string identity;
    std::string model;
    std::string device_id;
    std::optional<std::string> channel;
    std::optional<int> protocol;
    std::optional<std::string> brand;
    // Decoder time, or received_at when absent/unparseable.
    TimePoint timestamp{};
    // Wall-clock time the line was read from the decoder; drives liveness.
    TimePoint received_at{};
    MeasurementMap measurements;
    SignalLevels signal;
    QualityTier quality{QualityTier::Unknown};
    std::vector<FieldWarning> warnings;
};

// Build the registry key from the decoder's model and id fields.
[[nodiscard]] std::string make_identity(const std::string& model, const std::string& device_id);

[[nodiscard]] std::string measurement_to_string(const MeasurementValue& value);

} // namespace rtl433
