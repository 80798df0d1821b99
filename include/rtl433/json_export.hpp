#pragma once

#include "rtl433/coordinator.hpp"
#include "rtl433/device_registry.hpp"

#include <string>

#include <json/json.h>

namespace rtl433 {

// JSON views of the public types, for the CLI feed and host bindings.
Json::Value to_json(const MeasurementMap& measurements);
Json::Value to_json(const DeviceState& state);
Json::Value to_json(const ChangeEvent& event);
Json::Value to_json(const IngestStats& stats);
Json::Value to_json(const supervisor::FailureReport& report);

// Single-line rendering used for the event feed.
std::string to_json_line(const Json::Value& value);

} // namespace rtl433
