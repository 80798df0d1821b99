#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rtl433 {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Parse the timestamps produced by `rtl_433 -M time:iso` and its variants:
//   2024-03-01T14:05:09            (local time, rtl_433 default)
//   2024-03-01 14:05:09            (space separator)
//   2024-03-01T14:05:09.123456     (fractional seconds, -M time:iso:usec)
//   2024-03-01T14:05:09Z           (UTC, -M time:iso:utc)
//   2024-03-01T14:05:09+0100       (offset, -M time:iso:tz; "+01:00" accepted too)
// Returns nullopt for anything else, including out-of-range fields.
[[nodiscard]] std::optional<TimePoint> parse_iso8601(std::string_view text);

// UTC, millisecond precision: 2024-03-01T13:05:09.123Z
[[nodiscard]] std::string format_iso8601(TimePoint tp);

// Seconds since the epoch as a double, for JSON output.
[[nodiscard]] double to_epoch_seconds(TimePoint tp);

} // namespace rtl433
