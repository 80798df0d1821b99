#pragma once

#include "rtl433/reading.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtl433 {

// Aggregated last-known state of one physical device.
struct DeviceState {
    std::string identity;
    std::string model;
    std::optional<std::string> brand;
    std::optional<std::string> channel;
    std::optional<int> protocol;
    // Merged across readings: keys are added or overwritten, never removed.
    MeasurementMap measurements;
    SignalLevels signal;
    QualityTier quality{QualityTier::Unknown};
    // Most recent tiers, oldest first, capped at DeviceRegistry::kQualityHistory.
    std::deque<QualityTier> quality_history;
    TimePoint first_seen{};
    TimePoint last_seen{};
    // Decoder timestamp of the most recent reading.
    TimePoint last_timestamp{};
    bool available{false};
    std::size_t reading_count{0};
};

// What an upsert or sweep did to one device.
struct ChangeEvent {
    enum class Kind {
        // First reading for a new identity.
        Created,
        // Reading merged into an existing identity.
        Updated,
        // Sweep found the device silent for longer than the timeout.
        Unavailable,
    } kind{Kind::Updated};

    std::string identity;
    // Measurement keys that appeared or changed value, plus "available",
    // "quality" and "model" when those changed.
    std::vector<std::string> changed_fields;
    // Copy of the state right after the change.
    DeviceState new_state;
};

const char* to_string(ChangeEvent::Kind kind);

// In-memory map identity -> DeviceState. Every mutation takes the same lock,
// so writers never interleave; readers only ever receive copies.
class DeviceRegistry {
public:
    using Duration = std::chrono::seconds;

    static constexpr std::size_t kQualityHistory = 10;
    // Consecutive degraded tiers that trigger a poor-signal warning.
    static constexpr std::size_t kDegradedStreak = 5;

    explicit DeviceRegistry(Duration device_timeout = std::chrono::hours(1));

    // Merge a reading into its device, creating the device on first sight.
    ChangeEvent upsert(const Reading& reading);

    // Mark every device silent for longer than the timeout as unavailable.
    // Returns one event per device that flipped during this call.
    std::vector<ChangeEvent> sweep(TimePoint now);

    [[nodiscard]] std::optional<DeviceState> snapshot(const std::string& identity) const;
    [[nodiscard]] std::vector<DeviceState> all() const;
    [[nodiscard]] std::size_t size() const;

    // Change the timeout and re-evaluate availability at `now`. Devices marked
    // unavailable that fall within the new timeout become available again;
    // one Updated event is returned for each of them.
    std::vector<ChangeEvent> set_timeout(Duration device_timeout, TimePoint now);
    [[nodiscard]] Duration timeout() const;

private:
    [[nodiscard]] bool expired(const DeviceState& state, TimePoint now) const;

    mutable std::mutex mutex_;
    Duration timeout_;
    std::unordered_map<std::string, DeviceState> devices_;
};

} // namespace rtl433
