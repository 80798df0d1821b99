#include "rtl433/device_registry.hpp"

#include "rtl433/log.hpp"

#include <algorithm>

namespace rtl433 {

namespace {

bool streak_just_reached(const std::deque<QualityTier>& history, std::size_t streak) {
    if (history.size() < streak) return false;
    const auto first = history.end() - static_cast<std::ptrdiff_t>(streak);
    if (!std::all_of(first, history.end(), is_degraded)) return false;
    return history.size() == streak || !is_degraded(*(first - 1));
}

} // namespace

const char* to_string(ChangeEvent::Kind kind) {
    switch (kind) {
    case ChangeEvent::Kind::Created:     return "created";
    case ChangeEvent::Kind::Updated:     return "updated";
    case ChangeEvent::Kind::Unavailable: return "unavailable";
    }
    return "unknown";
}

DeviceRegistry::DeviceRegistry(Duration device_timeout) : timeout_(device_timeout) {}

ChangeEvent DeviceRegistry::upsert(const Reading& reading) {
    std::lock_guard<std::mutex> lock(mutex_);

    ChangeEvent event;
    event.identity = reading.identity;

    auto [it, inserted] = devices_.try_emplace(reading.identity);
    DeviceState& state = it->second;
    if (inserted) {
        event.kind = ChangeEvent::Kind::Created;
        state.identity = reading.identity;
        state.first_seen = reading.received_at;
        state.last_seen = reading.received_at;
    } else {
        event.kind = ChangeEvent::Kind::Updated;
    }

    if (state.model != reading.model && !reading.model.empty()) {
        state.model = reading.model;
        event.changed_fields.push_back("model");
    }
    if (reading.brand) state.brand = reading.brand;
    if (reading.channel) state.channel = reading.channel;
    if (reading.protocol) state.protocol = reading.protocol;

    for (const auto& [key, value] : reading.measurements) {
        auto existing = state.measurements.find(key);
        if (existing == state.measurements.end()) {
            state.measurements.emplace(key, value);
            event.changed_fields.push_back(key);
        } else if (existing->second != value) {
            existing->second = value;
            event.changed_fields.push_back(key);
        }
    }

    // Readings without level metadata keep the last known signal picture.
    if (!reading.signal.empty()) {
        state.signal = reading.signal;
        if (state.quality != reading.quality) {
            state.quality = reading.quality;
            event.changed_fields.push_back("quality");
        }
        state.quality_history.push_back(reading.quality);
        if (state.quality_history.size() > kQualityHistory) {
            state.quality_history.pop_front();
        }
        if (streak_just_reached(state.quality_history, kDegradedStreak)) {
            RTL433_LOGW("registry", "Device %s has had poor signal quality for %zu consecutive readings",
                        state.identity.c_str(), kDegradedStreak);
        }
    }

    state.last_seen = std::max(state.last_seen, reading.received_at);
    state.last_timestamp = reading.timestamp;
    ++state.reading_count;
    if (!state.available) {
        state.available = true;
        event.changed_fields.push_back("available");
    }

    event.new_state = state;
    return event;
}

std::vector<ChangeEvent> DeviceRegistry::sweep(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChangeEvent> events;
    for (auto& [identity, state] : devices_) {
        // last_seen is read here, under the lock, never from an earlier copy.
        if (!state.available || !expired(state, now)) continue;
        state.available = false;
        ChangeEvent event;
        event.kind = ChangeEvent::Kind::Unavailable;
        event.identity = identity;
        event.changed_fields.push_back("available");
        event.new_state = state;
        events.push_back(std::move(event));
    }
    return events;
}

std::optional<DeviceState> DeviceRegistry::snapshot(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(identity);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

std::vector<DeviceState> DeviceRegistry::all() const {
    std::vector<DeviceState> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(devices_.size());
        for (const auto& [identity, state] : devices_) {
            out.push_back(state);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const DeviceState& a, const DeviceState& b) { return a.identity < b.identity; });
    return out;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::vector<ChangeEvent> DeviceRegistry::set_timeout(Duration device_timeout, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ = device_timeout;
    std::vector<ChangeEvent> events;
    for (auto& [identity, state] : devices_) {
        if (state.available || expired(state, now)) continue;
        state.available = true;
        ChangeEvent event;
        event.kind = ChangeEvent::Kind::Updated;
        event.identity = identity;
        event.changed_fields.push_back("available");
        event.new_state = state;
        events.push_back(std::move(event));
    }
    return events;
}

DeviceRegistry::Duration DeviceRegistry::timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_;
}

bool DeviceRegistry::expired(const DeviceState& state, TimePoint now) const {
    return now - state.last_seen > timeout_;
}

} // namespace rtl433
