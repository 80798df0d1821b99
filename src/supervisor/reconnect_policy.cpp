#include "rtl433/supervisor/reconnect_policy.hpp"

#include <algorithm>

namespace rtl433::supervisor {

ReconnectPolicy::ReconnectPolicy(Settings settings) : settings_(settings) {}

ReconnectPolicy::Duration ReconnectPolicy::delay_for(unsigned failure_number) const {
    if (failure_number == 0) return Duration{0};
    Duration delay = settings_.base;
    for (unsigned i = 1; i < failure_number && delay < settings_.max; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings_.max);
}

std::optional<ReconnectPolicy::Duration> ReconnectPolicy::on_failure() {
    ++failures_;
    if (exhausted()) {
        current_delay_ = Duration{0};
        return std::nullopt;
    }
    current_delay_ = delay_for(failures_);
    return current_delay_;
}

bool ReconnectPolicy::on_healthy(Duration uptime) {
    if (failures_ == 0 || uptime < settings_.healthy_reset) {
        return false;
    }
    reset();
    return true;
}

void ReconnectPolicy::reset() {
    failures_ = 0;
    current_delay_ = Duration{0};
}

} // namespace rtl433::supervisor
