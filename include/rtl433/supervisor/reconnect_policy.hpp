#pragma once

#include <chrono>
#include <optional>

namespace rtl433::supervisor {

// Exponential backoff with a cap and a retry ceiling. Pure bookkeeping: the
// supervisor owns the clock and the sleeping.
class ReconnectPolicy {
public:
    using Duration = std::chrono::milliseconds;

    struct Settings {
        // Delay after the first failure; doubles on each consecutive failure.
        Duration base{std::chrono::seconds(5)};
        // Upper bound for any single delay.
        Duration max{std::chrono::minutes(5)};
        // Failures tolerated in a row; one more and the policy gives up.
        unsigned max_consecutive_failures{5};
        // Continuous healthy running that clears the failure streak.
        Duration healthy_reset{std::chrono::minutes(1)};
    };

    ReconnectPolicy() = default;
    explicit ReconnectPolicy(Settings settings);

    // Record one transient failure. Returns the delay to wait before the next
    // attempt, or nullopt once the streak exceeds max_consecutive_failures.
    std::optional<Duration> on_failure();

    // Report how long the current run has been healthy. Clears the streak once
    // `uptime` reaches healthy_reset; returns true if it did.
    bool on_healthy(Duration uptime);

    void reset();

    [[nodiscard]] unsigned consecutive_failures() const { return failures_; }
    [[nodiscard]] Duration current_delay() const { return current_delay_; }
    [[nodiscard]] bool exhausted() const { return failures_ > settings_.max_consecutive_failures; }
    [[nodiscard]] const Settings& settings() const { return settings_; }

    // Delay applied after the n-th consecutive failure (n >= 1).
    [[nodiscard]] Duration delay_for(unsigned failure_number) const;

private:
    Settings settings_{};
    unsigned failures_{0};
    Duration current_delay_{0};
};

} // namespace rtl433::supervisor
