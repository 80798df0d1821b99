#pragma once

#include "rtl433/config.hpp"
#include "rtl433/device_registry.hpp"
#include "rtl433/normalizer.hpp"
#include "rtl433/rate_limited_log.hpp"
#include "rtl433/subscription.hpp"
#include "rtl433/supervisor/process_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace rtl433 {

struct IngestStats {
    // Lines received from the decoder's stdout.
    std::size_t lines{0};
    std::size_t accepted{0};
    std::size_t rejected_malformed{0};
    std::size_t rejected_missing_identity{0};
    // Accepted records skipped because their protocol is not in the filter.
    std::size_t filtered{0};
    // Individual fields dropped by the normalizer.
    std::size_t field_warnings{0};
    std::size_t events_published{0};
    // Events discarded from full subscriber queues.
    std::size_t events_dropped{0};
    std::size_t sweeps{0};
    // Automatic decoder restarts after transient failures.
    std::size_t restarts{0};
    // Log lines held back by the rate limiter.
    std::size_t log_suppressed{0};

    [[nodiscard]] std::size_t rejected() const { return rejected_malformed + rejected_missing_identity; }
};

// Wires the decoder supervisor, the normalizer and the device registry
// together and fans the resulting change events out to subscribers.
class Coordinator {
public:
    using FailureHandler = supervisor::ProcessSupervisor::FailureHandler;

    Coordinator();
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Validate `config`, launch the decoder and start the sweep timer.
    // Throws ConfigError, supervisor::SupervisorError (lifecycle faults while
    // starting), or std::logic_error when already started.
    void start(const IngestConfig& config);

    // Stop the sweep timer and the decoder, then close every subscription.
    // Idempotent. Registry state is kept.
    void stop();

    // Apply a new configuration. The decoder is restarted only when its
    // command line or supervisor tunables changed; registry state survives.
    void reconfigure(const IngestConfig& config);

    Subscription subscribe();

    [[nodiscard]] std::optional<DeviceState> snapshot(const std::string& identity) const;
    [[nodiscard]] std::vector<DeviceState> devices() const;
    [[nodiscard]] IngestStats stats() const;
    [[nodiscard]] supervisor::SupervisorStatus supervisor_status() const;
    [[nodiscard]] std::optional<supervisor::FailureReport> last_failure() const;
    [[nodiscard]] IngestConfig config() const;
    [[nodiscard]] bool started() const;

    // Called for every supervisor failure; report.terminal marks the one
    // after which the feed is closed.
    void set_failure_handler(FailureHandler handler);

    // Process one decoder stdout line. The supervisor calls this from its
    // reader thread; exposed for replaying captured output.
    void ingest_line(std::string_view line, TimePoint received_at);

    // Run one sweep now and publish its events.
    std::vector<ChangeEvent> sweep(TimePoint now);

private:
    void launch_supervisor(const IngestConfig& config);
    void shutdown_supervisor();
    void on_failure(const supervisor::FailureReport& report);
    void sweep_loop();
    void apply_runtime_settings(const IngestConfig& config);

    // Serialises start/stop/reconfigure. Never taken by accessors, so
    // handlers running on supervisor threads can still query the coordinator
    // while stop() waits for those threads.
    std::mutex lifecycle_mutex_;
    // Guards the four members below for readers; writers hold both mutexes.
    mutable std::mutex state_mutex_;
    IngestConfig config_;
    bool started_{false};
    std::unique_ptr<supervisor::ProcessSupervisor> supervisor_;
    std::size_t restarts_before_{0};

    DeviceRegistry registry_;
    EventHub hub_;
    log::RateLimitedLog reject_log_;

    mutable std::mutex filter_mutex_;
    std::set<int> protocol_filter_;

    mutable std::mutex failure_mutex_;
    FailureHandler failure_handler_;
    std::optional<supervisor::FailureReport> last_failure_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool sweep_stop_{false};
    bool sweep_rearm_{false};
    std::chrono::seconds sweep_interval_{30};
    std::thread sweep_thread_;

    std::atomic<std::size_t> lines_{0};
    std::atomic<std::size_t> accepted_{0};
    std::atomic<std::size_t> rejected_malformed_{0};
    std::atomic<std::size_t> rejected_missing_identity_{0};
    std::atomic<std::size_t> filtered_{0};
    std::atomic<std::size_t> field_warnings_{0};
    std::atomic<std::size_t> sweeps_{0};
};

} // namespace rtl433
