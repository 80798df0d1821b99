#pragma once

#include "rtl433/supervisor/failure.hpp"
#include "rtl433/supervisor/reconnect_policy.hpp"
#include "rtl433/supervisor/stderr_policy.hpp"
#include "rtl433/timestamp.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace rtl433::supervisor {

enum class SupervisorState {
    Stopped,
    Starting,
    Running,
    Failed,
    Stopping,
};

const char* to_string(SupervisorState state);

struct SupervisorConfig {
    ReconnectPolicy::Settings reconnect{};
    // A live process with no fault after this long counts as Running even if
    // it has printed nothing yet.
    std::chrono::milliseconds start_grace{std::chrono::seconds(2)};
    // Upper bound on how long start() blocks waiting for the first outcome.
    std::chrono::milliseconds start_timeout{std::chrono::seconds(10)};
    // SIGTERM -> SIGKILL escalation delay.
    std::chrono::milliseconds stop_grace{std::chrono::seconds(5)};
    // No stdout for this long while Running is a failure; 0 disables.
    std::chrono::milliseconds stall_timeout{0};
    // Control loop tick (liveness polling, healthy-reset and stall checks).
    std::chrono::milliseconds poll_interval{50};
    // Longer stdout/stderr lines are truncated.
    std::size_t max_line{1024 * 1024};
    std::vector<std::pair<std::string, std::string>> env{{"LANG", "C"}};
    StderrPolicy stderr_policy = StderrPolicy::rtl433_defaults();
};

struct FailureReport {
    FailureKind kind{FailureKind::UnexpectedExit};
    // Offending stderr line, exit status or exec error.
    std::string detail;
    unsigned consecutive_failures{0};
    // Delay before the next attempt; empty when no retry will happen.
    std::optional<std::chrono::milliseconds> retry_in;
    // The supervisor has given up; only stop() or a new start() follow.
    bool terminal{false};
    TimePoint at{};
};

struct SupervisorStatus {
    SupervisorState state{SupervisorState::Stopped};
    pid_t pid{-1};
    std::vector<std::string> command;
    unsigned consecutive_failures{0};
    std::chrono::milliseconds current_delay{0};
    std::optional<FailureReport> last_failure;
    std::size_t launches{0};
    std::size_t restarts{0};
    std::size_t stdout_lines{0};
    std::size_t stderr_lines{0};
};

// Owns the external decoder process: spawns it, drains stdout/stderr on two
// reader threads, classifies stderr, and restarts with backoff on transient
// failures. Exactly one child exists at a time and none survives stop() or
// destruction.
//
// Handlers run on supervisor threads (lines on the stdout reader, failures on
// the control thread) and must not call start() or stop().
class ProcessSupervisor {
public:
    using LineHandler = std::function<void(std::string_view line)>;
    using FailureHandler = std::function<void(const FailureReport& report)>;

    explicit ProcessSupervisor(SupervisorConfig config = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Set before start(); stdout lines are delivered in emission order.
    void set_line_handler(LineHandler handler);
    void set_failure_handler(FailureHandler handler);

    // Launch `argv` and block until it is Running, fails, or start_timeout
    // passes. Lifecycle faults seen in that window are thrown as
    // SupervisorError; transient ones are retried in the background.
    // Throws std::logic_error unless Stopped (or terminally Failed).
    void start(std::vector<std::string> argv);

    // Terminate the child (SIGTERM, then SIGKILL after stop_grace) and wait
    // for the control thread. Idempotent; valid from every state.
    void stop();

    [[nodiscard]] SupervisorState state() const;
    [[nodiscard]] SupervisorStatus status() const;

    // Block until the state satisfies `pred` or the timeout passes.
    bool wait_for_state(const std::function<bool(SupervisorState)>& pred, std::chrono::milliseconds timeout) const;

private:
    enum class StartOutcome { Pending, Running, TransientFailure, LifecycleFault, Stopped };

    struct Fault {
        FailureKind kind;
        std::string detail;
    };

    void control_loop();
    std::optional<Fault> run_once();
    void on_stdout_line(std::string_view line);
    void on_stderr_line(std::string_view line);
    void set_state_locked(SupervisorState next);
    void resolve_start_locked(StartOutcome outcome);
    FailureReport make_report_locked(FailureKind kind, std::string detail,
                                     std::optional<std::chrono::milliseconds> retry_in, bool terminal);

    const SupervisorConfig config_;
    ReconnectPolicy policy_;
    LineHandler line_handler_;
    FailureHandler failure_handler_;

    // Serialises start()/stop() against each other.
    std::mutex lifecycle_mutex_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SupervisorState state_{SupervisorState::Stopped};
    StartOutcome start_outcome_{StartOutcome::Pending};
    std::optional<Fault> start_fault_;
    bool stop_requested_{false};
    bool terminal_{false};
    std::optional<Fault> stderr_fault_;
    bool got_stdout_{false};
    int readers_done_{0};
    std::chrono::steady_clock::time_point last_output_{};
    std::vector<std::string> command_;
    pid_t pid_{-1};
    std::optional<FailureReport> last_failure_;
    std::size_t launches_{0};
    std::size_t restarts_{0};
    std::size_t stdout_lines_{0};
    std::size_t stderr_lines_{0};

    std::thread control_;
};

} // namespace rtl433::supervisor
