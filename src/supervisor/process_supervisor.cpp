#include "rtl433/supervisor/process_supervisor.hpp"

#include "rtl433/log.hpp"
#include "rtl433/supervisor/line_reader.hpp"
#include "rtl433/supervisor/subprocess.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace rtl433::supervisor {

namespace {

constexpr const char* kTag = "supervisor";

// How long to let the readers drain buffered output after the child is gone
// before cancelling them (a grandchild outside the group may hold the pipe).
constexpr std::chrono::milliseconds kDrainTimeout{1000};

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

} // namespace

const char* to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::Stopped: return "stopped";
    case SupervisorState::Starting: return "starting";
    case SupervisorState::Running: return "running";
    case SupervisorState::Failed: return "failed";
    case SupervisorState::Stopping: return "stopping";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config)
    : config_(std::move(config)), policy_(config_.reconnect) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

void ProcessSupervisor::set_line_handler(LineHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    line_handler_ = std::move(handler);
}

void ProcessSupervisor::set_failure_handler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_handler_ = std::move(handler);
}

void ProcessSupervisor::start(std::vector<std::string> argv) {
    if (argv.empty() || argv.front().empty()) {
        throw std::invalid_argument("ProcessSupervisor::start: empty command line");
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool idle = state_ == SupervisorState::Stopped || (state_ == SupervisorState::Failed && terminal_);
        if (!idle) {
            throw std::logic_error(std::string("ProcessSupervisor::start: already ") + to_string(state_));
        }
    }
    // A terminal failure leaves the finished control thread to be collected.
    if (control_.joinable()) control_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        command_ = std::move(argv);
        stop_requested_ = false;
        terminal_ = false;
        start_outcome_ = StartOutcome::Pending;
        start_fault_.reset();
        last_failure_.reset();
        policy_.reset();
        set_state_locked(SupervisorState::Starting);
    }
    RTL433_LOGI(kTag, "starting: %s", join_command(command_).c_str());
    control_ = std::thread(&ProcessSupervisor::control_loop, this);

    std::unique_lock<std::mutex> lock(mutex_);
    const bool resolved = cv_.wait_for(lock, config_.start_timeout,
                                       [this] { return start_outcome_ != StartOutcome::Pending; });
    if (!resolved) {
        RTL433_LOGW(kTag, "no start confirmation within %lld ms; continuing in background",
                    static_cast<long long>(config_.start_timeout.count()));
        return;
    }
    if (start_outcome_ == StartOutcome::LifecycleFault && start_fault_) {
        const Fault fault = *start_fault_;
        lock.unlock();
        // The control thread exits on its own after a lifecycle fault.
        if (control_.joinable()) control_.join();
        throw SupervisorError(fault.kind, fault.detail);
    }
}

void ProcessSupervisor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SupervisorState::Stopped && !control_.joinable()) return;
        stop_requested_ = true;
        if (state_ != SupervisorState::Stopped) set_state_locked(SupervisorState::Stopping);
        cv_.notify_all();
    }
    if (control_.joinable()) control_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = -1;
    terminal_ = false;
    resolve_start_locked(StartOutcome::Stopped);
    set_state_locked(SupervisorState::Stopped);
    RTL433_LOGI(kTag, "stopped");
}

SupervisorState ProcessSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SupervisorStatus ProcessSupervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SupervisorStatus out;
    out.state = state_;
    out.pid = pid_;
    out.command = command_;
    out.consecutive_failures = policy_.consecutive_failures();
    out.current_delay = policy_.current_delay();
    out.last_failure = last_failure_;
    out.launches = launches_;
    out.restarts = restarts_;
    out.stdout_lines = stdout_lines_;
    out.stderr_lines = stderr_lines_;
    return out;
}

bool ProcessSupervisor::wait_for_state(const std::function<bool(SupervisorState)>& pred,
                                       std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return pred(state_); });
}

void ProcessSupervisor::set_state_locked(SupervisorState next) {
    if (state_ == next) return;
    RTL433_LOGD(kTag, "state %s -> %s", to_string(state_), to_string(next));
    state_ = next;
    cv_.notify_all();
}

void ProcessSupervisor::resolve_start_locked(StartOutcome outcome) {
    if (start_outcome_ != StartOutcome::Pending) return;
    start_outcome_ = outcome;
    cv_.notify_all();
}

FailureReport ProcessSupervisor::make_report_locked(FailureKind kind, std::string detail,
                                                    std::optional<std::chrono::milliseconds> retry_in,
                                                    bool terminal) {
    FailureReport report;
    report.kind = kind;
    report.detail = std::move(detail);
    report.consecutive_failures = policy_.consecutive_failures();
    report.retry_in = retry_in;
    report.terminal = terminal;
    report.at = Clock::now();
    last_failure_ = report;
    return report;
}

void ProcessSupervisor::control_loop() {
    while (true) {
        const std::optional<Fault> fault = run_once();

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_ || !fault) break;

        FailureReport report;
        if (is_lifecycle_fault(fault->kind)) {
            RTL433_LOGE(kTag, "%s: %s", user_message(fault->kind), fault->detail.c_str());
            report = make_report_locked(fault->kind, fault->detail, std::nullopt, true);
            start_fault_ = fault;
            resolve_start_locked(StartOutcome::LifecycleFault);
        } else if (auto delay = policy_.on_failure()) {
            RTL433_LOGW(kTag, "%s (%s); retry %u in %lld ms", to_string(fault->kind), fault->detail.c_str(),
                        policy_.consecutive_failures(), static_cast<long long>(delay->count()));
            report = make_report_locked(fault->kind, fault->detail, *delay, false);
            resolve_start_locked(StartOutcome::TransientFailure);
        } else {
            RTL433_LOGE(kTag, "%s after %u consecutive failures; last: %s (%s)",
                        to_string(FailureKind::MaxRetriesExceeded), policy_.consecutive_failures(),
                        to_string(fault->kind), fault->detail.c_str());
            report = make_report_locked(FailureKind::MaxRetriesExceeded,
                                        std::string(to_string(fault->kind)) + ": " + fault->detail, std::nullopt,
                                        true);
            resolve_start_locked(StartOutcome::TransientFailure);
        }
        terminal_ = report.terminal;
        pid_ = -1;
        set_state_locked(SupervisorState::Failed);
        FailureHandler handler = failure_handler_;
        lock.unlock();

        if (handler) handler(report);
        if (report.terminal) return;

        lock.lock();
        const bool interrupted = cv_.wait_for(lock, *report.retry_in, [this] { return stop_requested_; });
        if (interrupted) break;
        ++restarts_;
        set_state_locked(SupervisorState::Starting);
        RTL433_LOGI(kTag, "restarting (attempt %zu)", restarts_);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = -1;
    resolve_start_locked(StartOutcome::Stopped);
}

std::optional<ProcessSupervisor::Fault> ProcessSupervisor::run_once() {
    std::vector<std::string> argv;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        argv = command_;
        stderr_fault_.reset();
        got_stdout_ = false;
        readers_done_ = 0;
    }

    Subprocess::Options options;
    options.env = config_.env;
    std::optional<Subprocess> proc;
    try {
        proc.emplace(Subprocess::spawn(argv, options));
    } catch (const SpawnError& e) {
        return Fault{FailureKind::ProcessNotInstalled, e.what()};
    } catch (const std::system_error& e) {
        return Fault{FailureKind::UnexpectedExit, e.what()};
    }

    const pid_t pid = proc->pid();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = pid;
        ++launches_;
        last_output_ = std::chrono::steady_clock::now();
    }
    RTL433_LOGI(kTag, "launched pid %d", static_cast<int>(pid));

    std::atomic<bool> cancel{false};
    auto drain = [this, &cancel](int fd, const char* name, void (ProcessSupervisor::*on_line)(std::string_view)) {
        LineReader reader(fd, config_.max_line);
        const auto end = reader.run([this, on_line](std::string_view line) { (this->*on_line)(line); }, cancel);
        if (end == LineReader::EndReason::Error) {
            RTL433_LOGW(kTag, "%s read failed: %s", name, std::strerror(reader.last_error()));
        }
        if (reader.truncated() > 0) {
            RTL433_LOGW(kTag, "%s: %zu over-long line(s) truncated", name, reader.truncated());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++readers_done_;
        cv_.notify_all();
    };
    std::thread out_reader(drain, proc->stdout_fd(), "stdout", &ProcessSupervisor::on_stdout_line);
    std::thread err_reader(drain, proc->stderr_fd(), "stderr", &ProcessSupervisor::on_stderr_line);

    const auto launched = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point running_since{};
    std::optional<Fault> fault;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, config_.poll_interval, [this] {
                return stop_requested_ || stderr_fault_.has_value() ||
                       (state_ == SupervisorState::Starting && got_stdout_);
            });
            if (stop_requested_) break;
            if (stderr_fault_) {
                fault = std::move(stderr_fault_);
                stderr_fault_.reset();
                break;
            }
        }

        if (auto st = proc->poll()) {
            fault = Fault{FailureKind::UnexpectedExit, st->describe()};
            break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) break;
        const auto now = std::chrono::steady_clock::now();
        if (state_ == SupervisorState::Starting && (got_stdout_ || now - launched >= config_.start_grace)) {
            running_since = now;
            set_state_locked(SupervisorState::Running);
            resolve_start_locked(StartOutcome::Running);
            RTL433_LOGI(kTag, "pid %d running", static_cast<int>(pid));
        }
        if (state_ == SupervisorState::Running) {
            const auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - running_since);
            if (policy_.consecutive_failures() > 0 && policy_.on_healthy(uptime)) {
                RTL433_LOGI(kTag, "healthy for %lld ms, failure streak cleared",
                            static_cast<long long>(uptime.count()));
            }
            if (config_.stall_timeout.count() > 0 && now - last_output_ > config_.stall_timeout) {
                fault = Fault{FailureKind::Stalled, "no output for " + std::to_string(config_.stall_timeout.count()) +
                                                        " ms"};
                break;
            }
        }
    }

    const ExitStatus status = proc->terminate(config_.stop_grace);
    RTL433_LOGI(kTag, "pid %d ended: %s", static_cast<int>(pid), status.describe().c_str());

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, kDrainTimeout, [this] { return readers_done_ == 2; })) {
            RTL433_LOGW(kTag, "output pipes still open after exit; abandoning them");
        }
    }
    cancel.store(true, std::memory_order_release);
    out_reader.join();
    err_reader.join();
    proc->close_pipes();

    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = -1;
    // A fault line that arrived while the exit was being observed explains
    // the exit better than the bare status.
    if (stderr_fault_ && (!fault || fault->kind == FailureKind::UnexpectedExit)) {
        fault = std::move(stderr_fault_);
    }
    stderr_fault_.reset();
    return fault;
}

void ProcessSupervisor::on_stdout_line(std::string_view line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stdout_lines_;
        last_output_ = std::chrono::steady_clock::now();
        if (!got_stdout_) {
            got_stdout_ = true;
            cv_.notify_all();
        }
    }
    if (!line_handler_) return;
    try {
        line_handler_(line);
    } catch (const std::exception& e) {
        RTL433_LOGE(kTag, "line handler threw: %s", e.what());
    }
}

void ProcessSupervisor::on_stderr_line(std::string_view line) {
    const StderrVerdict verdict = config_.stderr_policy.classify(line);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stderr_lines_;
    const int len = static_cast<int>(line.size());
    switch (verdict.cls) {
    case StderrVerdict::Class::Benign:
        RTL433_LOGD(kTag, "decoder (benign): %.*s", len, line.data());
        break;
    case StderrVerdict::Class::Informational:
        RTL433_LOGD(kTag, "decoder: %.*s", len, line.data());
        break;
    case StderrVerdict::Class::Fault:
        RTL433_LOGE(kTag, "decoder fault (%s): %.*s", to_string(*verdict.kind), len, line.data());
        if (!stderr_fault_) {
            stderr_fault_ = Fault{*verdict.kind, std::string(line)};
            cv_.notify_all();
        }
        break;
    }
}

} // namespace rtl433::supervisor
