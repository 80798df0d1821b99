#include "rtl433/coordinator.hpp"

#include "rtl433/log.hpp"

#include <stdexcept>

namespace rtl433 {

namespace {

constexpr const char* kTag = "coordinator";

bool same_supervisor_settings(const IngestConfig& a, const IngestConfig& b) {
    return a.backoff_base == b.backoff_base && a.backoff_max == b.backoff_max &&
           a.max_consecutive_failures == b.max_consecutive_failures && a.healthy_reset == b.healthy_reset &&
           a.start_grace == b.start_grace && a.start_timeout == b.start_timeout && a.stop_grace == b.stop_grace &&
           a.stall_timeout == b.stall_timeout;
}

} // namespace

Coordinator::Coordinator() : reject_log_(kTag) {}

Coordinator::~Coordinator() {
    stop();
}

void Coordinator::start(const IngestConfig& config) {
    validate(config);
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) throw std::logic_error("Coordinator::start: already started");

    {
        std::lock_guard<std::mutex> flock(failure_mutex_);
        last_failure_.reset();
    }
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        config_ = config;
    }
    apply_runtime_settings(config_);
    hub_.reopen();

    launch_supervisor(config_);

    {
        std::lock_guard<std::mutex> slock(sweep_mutex_);
        sweep_stop_ = false;
        sweep_rearm_ = false;
    }
    sweep_thread_ = std::thread(&Coordinator::sweep_loop, this);
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        started_ = true;
    }
    RTL433_LOGI(kTag, "ingesting from device %d at %s", config_.device_id, config_.frequency.c_str());
}

void Coordinator::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_) return;

    {
        std::lock_guard<std::mutex> slock(sweep_mutex_);
        sweep_stop_ = true;
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) sweep_thread_.join();

    shutdown_supervisor();
    hub_.close();
    reject_log_.flush_all();
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        started_ = false;
    }
    RTL433_LOGI(kTag, "stopped; %zu device(s) known", registry_.size());
}

void Coordinator::reconfigure(const IngestConfig& config) {
    validate(config);
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const IngestConfig previous = config_;
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        config_ = config;
    }
    apply_runtime_settings(config_);
    if (!started_) return;

    const bool restart = build_command(previous) != build_command(config_) ||
                         !same_supervisor_settings(previous, config_) || !supervisor_ ||
                         supervisor_->state() == supervisor::SupervisorState::Failed;
    if (!restart) {
        RTL433_LOGI(kTag, "reconfigured without restarting the decoder");
        return;
    }
    RTL433_LOGI(kTag, "decoder settings changed; restarting");
    shutdown_supervisor();
    hub_.reopen();
    launch_supervisor(config_);
}

Subscription Coordinator::subscribe() {
    return hub_.subscribe();
}

std::optional<DeviceState> Coordinator::snapshot(const std::string& identity) const {
    return registry_.snapshot(identity);
}

std::vector<DeviceState> Coordinator::devices() const {
    return registry_.all();
}

IngestStats Coordinator::stats() const {
    IngestStats s;
    s.lines = lines_.load();
    s.accepted = accepted_.load();
    s.rejected_malformed = rejected_malformed_.load();
    s.rejected_missing_identity = rejected_missing_identity_.load();
    s.filtered = filtered_.load();
    s.field_warnings = field_warnings_.load();
    s.events_published = hub_.published();
    s.events_dropped = hub_.dropped_total();
    s.sweeps = sweeps_.load();
    s.log_suppressed = reject_log_.suppressed_total();
    std::lock_guard<std::mutex> lock(state_mutex_);
    s.restarts = restarts_before_ + (supervisor_ ? supervisor_->status().restarts : 0);
    return s;
}

supervisor::SupervisorStatus Coordinator::supervisor_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!supervisor_) return supervisor::SupervisorStatus{};
    return supervisor_->status();
}

std::optional<supervisor::FailureReport> Coordinator::last_failure() const {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    return last_failure_;
}

IngestConfig Coordinator::config() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return config_;
}

bool Coordinator::started() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return started_;
}

void Coordinator::set_failure_handler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    failure_handler_ = std::move(handler);
}

void Coordinator::ingest_line(std::string_view line, TimePoint received_at) {
    ++lines_;
    NormalizeResult result = normalize(line, received_at);
    if (!result.ok) {
        if (result.reason == RejectReason::MalformedJson) {
            ++rejected_malformed_;
        } else {
            ++rejected_missing_identity_;
        }
        reject_log_.write(to_string(result.reason), "rejected record (%s): %s", to_string(result.reason),
                          result.detail.c_str());
        return;
    }

    Reading& reading = result.reading;
    if (reading.protocol) {
        std::lock_guard<std::mutex> lock(filter_mutex_);
        if (!protocol_filter_.empty() && protocol_filter_.count(*reading.protocol) == 0) {
            ++filtered_;
            return;
        }
    }

    for (const auto& w : reading.warnings) {
        ++field_warnings_;
        reject_log_.write("field_warning", "%s: dropped field %s (%s)", reading.identity.c_str(), w.key.c_str(),
                          w.reason.c_str());
    }

    ++accepted_;
    hub_.publish(registry_.upsert(reading));
}

std::vector<ChangeEvent> Coordinator::sweep(TimePoint now) {
    std::vector<ChangeEvent> events = registry_.sweep(now);
    ++sweeps_;
    for (const auto& e : events) {
        RTL433_LOGI(kTag, "%s unavailable (silent for more than %llds)", e.identity.c_str(),
                    static_cast<long long>(registry_.timeout().count()));
    }
    hub_.publish(events);
    return events;
}

void Coordinator::launch_supervisor(const IngestConfig& config) {
    auto next = std::make_unique<supervisor::ProcessSupervisor>(make_supervisor_config(config));
    next->set_line_handler([this](std::string_view line) { ingest_line(line, Clock::now()); });
    next->set_failure_handler([this](const supervisor::FailureReport& report) { on_failure(report); });
    supervisor::ProcessSupervisor* raw = next.get();
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        if (supervisor_) restarts_before_ += supervisor_->status().restarts;
        supervisor_ = std::move(next);
    }
    try {
        raw->start(build_command(config));
    } catch (const supervisor::SupervisorError&) {
        // Nothing is left running after a lifecycle fault.
        raw->stop();
        throw;
    }
}

void Coordinator::shutdown_supervisor() {
    if (supervisor_) supervisor_->stop();
}

void Coordinator::on_failure(const supervisor::FailureReport& report) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        last_failure_ = report;
        handler = failure_handler_;
    }
    if (report.terminal) {
        RTL433_LOGE(kTag, "decoder gave up (%s): %s", supervisor::to_string(report.kind),
                    supervisor::user_message(report.kind));
        hub_.close();
    }
    if (handler) handler(report);
}

void Coordinator::apply_runtime_settings(const IngestConfig& config) {
    log::Level level;
    if (log::parse_level(config.log_level, level)) log::set_level(level);
    hub_.publish(registry_.set_timeout(config.device_timeout, Clock::now()));
    hub_.set_queue_limit(config.subscriber_queue_limit);
    {
        std::lock_guard<std::mutex> lock(filter_mutex_);
        protocol_filter_ = effective_protocols(config);
    }
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (sweep_interval_ != config.sweep_interval) {
            sweep_interval_ = config.sweep_interval;
            sweep_rearm_ = true;
        }
    }
    sweep_cv_.notify_all();
}

void Coordinator::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!sweep_stop_) {
        const bool woken = sweep_cv_.wait_for(lock, sweep_interval_, [this] { return sweep_stop_ || sweep_rearm_; });
        if (sweep_stop_) break;
        if (woken) {
            // Interval changed: start a fresh wait with the new value.
            sweep_rearm_ = false;
            continue;
        }
        lock.unlock();
        sweep(Clock::now());
        reject_log_.flush(log::RateLimitedLog::SteadyClock::now());
        lock.lock();
    }
}

} // namespace rtl433
