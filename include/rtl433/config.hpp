#pragma once

#include "rtl433/supervisor/process_supervisor.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace rtl433 {

// Invalid configuration. what() is "<field>: <reason>".
class ConfigError : public std::invalid_argument {
public:
    ConfigError(std::string field, const std::string& reason);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

struct IngestConfig {
    // Decoder executable, resolved through PATH when it has no slash.
    std::string decoder_path{"rtl_433"};
    // RTL-SDR device index (-d).
    int device_id{0};
    // Centre frequency (-f), e.g. "433.92M" or "868300000".
    std::string frequency{"433.92M"};
    // Tuner gain in dB (0..50); empty selects automatic gain (-g omitted).
    std::optional<double> gain{40.0};
    // rtl_433 protocol numbers passed as -R; empty decodes everything.
    std::set<int> protocol_filter;
    // Pass no -R flags and filter nothing.
    bool all_protocols{false};
    std::chrono::seconds device_timeout{3600};
    std::chrono::seconds sweep_interval{30};
    std::size_t subscriber_queue_limit{1024};

    // Supervisor tunables.
    std::chrono::milliseconds backoff_base{std::chrono::seconds(5)};
    std::chrono::milliseconds backoff_max{std::chrono::minutes(5)};
    unsigned max_consecutive_failures{5};
    std::chrono::milliseconds healthy_reset{std::chrono::minutes(1)};
    std::chrono::milliseconds start_grace{std::chrono::seconds(2)};
    std::chrono::milliseconds start_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds stop_grace{std::chrono::seconds(5)};
    std::chrono::milliseconds stall_timeout{0};

    // debug / info / warn / error
    std::string log_level{"info"};
};

// Protocols enabled when the host gives no filter: common weather stations,
// thermometers and TPMS sensors.
const std::set<int>& default_protocols();

// Protocols actually passed as -R and used to filter records; empty when
// all_protocols is set.
std::set<int> effective_protocols(const IngestConfig& config);

// Throws ConfigError naming the first offending field.
void validate(const IngestConfig& config);

// Decoder argv for `config` (assumed valid).
std::vector<std::string> build_command(const IngestConfig& config);

supervisor::SupervisorConfig make_supervisor_config(const IngestConfig& config);

// Unknown keys are ignored; present keys of the wrong type throw ConfigError.
// The result is validated.
IngestConfig config_from_json(const Json::Value& root, const IngestConfig& defaults = IngestConfig{});
IngestConfig parse_config(std::string_view text, const IngestConfig& defaults = IngestConfig{});
IngestConfig load_config_file(const std::string& path, const IngestConfig& defaults = IngestConfig{});

Json::Value config_to_json(const IngestConfig& config);

// "12, 40,3" -> {3, 12, 40}. Throws ConfigError on anything but positive integers.
std::set<int> parse_protocol_list(std::string_view text);

} // namespace rtl433
