#include "rtl433/config.hpp"

#include "rtl433/log.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <regex>
#include <sstream>

namespace rtl433 {

namespace {

const std::regex& frequency_pattern() {
    static const std::regex re(R"(^\d+(\.\d+)?M?$)");
    return re;
}

std::string format_gain(double gain) {
    char buf[32];
    if (gain == std::floor(gain)) {
        std::snprintf(buf, sizeof(buf), "%d", static_cast<int>(gain));
    } else {
        std::snprintf(buf, sizeof(buf), "%g", gain);
    }
    return buf;
}

double to_seconds(std::chrono::milliseconds d) {
    return static_cast<double>(d.count()) / 1000.0;
}

int read_int(const Json::Value& v, const char* field) {
    if (v.isInt()) return v.asInt();
    if (v.isString()) {
        const std::string s = v.asString();
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos && s.size() < 10) {
            return std::stoi(s);
        }
    }
    throw ConfigError(field, "expected an integer");
}

double read_number(const Json::Value& v, const char* field) {
    if (v.isNumeric() && !v.isBool()) return v.asDouble();
    throw ConfigError(field, "expected a number");
}

std::string read_string(const Json::Value& v, const char* field) {
    if (v.isString()) return v.asString();
    throw ConfigError(field, "expected a string");
}

std::chrono::milliseconds read_duration(const Json::Value& v, const char* field) {
    const double seconds = read_number(v, field);
    if (!std::isfinite(seconds) || seconds < 0) throw ConfigError(field, "expected a non-negative number of seconds");
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

} // namespace

ConfigError::ConfigError(std::string field, const std::string& reason)
    : std::invalid_argument(field + ": " + reason), field_(std::move(field)) {}

std::set<int> parse_protocol_list(std::string_view text) {
    std::set<int> out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos) comma = text.size();
        std::string_view item = text.substr(pos, comma - pos);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
        if (!item.empty()) {
            if (item.find_first_not_of("0123456789") != std::string_view::npos || item.size() > 6) {
                throw ConfigError("protocol_filter", "invalid protocol '" + std::string(item) + "'");
            }
            const int number = std::stoi(std::string(item));
            if (number <= 0) throw ConfigError("protocol_filter", "protocol numbers start at 1");
            out.insert(number);
        }
        pos = comma + 1;
    }
    return out;
}

const std::set<int>& default_protocols() {
    static const std::set<int> protocols{1,  2,  3,  4,  8,  10, 11, 12, 18, 19, 20, 32,
                                         34, 40, 41, 42, 47, 52, 54, 55, 73, 74, 75, 76};
    return protocols;
}

std::set<int> effective_protocols(const IngestConfig& config) {
    if (config.all_protocols) return {};
    return config.protocol_filter.empty() ? default_protocols() : config.protocol_filter;
}

void validate(const IngestConfig& config) {
    if (config.decoder_path.empty()) throw ConfigError("decoder_path", "must not be empty");
    if (config.device_id < 0) throw ConfigError("device_id", "must be a non-negative integer");
    if (!std::regex_match(config.frequency, frequency_pattern())) {
        throw ConfigError("frequency", "'" + config.frequency + "' is not a frequency like 433.92M");
    }
    if (config.gain && (!std::isfinite(*config.gain) || *config.gain < 0.0 || *config.gain > 50.0)) {
        throw ConfigError("gain", "must be between 0 and 50 or \"auto\"");
    }
    for (int p : config.protocol_filter) {
        if (p <= 0) throw ConfigError("protocol_filter", "protocol numbers start at 1");
    }
    if (config.device_timeout.count() <= 0) throw ConfigError("device_timeout", "must be positive");
    if (config.sweep_interval.count() <= 0) throw ConfigError("sweep_interval", "must be positive");
    if (config.subscriber_queue_limit == 0) throw ConfigError("subscriber_queue_limit", "must be positive");
    if (config.backoff_base.count() <= 0) throw ConfigError("backoff_base", "must be positive");
    if (config.backoff_max < config.backoff_base) throw ConfigError("backoff_max", "must be >= backoff_base");
    if (config.healthy_reset.count() < 0) throw ConfigError("healthy_reset", "must not be negative");
    if (config.start_grace.count() < 0) throw ConfigError("start_grace", "must not be negative");
    if (config.start_timeout.count() <= 0) throw ConfigError("start_timeout", "must be positive");
    if (config.stop_grace.count() < 0) throw ConfigError("stop_grace", "must not be negative");
    if (config.stall_timeout.count() < 0) throw ConfigError("stall_timeout", "must not be negative");
    log::Level level;
    if (!log::parse_level(config.log_level, level)) {
        throw ConfigError("log_level", "unknown level '" + config.log_level + "'");
    }
}

std::vector<std::string> build_command(const IngestConfig& config) {
    std::vector<std::string> argv{
        config.decoder_path,
        "-d", std::to_string(config.device_id),
        "-f", config.frequency,
    };
    if (config.gain) {
        argv.push_back("-g");
        argv.push_back(format_gain(*config.gain));
    }
    for (const char* arg : {"-F", "json", "-M", "level", "-M", "time:iso", "-M", "protocol", "-M", "stats", "-v",
                            "-C", "si"}) {
        argv.emplace_back(arg);
    }
    for (int p : effective_protocols(config)) {
        argv.push_back("-R");
        argv.push_back(std::to_string(p));
    }
    return argv;
}

supervisor::SupervisorConfig make_supervisor_config(const IngestConfig& config) {
    supervisor::SupervisorConfig out;
    out.reconnect.base = config.backoff_base;
    out.reconnect.max = config.backoff_max;
    out.reconnect.max_consecutive_failures = config.max_consecutive_failures;
    out.reconnect.healthy_reset = config.healthy_reset;
    out.start_grace = config.start_grace;
    out.start_timeout = config.start_timeout;
    out.stop_grace = config.stop_grace;
    out.stall_timeout = config.stall_timeout;
    return out;
}

IngestConfig config_from_json(const Json::Value& root, const IngestConfig& defaults) {
    if (!root.isObject()) throw ConfigError("<root>", "expected a JSON object");
    IngestConfig c = defaults;

    if (root.isMember("decoder_path")) c.decoder_path = read_string(root["decoder_path"], "decoder_path");
    if (root.isMember("device_id")) c.device_id = read_int(root["device_id"], "device_id");
    if (root.isMember("frequency")) {
        const Json::Value& v = root["frequency"];
        c.frequency = v.isUInt64() ? std::to_string(v.asUInt64()) : read_string(v, "frequency");
    }
    if (root.isMember("gain")) {
        const Json::Value& v = root["gain"];
        if (v.isNull() || (v.isString() && v.asString() == "auto")) {
            c.gain.reset();
        } else if (v.isString()) {
            try {
                std::size_t used = 0;
                const std::string s = v.asString();
                c.gain = std::stod(s, &used);
                if (used != s.size()) throw ConfigError("gain", "expected a number or \"auto\"");
            } catch (const std::logic_error&) {
                throw ConfigError("gain", "expected a number or \"auto\"");
            }
        } else {
            c.gain = read_number(v, "gain");
        }
    }
    if (root.isMember("protocol_filter")) {
        const Json::Value& v = root["protocol_filter"];
        c.protocol_filter.clear();
        if (v.isString()) {
            c.protocol_filter = parse_protocol_list(v.asString());
        } else if (v.isArray()) {
            for (const auto& item : v) c.protocol_filter.insert(read_int(item, "protocol_filter"));
        } else if (!v.isNull()) {
            throw ConfigError("protocol_filter", "expected an array of protocol numbers");
        }
    }
    if (root.isMember("all_protocols")) {
        const Json::Value& v = root["all_protocols"];
        if (!v.isBool()) throw ConfigError("all_protocols", "expected true or false");
        c.all_protocols = v.asBool();
    }
    if (root.isMember("device_timeout")) {
        c.device_timeout = std::chrono::seconds(read_int(root["device_timeout"], "device_timeout"));
    }
    if (root.isMember("sweep_interval")) {
        c.sweep_interval = std::chrono::seconds(read_int(root["sweep_interval"], "sweep_interval"));
    }
    if (root.isMember("subscriber_queue_limit")) {
        const int limit = read_int(root["subscriber_queue_limit"], "subscriber_queue_limit");
        if (limit <= 0) throw ConfigError("subscriber_queue_limit", "must be positive");
        c.subscriber_queue_limit = static_cast<std::size_t>(limit);
    }

    if (root.isMember("supervisor")) {
        const Json::Value& s = root["supervisor"];
        if (!s.isObject()) throw ConfigError("supervisor", "expected an object");
        if (s.isMember("backoff_base")) c.backoff_base = read_duration(s["backoff_base"], "backoff_base");
        if (s.isMember("backoff_max")) c.backoff_max = read_duration(s["backoff_max"], "backoff_max");
        if (s.isMember("max_consecutive_failures")) {
            const int n = read_int(s["max_consecutive_failures"], "max_consecutive_failures");
            if (n < 0) throw ConfigError("max_consecutive_failures", "must not be negative");
            c.max_consecutive_failures = static_cast<unsigned>(n);
        }
        if (s.isMember("healthy_reset")) c.healthy_reset = read_duration(s["healthy_reset"], "healthy_reset");
        if (s.isMember("start_grace")) c.start_grace = read_duration(s["start_grace"], "start_grace");
        if (s.isMember("start_timeout")) c.start_timeout = read_duration(s["start_timeout"], "start_timeout");
        if (s.isMember("stop_grace")) c.stop_grace = read_duration(s["stop_grace"], "stop_grace");
        if (s.isMember("stall_timeout")) c.stall_timeout = read_duration(s["stall_timeout"], "stall_timeout");
    }

    if (root.isMember("log_level")) c.log_level = read_string(root["log_level"], "log_level");

    validate(c);
    return c;
}

IngestConfig parse_config(std::string_view text, const IngestConfig& defaults) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ConfigError("<root>", "invalid JSON: " + errors);
    }
    return config_from_json(root, defaults);
}

IngestConfig load_config_file(const std::string& path, const IngestConfig& defaults) {
    std::ifstream in(path);
    if (!in) throw ConfigError("<file>", "cannot open " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_config(buf.str(), defaults);
}

Json::Value config_to_json(const IngestConfig& config) {
    Json::Value root(Json::objectValue);
    root["decoder_path"] = config.decoder_path;
    root["device_id"] = config.device_id;
    root["frequency"] = config.frequency;
    if (config.gain) {
        root["gain"] = *config.gain;
    } else {
        root["gain"] = "auto";
    }
    Json::Value protocols(Json::arrayValue);
    for (int p : config.protocol_filter) protocols.append(p);
    root["protocol_filter"] = protocols;
    root["all_protocols"] = config.all_protocols;
    root["device_timeout"] = static_cast<Json::Int64>(config.device_timeout.count());
    root["sweep_interval"] = static_cast<Json::Int64>(config.sweep_interval.count());
    root["subscriber_queue_limit"] = static_cast<Json::UInt64>(config.subscriber_queue_limit);

    Json::Value sup(Json::objectValue);
    sup["backoff_base"] = to_seconds(config.backoff_base);
    sup["backoff_max"] = to_seconds(config.backoff_max);
    sup["max_consecutive_failures"] = config.max_consecutive_failures;
    sup["healthy_reset"] = to_seconds(config.healthy_reset);
    sup["start_grace"] = to_seconds(config.start_grace);
    sup["start_timeout"] = to_seconds(config.start_timeout);
    sup["stop_grace"] = to_seconds(config.stop_grace);
    sup["stall_timeout"] = to_seconds(config.stall_timeout);
    root["supervisor"] = sup;

    root["log_level"] = config.log_level;
    return root;
}

} // namespace rtl433
