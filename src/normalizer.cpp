#include "rtl433/normalizer.hpp"

#include "rtl433/units.hpp"

#include <json/json.h>

#include <array>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <set>
#include <sstream>

// rtl_433 emits one flat JSON object per decoded message. Apart from a handful
// of well-known metadata keys every field is device specific, so the
// normalizer treats the remaining members as an open measurement map and
// validates each one on its own: a bad field is dropped with a warning, only
// an unparseable line or a missing identity rejects the record.

namespace rtl433 {

namespace {

// Keys that describe the record rather than measure something.
constexpr std::array<std::string_view, 12> kMetadataKeys{
    "model", "id", "channel", "protocol", "time", "brand",
    "rssi", "snr", "noise", "mic", "mod", "subtype"};

bool is_metadata_key(std::string_view key) {
    for (auto k : kMetadataKeys) {
        if (k == key) return true;
    }
    return false;
}

Json::CharReader& json_reader() {
    // CharReader::parse is not const; one reader per thread keeps it lock-free.
    thread_local std::unique_ptr<Json::CharReader> reader = [] {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        builder["failIfExtra"] = true;
        return std::unique_ptr<Json::CharReader>(builder.newCharReader());
    }();
    return *reader;
}

std::string_view trim(std::string_view s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string excerpt(std::string_view line) {
    constexpr std::size_t kMax = 80;
    if (line.size() <= kMax) return std::string(line);
    return std::string(line.substr(0, kMax)) + "...";
}

std::string format_number(double v) {
    std::ostringstream os;
    os.precision(15);
    os << v;
    return os.str();
}

// Scalar JSON value as text, for identity fields. Null and empty strings are
// treated as absent.
std::optional<std::string> scalar_text(const Json::Value& v) {
    if (v.isString()) {
        std::string s = v.asString();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (v.isBool()) return std::string(v.asBool() ? "true" : "false");
    if (v.isInt64()) return std::to_string(v.asInt64());
    if (v.isUInt64()) return std::to_string(v.asUInt64());
    if (v.isDouble()) return format_number(v.asDouble());
    return std::nullopt;
}

std::optional<double> numeric_value(const Json::Value& v) {
    if (v.isBool()) return std::nullopt;
    if (v.isNumeric()) return v.asDouble();
    if (v.isString()) {
        const std::string s = v.asString();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0') return std::nullopt;
        return d;
    }
    return std::nullopt;
}

// Measurements are kept to two decimals so float noise in the decoder output
// does not register as a change.
double round_measurement(double v) {
    if (std::fabs(v) >= 1e12) return v;
    return std::round(v * 100.0) / 100.0;
}

std::optional<double> finite_level(const Json::Value& root, const char* key) {
    if (!root.isMember(key)) return std::nullopt;
    auto v = numeric_value(root[key]);
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return v;
}

void add_measurement(Reading& reading, std::set<std::string>& native_keys,
                     const std::string& key, const Json::Value& value) {
    if (value.isBool()) {
        reading.measurements[key] = value.asBool();
        native_keys.insert(key);
        return;
    }
    if (value.isNull()) {
        reading.warnings.push_back({key, "null value"});
        return;
    }
    if (value.isObject() || value.isArray()) {
        reading.warnings.push_back({key, "unsupported nested value"});
        return;
    }

    const auto number = numeric_value(value);
    if (!number) {
        reading.warnings.push_back({key, "not numeric: " + excerpt(value.asString())});
        return;
    }
    if (!std::isfinite(*number)) {
        reading.warnings.push_back({key, "non-finite value"});
        return;
    }
    if (units::is_flag_key(key) && (*number == 0.0 || *number == 1.0)) {
        reading.measurements[key] = (*number != 0.0);
        native_keys.insert(key);
        return;
    }

    const auto canonical = units::to_canonical(key, *number);
    if (const auto range = units::plausible_range(canonical.key)) {
        if (canonical.value < range->min || canonical.value > range->max) {
            reading.warnings.push_back({key, "out of range: " + format_number(*number)});
            return;
        }
    }
    // A field the decoder already reported in canonical units wins over a
    // converted duplicate (e.g. temperature_C next to temperature_F).
    const double rounded = round_measurement(canonical.value);
    if (canonical.converted) {
        if (native_keys.count(canonical.key) == 0) {
            reading.measurements[canonical.key] = rounded;
        }
        return;
    }
    reading.measurements[canonical.key] = rounded;
    native_keys.insert(canonical.key);
}

} // namespace

const char* to_string(RejectReason reason) {
    switch (reason) {
    case RejectReason::None:            return "none";
    case RejectReason::MalformedJson:   return "malformed_json";
    case RejectReason::MissingIdentity: return "missing_identity";
    }
    return "unknown";
}

std::string make_identity(const std::string& model, const std::string& device_id) {
    if (model.empty()) return device_id;
    if (device_id.empty()) return model;
    return model + "_" + device_id;
}

std::string measurement_to_string(const MeasurementValue& value) {
    if (const bool* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    return format_number(std::get<double>(value));
}

NormalizeResult normalize(std::string_view line) {
    return normalize(line, Clock::now());
}

NormalizeResult normalize(std::string_view line, TimePoint received_at) {
    NormalizeResult result;
    const std::string_view text = trim(line);

    Json::Value root;
    std::string errors;
    if (text.empty() ||
        !json_reader().parse(text.data(), text.data() + text.size(), &root, &errors) ||
        !root.isObject()) {
        result.reason = RejectReason::MalformedJson;
        result.detail = errors.empty() ? "not a JSON object: " + excerpt(text)
                                       : errors + " in: " + excerpt(text);
        return result;
    }

    Reading& reading = result.reading;
    const auto model = root.isMember("model") ? scalar_text(root["model"]) : std::nullopt;
    const auto device_id = root.isMember("id") ? scalar_text(root["id"]) : std::nullopt;
    if (!model && !device_id) {
        result.reason = RejectReason::MissingIdentity;
        result.detail = "no model or id in: " + excerpt(text);
        return result;
    }
    reading.model = model.value_or("");
    reading.device_id = device_id.value_or("");
    reading.identity = make_identity(reading.model, reading.device_id);

    if (root.isMember("channel")) {
        reading.channel = scalar_text(root["channel"]);
    }
    if (root.isMember("brand") && root["brand"].isString()) {
        reading.brand = root["brand"].asString();
    }
    if (root.isMember("protocol")) {
        const auto p = numeric_value(root["protocol"]);
        if (p && std::isfinite(*p) && *p == std::floor(*p) && *p >= 1.0 &&
            *p <= static_cast<double>(std::numeric_limits<int>::max())) {
            reading.protocol = static_cast<int>(*p);
        } else {
            reading.warnings.push_back({"protocol", "not a protocol number"});
        }
    }

    reading.received_at = received_at;
    reading.timestamp = received_at;
    if (root.isMember("time")) {
        const Json::Value& t = root["time"];
        std::optional<TimePoint> parsed;
        if (t.isString()) parsed = parse_iso8601(t.asString());
        if (parsed) {
            reading.timestamp = *parsed;
        } else {
            reading.warnings.push_back({"time", "unparseable timestamp"});
        }
    }

    reading.signal.rssi = finite_level(root, "rssi");
    reading.signal.snr = finite_level(root, "snr");
    reading.signal.noise = finite_level(root, "noise");
    reading.quality = classify(reading.signal);

    std::set<std::string> native_keys;
    for (const auto& key : root.getMemberNames()) {
        if (is_metadata_key(key)) continue;
        add_measurement(reading, native_keys, key, root[key]);
    }

    result.ok = true;
    return result;
}

} // namespace rtl433
