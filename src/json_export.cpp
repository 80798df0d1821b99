#include "rtl433/json_export.hpp"

#include <memory>
#include <sstream>

namespace rtl433 {

namespace {

void put_optional(Json::Value& obj, const char* key, const std::optional<double>& v) {
    if (v) obj[key] = *v;
}

} // namespace

Json::Value to_json(const MeasurementMap& measurements) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : measurements) {
        if (const bool* flag = std::get_if<bool>(&value)) {
            out[key] = *flag;
        } else {
            out[key] = std::get<double>(value);
        }
    }
    return out;
}

Json::Value to_json(const DeviceState& state) {
    Json::Value out(Json::objectValue);
    out["identity"] = state.identity;
    out["model"] = state.model;
    if (state.brand) out["brand"] = *state.brand;
    if (state.channel) out["channel"] = *state.channel;
    if (state.protocol) out["protocol"] = *state.protocol;
    out["measurements"] = to_json(state.measurements);

    Json::Value signal(Json::objectValue);
    put_optional(signal, "rssi", state.signal.rssi);
    put_optional(signal, "snr", state.signal.snr);
    put_optional(signal, "noise", state.signal.noise);
    out["signal"] = signal;
    out["quality"] = to_string(state.quality);

    out["first_seen"] = format_iso8601(state.first_seen);
    out["last_seen"] = format_iso8601(state.last_seen);
    out["last_timestamp"] = format_iso8601(state.last_timestamp);
    out["available"] = state.available;
    out["reading_count"] = static_cast<Json::UInt64>(state.reading_count);
    return out;
}

Json::Value to_json(const ChangeEvent& event) {
    Json::Value out(Json::objectValue);
    out["event"] = to_string(event.kind);
    out["identity"] = event.identity;
    Json::Value changed(Json::arrayValue);
    for (const auto& f : event.changed_fields) changed.append(f);
    out["changed_fields"] = changed;
    out["state"] = to_json(event.new_state);
    return out;
}

Json::Value to_json(const IngestStats& stats) {
    Json::Value out(Json::objectValue);
    out["lines"] = static_cast<Json::UInt64>(stats.lines);
    out["accepted"] = static_cast<Json::UInt64>(stats.accepted);
    out["rejected_malformed"] = static_cast<Json::UInt64>(stats.rejected_malformed);
    out["rejected_missing_identity"] = static_cast<Json::UInt64>(stats.rejected_missing_identity);
    out["filtered"] = static_cast<Json::UInt64>(stats.filtered);
    out["field_warnings"] = static_cast<Json::UInt64>(stats.field_warnings);
    out["events_published"] = static_cast<Json::UInt64>(stats.events_published);
    out["events_dropped"] = static_cast<Json::UInt64>(stats.events_dropped);
    out["sweeps"] = static_cast<Json::UInt64>(stats.sweeps);
    out["restarts"] = static_cast<Json::UInt64>(stats.restarts);
    out["log_suppressed"] = static_cast<Json::UInt64>(stats.log_suppressed);
    return out;
}

Json::Value to_json(const supervisor::FailureReport& report) {
    Json::Value out(Json::objectValue);
    out["kind"] = supervisor::to_string(report.kind);
    out["message"] = supervisor::user_message(report.kind);
    out["detail"] = report.detail;
    out["consecutive_failures"] = report.consecutive_failures;
    if (report.retry_in) {
        out["retry_in_ms"] = static_cast<Json::Int64>(report.retry_in->count());
    }
    out["terminal"] = report.terminal;
    out["at"] = format_iso8601(report.at);
    return out;
}

std::string to_json_line(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

} // namespace rtl433
