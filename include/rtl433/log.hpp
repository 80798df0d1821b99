// Lightweight leveled logging for the ingestion pipeline.
#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rtl433::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Receives every message at or above the active level. The tag is the
// bracketed component name passed to the macros (e.g. "supervisor").
using Sink = std::function<void(Level level, std::string_view tag, std::string_view message)>;

void set_level(Level level);
Level level();
bool enabled(Level level);

// Replace the output sink. An empty function restores the stderr sink.
void set_sink(Sink sink);

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
bool parse_level(std::string_view text, Level& out);
const char* to_string(Level level);

void write(Level level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

} // namespace rtl433::log

#define RTL433_LOG_AT(lvl, tag, fmt, ...)                                        \
    do {                                                                        \
        if (::rtl433::log::enabled(lvl)) {                                      \
            ::rtl433::log::write(lvl, tag, fmt, ##__VA_ARGS__);                 \
        }                                                                       \
    } while (0)

#define RTL433_LOGD(tag, fmt, ...) RTL433_LOG_AT(::rtl433::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define RTL433_LOGI(tag, fmt, ...) RTL433_LOG_AT(::rtl433::log::Level::Info, tag, fmt, ##__VA_ARGS__)
#define RTL433_LOGW(tag, fmt, ...) RTL433_LOG_AT(::rtl433::log::Level::Warn, tag, fmt, ##__VA_ARGS__)
#define RTL433_LOGE(tag, fmt, ...) RTL433_LOG_AT(::rtl433::log::Level::Error, tag, fmt, ##__VA_ARGS__)
