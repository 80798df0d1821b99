#include "rtl433/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace rtl433::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

Sink& sink_slot() {
    static Sink sink;
    return sink;
}

void stderr_sink(Level level, std::string_view tag, std::string_view message) {
    std::fprintf(stderr, "[%s] [%.*s] %.*s\n",
                 to_string(level),
                 static_cast<int>(tag.size()), tag.data(),
                 static_cast<int>(message.size()), message.data());
}

} // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink_slot() = std::move(sink);
}

bool parse_level(std::string_view text, Level& out) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") {
        out = Level::Debug;
    } else if (lowered == "info") {
        out = Level::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        out = Level::Warn;
    } else if (lowered == "error") {
        out = Level::Error;
    } else {
        return false;
    }
    return true;
}

const char* to_string(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level lvl, const char* tag, const char* fmt, ...) {
    // Format once into a stack buffer, fall back to the heap for long lines
    // (stderr diagnostics from the decoder can be arbitrarily long).
    char stack_buf[512];
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, args);
    va_end(args);

    std::string_view message;
    std::vector<char> heap_buf;
    if (needed < 0) {
        message = "<log format error>";
    } else if (static_cast<std::size_t>(needed) < sizeof(stack_buf)) {
        message = std::string_view(stack_buf, static_cast<std::size_t>(needed));
    } else {
        heap_buf.resize(static_cast<std::size_t>(needed) + 1);
        std::vsnprintf(heap_buf.data(), heap_buf.size(), fmt, copy);
        message = std::string_view(heap_buf.data(), static_cast<std::size_t>(needed));
    }
    va_end(copy);

    std::lock_guard<std::mutex> lock(sink_mutex());
    const Sink& sink = sink_slot();
    if (sink) {
        sink(lvl, tag, message);
    } else {
        stderr_sink(lvl, tag, message);
    }
}

} // namespace rtl433::log
