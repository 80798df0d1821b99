#pragma once

#include "rtl433/log.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rtl433::log {

// Per-key throttle for repetitive warnings (malformed records, dropped
// fields). Within each window the first `burst` messages for a key pass; the
// rest are counted, and the count is reported once the window closes, either
// by the next message for that key or by flush(). At most `max_keys` windows
// are tracked; messages for further keys are counted as overflow.
class RateLimitedLog {
public:
    using SteadyClock = std::chrono::steady_clock;

    struct Settings {
        std::size_t burst{3};
        std::chrono::seconds window{300};
        std::size_t max_keys{256};
    };

    explicit RateLimitedLog(const char* tag, Level level = Level::Warn);
    RateLimitedLog(const char* tag, Level level, Settings settings);

    // Emit `fmt` under `key` unless the key is over its budget.
    // Returns true if the message was written.
    bool write(const std::string& key, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    // Same as write() with an explicit clock reading and a preformatted message.
    bool write_at(SteadyClock::time_point now, const std::string& key, const std::string& message);

    // Report and drop every window that has closed by `now`. Returns the
    // number of summary lines written.
    std::size_t flush(SteadyClock::time_point now);
    // Report every pending suppressed count and drop all windows.
    std::size_t flush_all();

    [[nodiscard]] std::size_t suppressed(const std::string& key) const;
    [[nodiscard]] std::size_t suppressed_total() const;
    [[nodiscard]] std::size_t emitted_total() const;
    [[nodiscard]] std::size_t keys() const;
    [[nodiscard]] std::size_t summaries_total() const;

private:
    struct Window {
        SteadyClock::time_point start{};
        std::size_t emitted{0};
        std::size_t suppressed{0};
    };

    void summarize(const std::string& key, std::size_t suppressed);
    std::size_t flush_locked(SteadyClock::time_point now, bool all);

    const char* tag_;
    Level level_;
    Settings settings_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
    std::size_t suppressed_total_{0};
    std::size_t emitted_total_{0};
    std::size_t summaries_total_{0};
    // Suppressed messages whose key found the window table full.
    std::size_t overflow_{0};
};

} // namespace rtl433::log
