#include "rtl433/rate_limited_log.hpp"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace rtl433::log {

namespace {

std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed < 0) return "<log format error>";
    std::vector<char> buf(static_cast<std::size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<std::size_t>(needed));
}

} // namespace

RateLimitedLog::RateLimitedLog(const char* tag, Level level) : RateLimitedLog(tag, level, Settings{}) {}

RateLimitedLog::RateLimitedLog(const char* tag, Level level, Settings settings)
    : tag_(tag), level_(level), settings_(settings) {}

bool RateLimitedLog::write(const std::string& key, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string message = vformat(fmt, args);
    va_end(args);
    return write_at(SteadyClock::now(), key, message);
}

bool RateLimitedLog::write_at(SteadyClock::time_point now, const std::string& key, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end()) {
        if (windows_.size() >= settings_.max_keys) flush_locked(now, false);
        if (windows_.size() >= settings_.max_keys) {
            ++overflow_;
            ++suppressed_total_;
            return false;
        }
        it = windows_.emplace(key, Window{now, 0, 0}).first;
    } else if (now - it->second.start >= settings_.window) {
        if (it->second.suppressed > 0) summarize(key, it->second.suppressed);
        it->second = Window{now, 0, 0};
    }

    Window& w = it->second;
    if (w.emitted >= settings_.burst) {
        ++w.suppressed;
        ++suppressed_total_;
        return false;
    }
    ++w.emitted;
    ++emitted_total_;
    if (enabled(level_)) log::write(level_, tag_, "%s", message.c_str());
    return true;
}

std::size_t RateLimitedLog::flush(SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_locked(now, false);
}

std::size_t RateLimitedLog::flush_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_locked(SteadyClock::now(), true);
}

void RateLimitedLog::summarize(const std::string& key, std::size_t suppressed) {
    ++summaries_total_;
    if (enabled(level_)) {
        log::write(level_, tag_, "%s: suppressed %zu similar message(s) in the last %lld s", key.c_str(), suppressed,
                   static_cast<long long>(settings_.window.count()));
    }
}

std::size_t RateLimitedLog::flush_locked(SteadyClock::time_point now, bool all) {
    const std::size_t before = summaries_total_;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (all || now - it->second.start >= settings_.window) {
            if (it->second.suppressed > 0) summarize(it->first, it->second.suppressed);
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
    if (overflow_ > 0 && (all || windows_.size() < settings_.max_keys)) {
        summarize("<other keys>", overflow_);
        overflow_ = 0;
    }
    return summaries_total_ - before;
}

std::size_t RateLimitedLog::suppressed(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(key);
    return it == windows_.end() ? 0 : it->second.suppressed;
}

std::size_t RateLimitedLog::suppressed_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suppressed_total_;
}

std::size_t RateLimitedLog::emitted_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emitted_total_;
}

std::size_t RateLimitedLog::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

std::size_t RateLimitedLog::summaries_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summaries_total_;
}

} // namespace rtl433::log
