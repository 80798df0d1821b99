#pragma once

#include "rtl433/log.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace rtl433::test {

// Routes log output into memory for the lifetime of the object.
class CapturedLog {
public:
    struct Entry {
        log::Level level;
        std::string tag;
        std::string message;
    };

    explicit CapturedLog(log::Level level = log::Level::Debug) : previous_(log::level()) {
        log::set_level(level);
        log::set_sink([this](log::Level lvl, std::string_view tag, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back({lvl, std::string(tag), std::string(message)});
        });
    }

    ~CapturedLog() {
        log::set_sink(nullptr);
        log::set_level(previous_);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::size_t count(log::Level level, std::string_view tag = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.level == level && (tag.empty() || e.tag == tag)) ++n;
        }
        return n;
    }

    std::size_t count_containing(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.message.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

private:
    log::Level previous_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// Executable /bin/sh script in a private temporary directory, standing in
// for rtl_433. Removed with its directory on destruction.
class TempScript {
public:
    explicit TempScript(const std::string& body) {
        char pattern[] = "/tmp/rtl433_ingest_test_XXXXXX";
        if (::mkdtemp(pattern) == nullptr) throw std::runtime_error("mkdtemp failed");
        dir_ = pattern;
        path_ = (dir_ / "fake_rtl_433").string();
        {
            std::ofstream out(path_);
            out << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
    }

    ~TempScript() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] std::string file(const std::string& name) const { return (dir_ / name).string(); }

private:
    std::filesystem::path dir_;
    std::string path_;
};

// Poll `pred` until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace rtl433::test
