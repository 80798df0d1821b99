#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

namespace rtl433::supervisor {

// Splits a byte stream from a pipe into lines (without the trailing '\n' or
// "\r\n") and hands each one to a callback on the calling thread.
class LineReader {
public:
    using LineHandler = std::function<void(std::string_view line)>;

    enum class EndReason {
        // Writer closed the pipe.
        Eof,
        // read()/poll() failed; errno is in last_error().
        Error,
        // The cancel flag was raised.
        Cancelled,
    };

    // Lines longer than max_line are cut at max_line and the remainder up to
    // the next newline is discarded.
    explicit LineReader(int fd, std::size_t max_line = 1024 * 1024);

    // Blocks until EOF, error or cancellation. The cancel flag is checked at
    // least every poll_interval.
    EndReason run(const LineHandler& on_line, const std::atomic<bool>& cancel,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    [[nodiscard]] std::size_t lines() const { return lines_; }
    [[nodiscard]] std::size_t truncated() const { return truncated_; }
    [[nodiscard]] int last_error() const { return last_error_; }

private:
    int fd_;
    std::size_t max_line_;
    std::size_t lines_{0};
    std::size_t truncated_{0};
    int last_error_{0};
};

} // namespace rtl433::supervisor
