#include "rtl433/supervisor/line_reader.hpp"

#include <array>
#include <cerrno>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace rtl433::supervisor {

LineReader::LineReader(int fd, std::size_t max_line) : fd_(fd), max_line_(max_line) {}

LineReader::EndReason LineReader::run(const LineHandler& on_line, const std::atomic<bool>& cancel,
                                      std::chrono::milliseconds poll_interval) {
    std::string pending;
    bool discarding = false;
    std::array<char, 4096> chunk{};

    auto emit = [&](std::string_view line) {
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        ++lines_;
        on_line(line);
    };

    while (!cancel.load(std::memory_order_acquire)) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            last_error_ = errno;
            return EndReason::Error;
        }
        if (ready == 0) continue;

        const ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            last_error_ = errno;
            return EndReason::Error;
        }
        if (n == 0) {
            // Flush a final unterminated line.
            if (!pending.empty() && !discarding) emit(pending);
            return EndReason::Eof;
        }

        std::size_t start = 0;
        const std::size_t len = static_cast<std::size_t>(n);
        for (std::size_t i = 0; i < len; ++i) {
            if (chunk[i] != '\n') continue;
            if (discarding) {
                discarding = false;
            } else {
                pending.append(chunk.data() + start, i - start);
                if (pending.size() > max_line_) {
                    pending.resize(max_line_);
                    ++truncated_;
                }
                emit(pending);
            }
            pending.clear();
            start = i + 1;
        }
        if (start < len && !discarding) {
            pending.append(chunk.data() + start, len - start);
            if (pending.size() > max_line_) {
                pending.resize(max_line_);
                ++truncated_;
                emit(pending);
                pending.clear();
                discarding = true;
            }
        }
    }
    return EndReason::Cancelled;
}

} // namespace rtl433::supervisor
