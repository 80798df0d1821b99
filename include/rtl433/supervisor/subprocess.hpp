#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace rtl433::supervisor {

// How a child process ended.
struct ExitStatus {
    // Exit code when the child called exit(); -1 when killed by a signal.
    int code{-1};
    // Terminating signal, 0 when the child exited normally.
    int signal{0};

    [[nodiscard]] bool signaled() const { return signal != 0; }
    [[nodiscard]] std::string describe() const;
};

// execvp() failed in the child; errno is carried in code().
class SpawnError : public std::system_error {
public:
    SpawnError(int err, const std::string& what) : std::system_error(err, std::generic_category(), what) {}
};

// Owns one child process and the read ends of its stdout/stderr pipes.
// The child runs in its own process group so that signals reach anything it
// forks. Destroying a still-running Subprocess kills and reaps the group.
class Subprocess {
public:
    struct Options {
        // Environment variables set (or replaced) for the child.
        std::vector<std::pair<std::string, std::string>> env;
    };

    // Fork and exec argv[0] (PATH lookup). Throws SpawnError when exec fails
    // and std::system_error when pipe/fork fail.
    static Subprocess spawn(const std::vector<std::string>& argv, const Options& options);
    static Subprocess spawn(const std::vector<std::string>& argv) { return spawn(argv, Options{}); }

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    ~Subprocess();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const { return stderr_fd_; }

    // Non-blocking reap. Returns the exit status once the child has ended.
    std::optional<ExitStatus> poll();

    // Block up to `timeout` for the child to end.
    std::optional<ExitStatus> wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] bool running();

    // Send `sig` to the child's process group.
    void signal(int sig);

    // SIGTERM, wait up to `grace`, then SIGKILL and reap. Safe to call after
    // the child has already exited.
    ExitStatus terminate(std::chrono::milliseconds grace);

    // Close the pipe read ends (readers must be finished with them).
    void close_pipes();

private:
    Subprocess() = default;
    void release() noexcept;

    pid_t pid_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    std::optional<ExitStatus> status_;
};

} // namespace rtl433::supervisor
