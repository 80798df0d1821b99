#include "rtl433/supervisor/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace rtl433::supervisor {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void make_pipe(int fds[2]) {
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

ExitStatus decode_status(int status) {
    ExitStatus out;
    if (WIFEXITED(status)) {
        out.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.signal = WTERMSIG(status);
    }
    return out;
}

// Build "KEY=value" strings for the child: the parent environment with the
// overrides applied. Done before fork() because the child may only call
// async-signal-safe functions.
std::vector<std::string> build_environment(const Subprocess::Options& options) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool overridden = false;
        for (const auto& [key, value] : options.env) {
            if (entry.compare(0, key.size() + 1, key + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : options.env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace

std::string ExitStatus::describe() const {
    if (signaled()) {
        const char* name = ::strsignal(signal);
        return std::string("killed by signal ") + std::to_string(signal) + (name ? std::string(" (") + name + ")" : "");
    }
    return "exit code " + std::to_string(code);
}

Subprocess Subprocess::spawn(const std::vector<std::string>& argv, const Options& options) {
    if (argv.empty() || argv.front().empty()) {
        throw std::invalid_argument("Subprocess::spawn: empty command line");
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);

    const std::vector<std::string> env = build_environment(options);
    std::vector<char*> c_env;
    c_env.reserve(env.size() + 1);
    for (const auto& entry : env) c_env.push_back(const_cast<char*>(entry.c_str()));
    c_env.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    try {
        make_pipe(out_pipe);
        make_pipe(err_pipe);
        make_pipe(exec_pipe);
    } catch (...) {
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        throw;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::setpgid(0, 0);
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &dfl, nullptr);
        ::sigaction(SIGTERM, &dfl, nullptr);
        ::sigaction(SIGINT, &dfl, nullptr);
        sigset_t none;
        ::sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvpe(c_argv[0], c_argv.data(), c_env.data());

        const int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Also set the group from this side to close the race with a
    // signal sent before the child ran setpgid().
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        throw SpawnError(child_errno, "exec " + argv.front());
    }

    Subprocess proc;
    proc.pid_ = pid;
    proc.stdout_fd_ = out_pipe[0];
    proc.stderr_fd_ = err_pipe[0];
    return proc;
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      status_(std::move(other.status_)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        status_ = std::move(other.status_);
    }
    return *this;
}

Subprocess::~Subprocess() {
    release();
}

void Subprocess::release() noexcept {
    if (pid_ > 0 && !status_) {
        ::kill(-pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
    pid_ = -1;
    status_.reset();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

std::optional<ExitStatus> Subprocess::poll() {
    if (status_ || pid_ <= 0) return status_;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        status_ = decode_status(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere (e.g. a SIGCHLD handler in the host); treat as gone.
        status_ = ExitStatus{};
    }
    return status_;
}

std::optional<ExitStatus> Subprocess::wait_for(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto st = poll()) return st;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool Subprocess::running() {
    return pid_ > 0 && !poll();
}

void Subprocess::signal(int sig) {
    if (pid_ > 0 && !status_) {
        ::kill(-pid_, sig);
    }
}

ExitStatus Subprocess::terminate(std::chrono::milliseconds grace) {
    if (auto st = poll()) {
        // The leader is gone but stragglers in its group may still hold the pipes.
        if (pid_ > 0) ::kill(-pid_, SIGKILL);
        return *st;
    }
    signal(SIGTERM);
    if (auto st = wait_for(grace)) {
        ::kill(-pid_, SIGKILL);
        return *st;
    }
    ::kill(-pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    status_ = decode_status(status);
    return *status_;
}

void Subprocess::close_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

} // namespace rtl433::supervisor
