#pragma once

#include <stdexcept>
#include <string>

namespace rtl433::supervisor {

enum class FailureKind {
    // Lifecycle faults: user action required, never retried.
    DeviceNotFound,
    DeviceBusy,
    PermissionDenied,
    ProcessNotInstalled,
    // Transient faults: handled by the reconnect policy.
    UnexpectedExit,
    Stalled,
    // Terminal: transient faults exhausted the retry budget.
    MaxRetriesExceeded,
};

const char* to_string(FailureKind kind);

// Message suitable for showing to the user of the host application.
const char* user_message(FailureKind kind);

// True for faults that a restart cannot fix.
[[nodiscard]] bool is_lifecycle_fault(FailureKind kind);

// Raised synchronously from start()/reconfigure() for lifecycle faults hit
// while the decoder was starting.
class SupervisorError : public std::runtime_error {
public:
    SupervisorError(FailureKind kind, const std::string& detail);

    [[nodiscard]] FailureKind kind() const noexcept { return kind_; }

private:
    FailureKind kind_;
};

} // namespace rtl433::supervisor
