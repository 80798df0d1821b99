#include "rtl433/supervisor/failure.hpp"

namespace rtl433::supervisor {

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::DeviceNotFound:      return "DeviceNotFound";
    case FailureKind::DeviceBusy:          return "DeviceBusy";
    case FailureKind::PermissionDenied:    return "PermissionDenied";
    case FailureKind::ProcessNotInstalled: return "ProcessNotInstalled";
    case FailureKind::UnexpectedExit:      return "UnexpectedExit";
    case FailureKind::Stalled:             return "Stalled";
    case FailureKind::MaxRetriesExceeded:  return "MaxRetriesExceeded";
    }
    return "Unknown";
}

const char* user_message(FailureKind kind) {
    switch (kind) {
    case FailureKind::DeviceNotFound:
        return "RTL-SDR device not found";
    case FailureKind::DeviceBusy:
        return "RTL-SDR device is in use by another application";
    case FailureKind::PermissionDenied:
        return "Permission denied while opening the RTL-SDR device";
    case FailureKind::ProcessNotInstalled:
        return "rtl_433 executable not found";
    case FailureKind::UnexpectedExit:
        return "RTL-433 process crashed";
    case FailureKind::Stalled:
        return "RTL-433 process stopped producing output";
    case FailureKind::MaxRetriesExceeded:
        return "RTL-433 process failed repeatedly and will not be restarted";
    }
    return "Unknown RTL-433 failure";
}

bool is_lifecycle_fault(FailureKind kind) {
    switch (kind) {
    case FailureKind::DeviceNotFound:
    case FailureKind::DeviceBusy:
    case FailureKind::PermissionDenied:
    case FailureKind::ProcessNotInstalled:
        return true;
    default:
        return false;
    }
}

SupervisorError::SupervisorError(FailureKind kind, const std::string& detail)
    : std::runtime_error(std::string(user_message(kind)) + (detail.empty() ? "" : ": " + detail)),
      kind_(kind) {}

} // namespace rtl433::supervisor
