#include "rtl433/supervisor/stderr_policy.hpp"

#include <algorithm>
#include <cctype>

namespace rtl433::supervisor {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

StderrPolicy StderrPolicy::rtl433_defaults() {
    StderrPolicy policy;
    policy.add_fault("usb_claim_interface error", FailureKind::DeviceBusy);
    policy.add_fault("device or resource busy", FailureKind::DeviceBusy);
    policy.add_fault("LIBUSB_ERROR_BUSY", FailureKind::DeviceBusy);
    policy.add_fault("No supported devices found", FailureKind::DeviceNotFound);
    policy.add_fault("No matching devices found", FailureKind::DeviceNotFound);
    policy.add_fault("device not found", FailureKind::DeviceNotFound);
    policy.add_fault("LIBUSB_ERROR_NO_DEVICE", FailureKind::DeviceNotFound);
    policy.add_fault("usb_open error -3", FailureKind::PermissionDenied);
    policy.add_fault("LIBUSB_ERROR_ACCESS", FailureKind::PermissionDenied);
    policy.add_fault("permission denied", FailureKind::PermissionDenied);
    policy.add_fault("insufficient permissions", FailureKind::PermissionDenied);

    policy.add_benign("PLL not locked");
    policy.add_benign("Detached kernel driver");
    policy.add_benign("Reattached kernel driver");
    policy.add_benign("Allocating");
    policy.add_benign("Exact sample rate is");
    policy.add_benign("Tuner gain set to");
    policy.add_benign("Tuned to");
    policy.add_benign("Found Rafael Micro");
    policy.add_benign("Found Fitipower");
    policy.add_benign("Found Elonics");
    policy.add_benign("Sample rate set to");
    policy.add_benign("Bit detection level");
    policy.add_benign("Registered");
    policy.add_benign("rtl_433 version");
    policy.add_benign("Trying conf file");
    return policy;
}

void StderrPolicy::add_fault(std::string needle, FailureKind kind) {
    faults_.push_back({lowercase(needle), kind});
}

void StderrPolicy::add_benign(std::string needle) {
    benign_.push_back(lowercase(needle));
}

StderrVerdict StderrPolicy::classify(std::string_view line) const {
    const std::string lowered = lowercase(line);
    for (const auto& fault : faults_) {
        if (lowered.find(fault.needle) != std::string::npos) {
            return {StderrVerdict::Class::Fault, fault.kind};
        }
    }
    for (const auto& needle : benign_) {
        if (lowered.find(needle) != std::string::npos) {
            return {StderrVerdict::Class::Benign, std::nullopt};
        }
    }
    return {StderrVerdict::Class::Informational, std::nullopt};
}

} // namespace rtl433::supervisor
