#pragma once

#include "rtl433/supervisor/failure.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtl433::supervisor {

// Verdict for one line of decoder diagnostics.
struct StderrVerdict {
    enum class Class {
        // Known hardware chatter (e.g. PLL lock warnings); never a failure.
        Benign,
        // Anything not in the table; logged at debug level.
        Informational,
        // A real fault; the run fails with `kind`.
        Fault,
    } cls{Class::Informational};

    std::optional<FailureKind> kind;
};

// Pattern table mapping decoder stderr lines onto verdicts. Matching is a
// case-insensitive substring search; fault patterns are checked before benign
// ones so a line mentioning both is treated as a fault.
class StderrPolicy {
public:
    struct FaultPattern {
        std::string needle;
        FailureKind kind;
    };

    // Table tuned for rtl_433 on librtlsdr / libusb.
    static StderrPolicy rtl433_defaults();

    void add_fault(std::string needle, FailureKind kind);
    void add_benign(std::string needle);

    [[nodiscard]] StderrVerdict classify(std::string_view line) const;

    [[nodiscard]] const std::vector<FaultPattern>& faults() const { return faults_; }
    [[nodiscard]] const std::vector<std::string>& benign() const { return benign_; }

private:
    std::vector<FaultPattern> faults_;
    std::vector<std::string> benign_;
};

} // namespace rtl433::supervisor
