#pragma once

#include "rtl433/reading.hpp"

#include <string>
#include <string_view>

namespace rtl433 {

enum class RejectReason {
    None,
    // Not parseable as a JSON object.
    MalformedJson,
    // Neither "model" nor "id" present.
    MissingIdentity,
};

const char* to_string(RejectReason reason);

struct NormalizeResult {
    // True when `reading` is populated; otherwise `reason` says why not.
    bool ok{false};
    RejectReason reason{RejectReason::None};
    // Human-readable detail for logs (parser message, offending line prefix).
    std::string detail;
    Reading reading;
};

// Turn one line of `rtl_433 -F json` output into a validated Reading.
// Pure apart from the quality classification; never throws on bad input.
[[nodiscard]] NormalizeResult normalize(std::string_view line, TimePoint received_at);

// Convenience overload stamping the record with Clock::now().
[[nodiscard]] NormalizeResult normalize(std::string_view line);

} // namespace rtl433
