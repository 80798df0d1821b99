#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rtl433::units {

// A measurement re-expressed in the pipeline's canonical units.
struct CanonicalField {
    std::string key;
    double value{0.0};
    // True when a conversion rule matched (key and/or value changed).
    bool converted{false};
};

// Map a decoder key (and its value) onto canonical units:
//   temperature -> Celsius     (*_F           -> *_C)
//   wind speed  -> m/s         (*_km_h, *_kph, *_mi_h, *_mph -> *_m_s)
//   pressure    -> millibar    (*_hPa, *_kPa, *_psi, *_PSI, *_inHg, *_bar -> *_mbar)
//   rain        -> millimetres (rain*_in -> *_mm, rain*_in_h -> *_mm_h)
// Keys without a rule are returned unchanged.
[[nodiscard]] CanonicalField to_canonical(std::string_view key, double value);

struct ValueRange {
    double min;
    double max;
};

// Plausibility window for a canonical key, if one is known.
[[nodiscard]] std::optional<ValueRange> plausible_range(std::string_view canonical_key);

// Keys whose 0/1 integer encoding is a boolean flag (battery_ok, tamper, ...).
[[nodiscard]] bool is_flag_key(std::string_view key);

} // namespace rtl433::units
