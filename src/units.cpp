#include "rtl433/units.hpp"

#include <array>

namespace rtl433::units {

namespace {

enum class Transform { FahrenheitToCelsius, Scale };

struct Rule {
    // Rule applies only to keys starting with this prefix (empty: any key).
    std::string_view prefix;
    std::string_view from_suffix;
    std::string_view to_suffix;
    Transform transform;
    double factor;
};

// Longer suffixes first so "_in_h" wins over "_in".
constexpr std::array<Rule, 13> kRules{{
    {"",     "_F",    "_C",     Transform::FahrenheitToCelsius, 1.0},
    {"",     "_km_h", "_m_s",   Transform::Scale, 1.0 / 3.6},
    {"",     "_kph",  "_m_s",   Transform::Scale, 1.0 / 3.6},
    {"",     "_mi_h", "_m_s",   Transform::Scale, 0.44704},
    {"",     "_mph",  "_m_s",   Transform::Scale, 0.44704},
    {"",     "_hPa",  "_mbar",  Transform::Scale, 1.0},
    {"",     "_kPa",  "_mbar",  Transform::Scale, 10.0},
    {"",     "_psi",  "_mbar",  Transform::Scale, 68.947572932},
    {"",     "_PSI",  "_mbar",  Transform::Scale, 68.947572932},
    {"",     "_inHg", "_mbar",  Transform::Scale, 33.863886667},
    {"",     "_bar",  "_mbar",  Transform::Scale, 1000.0},
    {"rain", "_in_h", "_mm_h",  Transform::Scale, 25.4},
    {"rain", "_in",   "_mm",    Transform::Scale, 25.4},
}};

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

CanonicalField to_canonical(std::string_view key, double value) {
    for (const Rule& rule : kRules) {
        if (!starts_with(key, rule.prefix) || !ends_with(key, rule.from_suffix)) {
            continue;
        }
        CanonicalField out;
        out.key.assign(key.substr(0, key.size() - rule.from_suffix.size()));
        out.key.append(rule.to_suffix);
        out.value = rule.transform == Transform::FahrenheitToCelsius
                        ? (value - 32.0) * 5.0 / 9.0
                        : value * rule.factor;
        out.converted = true;
        return out;
    }
    return CanonicalField{std::string(key), value, false};
}

std::optional<ValueRange> plausible_range(std::string_view key) {
    if (starts_with(key, "temperature") && ends_with(key, "_C")) return ValueRange{-40.0, 80.0};
    if (starts_with(key, "humidity")) return ValueRange{0.0, 100.0};
    if (key == "moisture") return ValueRange{0.0, 100.0};
    if (key == "wind_dir_deg") return ValueRange{0.0, 360.0};
    if (starts_with(key, "wind_") && ends_with(key, "_m_s")) return ValueRange{0.0, 60.0};
    if (starts_with(key, "rain") && ends_with(key, "_mm")) return ValueRange{0.0, 10000.0};
    // Tyre pressure sensors report several bar, so only the sign is checked.
    if (starts_with(key, "pressure") && ends_with(key, "_mbar")) return ValueRange{0.0, 20000.0};
    return std::nullopt;
}

bool is_flag_key(std::string_view key) {
    static constexpr std::array<std::string_view, 5> kFlags{
        "battery_ok", "tamper", "alarm", "motion", "button"};
    for (auto flag : kFlags) {
        if (key == flag) return true;
    }
    return false;
}

} // namespace rtl433::units
