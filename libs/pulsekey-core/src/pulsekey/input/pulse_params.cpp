#include <pulsekey/input/pulse_params.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace pulsekey::input {

namespace {

    bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
        return std::ranges::equal(lhs, rhs, [](char l, char r) {
            return std::tolower(static_cast<unsigned char>(l)) == std::tolower(static_cast<unsigned char>(r));
        });
    }

} // namespace

AxisMode ParseAxisMode(std::string_view str) {
    if (EqualsIgnoreCase(str, "Hold")) {
        return AxisMode::Hold;
    }
    return AxisMode::Pulse;
}

std::string_view ToString(AxisMode mode) {
    switch (mode) {
    case AxisMode::Hold: return "Hold";
    default: [[fallthrough]];
    case AxisMode::Pulse: return "Pulse";
    }
}

bool PulseParams::Sanitize(const PulseParams &defaults) {
    bool replaced = false;

    auto fix = [&](double &value, double fallback, bool valid) {
        if (!std::isfinite(value) || !valid) {
            value = fallback;
            replaced = true;
        }
    };

    fix(pressDuration, defaults.pressDuration, pressDuration > 0.0);
    fix(minHz, defaults.minHz, minHz > 0.0);
    fix(maxHz, defaults.maxHz, maxHz > 0.0);
    if (maxHz < minHz) {
        minHz = defaults.minHz;
        maxHz = defaults.maxHz;
        replaced = true;
    }
    fix(deadzone, defaults.deadzone, deadzone >= 0.0);
    fix(holdThreshold, defaults.holdThreshold, holdThreshold >= 0.0);
    fix(emaAlpha, defaults.emaAlpha, emaAlpha > 0.0 && emaAlpha <= 1.0);

    return replaced;
}

} // namespace pulsekey::input
