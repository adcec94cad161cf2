#pragma once

/**
@file
@brief Tuning parameters for `pulsekey::input::PulseKeyEngine`.
*/

#include <pulsekey/core/types.hpp>

#include <string_view>

namespace pulsekey::input {

/// @brief Output regime of a bound axis.
enum class AxisMode {
    /// @brief Short key taps whose rate follows the magnitude; continuous hold above the hold threshold.
    Pulse,

    /// @brief Key held continuously for as long as the magnitude is outside the deadzone.
    Hold,
};

/// @brief Parses an axis mode name ("Pulse" or "Hold", case-insensitive). Anything else yields `AxisMode::Pulse`.
AxisMode ParseAxisMode(std::string_view str);

std::string_view ToString(AxisMode mode);

/// @brief Parameters shared by every axis bound to one engine.
struct PulseParams {
    /// @brief How long each pulse keeps the key down.
    Seconds pressDuration = 0.020;

    /// @brief Pulse rate at the edge of the deadzone.
    double minHz = 15.0;

    /// @brief Pulse rate just below the hold threshold.
    double maxHz = 30.0;

    /// @brief Filtered magnitudes at or below this value are treated as rest.
    double deadzone = 0.001;

    /// @brief Filtered magnitudes at or above this value hold the key down in pulse mode.
    ///
    /// Should be greater than `deadzone`. If it is not, the rate mapping saturates to `maxHz`.
    double holdThreshold = 0.40;

    /// @brief Smoothing coefficient of the axis filters, in (0, 1].
    double emaAlpha = 0.3;

    /// @brief Replaces out-of-range values with the corresponding values from `defaults`.
    ///
    /// Negative or non-finite values, a non-positive press duration or pulse rate, a `maxHz` below `minHz` and an
    /// `emaAlpha` outside (0, 1] are all reset. A `holdThreshold` that is not above `deadzone` is kept as is.
    ///
    /// @param[in] defaults the replacement values
    /// @return `true` if any value was replaced
    bool Sanitize(const PulseParams &defaults);

    /// @brief Replaces out-of-range values with the defaults above.
    bool Sanitize() {
        return Sanitize(PulseParams{});
    }

    constexpr bool operator==(const PulseParams &) const = default;
};

} // namespace pulsekey::input
