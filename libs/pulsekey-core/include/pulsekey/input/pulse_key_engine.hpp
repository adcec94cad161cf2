#pragma once

/**
@file
@brief Defines `pulsekey::input::PulseKeyEngine`, which turns filtered axis magnitudes into key presses.
*/

#include "axis_signal_filter.hpp"
#include "key_actuator.hpp"
#include "keyboard_key.hpp"
#include "pulse_params.hpp"

#include <pulsekey/core/types.hpp>

#include <string>
#include <unordered_map>

namespace pulsekey::input {

/// @brief Runtime state of one named axis bound to a key.
struct BoundAxis {
    KeyboardKey key = KeyboardKey::None;
    AxisMode mode = AxisMode::Pulse;

    bool pressed = false; ///< The engine believes the key is down
    bool held = false;    ///< The key is in continuous hold (hold mode or the pulse mode override band)

    Seconds lastPulseStartTime = 0.0;   ///< When the most recent pulse began
    Seconds scheduledReleaseTime = 0.0; ///< When the current pulse must end; 0 when none is pending
};

/// @brief Drives keys from analog axis values.
///
/// Each bound axis is a tiny state machine (idle, pulsing, holding) advanced by `Update`. Timestamps are caller-supplied
/// monotonic seconds; the engine never reads a clock and never blocks. All axes bound to one engine share the same
/// `PulseParams` and the same smoothing filter.
///
/// Between calls, if `pressed` is true then either `held` is true or `scheduledReleaseTime` is the end of an ongoing
/// pulse. A release is only issued for a key the engine believes is down, so the actuator never sees unbalanced events.
class PulseKeyEngine {
public:
    /// @brief Creates an engine that drives keys through `actuator`.
    ///
    /// `params` is sanitized on construction. The actuator must outlive the engine.
    PulseKeyEngine(IKeyActuator &actuator, const PulseParams &params = {});

    /// @brief Binds `name` to `key` in the given mode.
    ///
    /// Re-binding an existing name resets its runtime state and its filter. If the previous key was down, it is released
    /// first. Mode values outside the enumeration are treated as `AxisMode::Pulse`.
    void Bind(const std::string &name, KeyboardKey key, AxisMode mode);

    /// @brief Advances the named axis with a new raw sample taken at time `now`. Unbound names are ignored.
    void Update(const std::string &name, double rawValue, Seconds now);

    /// @brief Changes the mode of a bound axis.
    ///
    /// Does not touch the key. Callers switching modes on a pressed axis should follow up with `ForceRelease`.
    void SetMode(const std::string &name, AxisMode mode);

    /// @brief Releases the key of the named axis if it is down and returns the axis to idle.
    void ForceRelease(const std::string &name);

    /// @brief Releases every bound key that is down.
    void ForceReleaseAll();

    /// @brief Releases every bound key and clears all filter history. Bindings and modes are kept.
    void Reset();

    /// @brief Retrieves the state of the named axis, or `nullptr` if it is not bound.
    const BoundAxis *GetAxis(const std::string &name) const;

    bool IsBound(const std::string &name) const {
        return m_axes.contains(name);
    }

    bool IsPressed(const std::string &name) const;
    bool IsHeld(const std::string &name) const;

    /// @brief Returns the last filtered value of the named axis.
    double GetFilteredValue(const std::string &name) const {
        return m_filter.Get(name);
    }

    const PulseParams &GetParams() const {
        return m_params;
    }

private:
    IKeyActuator &m_actuator;
    PulseParams m_params;
    AxisSignalFilter m_filter;

    std::unordered_map<std::string, BoundAxis> m_axes;

    void Press(const std::string &name, BoundAxis &axis);
    void Release(const std::string &name, BoundAxis &axis);
    void EnsureReleased(const std::string &name, BoundAxis &axis);

    // Computes the pulse interval for a magnitude between the deadzone and the hold threshold.
    Seconds PulseInterval(double magnitude) const;
};

} // namespace pulsekey::input
