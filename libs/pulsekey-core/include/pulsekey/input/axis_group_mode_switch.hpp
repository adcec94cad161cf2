#pragma once

/**
@file
@brief Defines `pulsekey::input::AxisGroupModeSwitch`, which switches a group of engine axes between modes.
*/

#include "pulse_key_engine.hpp"

#include <string>
#include <vector>

namespace pulsekey::input {

/// @brief Switches a group of axes of one engine between pulse and hold modes.
///
/// Changing modes releases every key of the group so that no key stays down across the switch.
class AxisGroupModeSwitch {
public:
    /// @brief Creates a switch over `names`, which are assumed to be bound in `mode` already.
    ///
    /// The engine must outlive the switch.
    AxisGroupModeSwitch(PulseKeyEngine &engine, std::vector<std::string> names, AxisMode mode);

    /// @brief Moves the group to `mode`.
    ///
    /// Does nothing if the group is already in that mode. Otherwise sets the mode of every axis, then force-releases
    /// every axis.
    ///
    /// @return `true` if the mode changed
    bool Apply(AxisMode mode);

    AxisMode GetMode() const {
        return m_mode;
    }

    const std::vector<std::string> &GetNames() const {
        return m_names;
    }

private:
    PulseKeyEngine &m_engine;
    std::vector<std::string> m_names;
    AxisMode m_mode;
};

} // namespace pulsekey::input
