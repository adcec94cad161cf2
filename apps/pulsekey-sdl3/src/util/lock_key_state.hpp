#pragma once

#include <pulsekey/core/configuration_defs.hpp>

#include <optional>

namespace util {

// Reads the LED state of a keyboard lock key.
// Returns std::nullopt if the state cannot be determined on this system.
//
// On Linux this reads the brightness of the matching /sys/class/leds entries; the key is considered lit if any
// keyboard has it lit. On Windows it asks the input system for the toggle state.
std::optional<bool> QueryLockKeyState(pulsekey::core::config::mode::LockKey key);

} // namespace util
