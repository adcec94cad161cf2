#pragma once

#include <pulsekey/input/key_actuator.hpp>

#include <memory>
#include <string>

namespace app::input {

// Creates the key actuator that injects events into the host OS:
// - Linux: a virtual keyboard created through /dev/uinput
// - Windows: SendInput with hardware scan codes
//
// Returns nullptr and fills in `error` if the platform is not supported or the injection device cannot be set up.
std::unique_ptr<pulsekey::input::IKeyActuator> CreatePlatformKeyActuator(std::string &error);

} // namespace app::input
