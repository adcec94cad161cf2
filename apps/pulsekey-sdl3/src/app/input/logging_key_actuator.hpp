#pragma once

#include <pulsekey/input/key_actuator.hpp>

namespace app::input {

// Prints key events instead of injecting them. Used for dry runs and on platforms without key injection.
class LoggingKeyActuator final : public pulsekey::input::IKeyActuator {
public:
    void Press(pulsekey::input::KeyboardKey key) final;
    void Release(pulsekey::input::KeyboardKey key) final;
};

} // namespace app::input
