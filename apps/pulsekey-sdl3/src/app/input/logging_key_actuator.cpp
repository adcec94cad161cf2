#include "logging_key_actuator.hpp"

#include <fmt/format.h>

namespace app::input {

void LoggingKeyActuator::Press(pulsekey::input::KeyboardKey key) {
    fmt::println("press   {}", pulsekey::input::ToString(key));
}

void LoggingKeyActuator::Release(pulsekey::input::KeyboardKey key) {
    fmt::println("release {}", pulsekey::input::ToString(key));
}

} // namespace app::input
