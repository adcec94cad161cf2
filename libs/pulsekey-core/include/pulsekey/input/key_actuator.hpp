#pragma once

/**
@file
@brief The key actuator interface through which the core drives keyboard state.
*/

#include "keyboard_key.hpp"

namespace pulsekey::input {

/// @brief Sink for key press and release events.
///
/// The core is the only writer of bound keys and calls these from a single thread, in order. Calls are fire-and-forget:
/// implementations must not throw, and report failures (such as the OS refusing the injection) through their own
/// logging. The core assumes every call succeeded and never rolls back its bookkeeping, so a persistent failure can
/// leave the believed and actual key states out of sync.
class IKeyActuator {
public:
    virtual ~IKeyActuator() = default;

    virtual void Press(KeyboardKey key) = 0;   ///< Puts the key in the pressed state
    virtual void Release(KeyboardKey key) = 0; ///< Puts the key in the released state
};

} // namespace pulsekey::input
