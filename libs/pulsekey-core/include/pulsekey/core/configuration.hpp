#pragma once

/**
@file
@brief Defines `pulsekey::core::Configuration` for configuring the motion-to-keyboard bridge.
*/

#include "configuration_defs.hpp"

#include <pulsekey/input/keyboard_key.hpp>
#include <pulsekey/input/motion_router.hpp>
#include <pulsekey/input/pulse_params.hpp>

#include <pulsekey/util/observable.hpp>

#include <pulsekey/core/types.hpp>

#include <map>

namespace pulsekey::core {

/// @brief Bridge configuration.
///
/// Every value has a usable default, so a default-constructed configuration drives a typical 3D viewer out of the box.
/// Values are read when a `sys::Bridge` is constructed, except for observables which are also followed afterwards.
/// Observers run on the thread that assigns the value.
struct Configuration {
    /// @brief Orientation of the device axes.
    ///
    /// The defaults make pushing the cap forward move forward, lifting it zoom in and twisting it clockwise rotate right.
    input::AxisTransform axes;

    /// @brief Pulse parameters of the movement engine (translation, rotation and pitch).
    input::PulseParams move = kDefaultMoveParams;

    /// @brief Pulse parameters of the zoom engine.
    input::PulseParams zoom = kDefaultZoomParams;

    static constexpr input::PulseParams kDefaultMoveParams{};
    static constexpr input::PulseParams kDefaultZoomParams{
        .pressDuration = 0.010,
        .minHz = 8.0,
        .maxHz = 18.0,
        .deadzone = 0.001,
        .holdThreshold = 0.5,
        .emaAlpha = 0.3,
    };

    /// @brief Movement mode selection.
    ///
    /// In character mode the four movement axes hold their keys down. In camera mode they pulse.
    struct Mode {
        /// @brief Follow the LED state of `lockKey`: lit selects character mode.
        bool syncWithLockKey = true;

        /// @brief The lock key followed when `syncWithLockKey` is enabled.
        config::mode::LockKey lockKey = config::mode::LockKey::CapsLock;

        /// @brief Mode used at startup and whenever the lock key state cannot be read.
        bool startInCharacterMode = false;

        /// @brief The current movement mode. Assigning it switches the movement axes of every bridge observing it.
        util::Observable<bool> characterMode = false;
    } mode;

    /// @brief Keys driven by each directional axis.
    struct AxisKeys {
        input::KeyboardKey moveLeft = input::KeyboardKey::A;
        input::KeyboardKey moveRight = input::KeyboardKey::D;
        input::KeyboardKey moveForward = input::KeyboardKey::W;
        input::KeyboardKey moveBackward = input::KeyboardKey::S;
        input::KeyboardKey zoomIn = input::KeyboardKey::PageUp;
        input::KeyboardKey zoomOut = input::KeyboardKey::PageDown;
        input::KeyboardKey rotateLeft = input::KeyboardKey::Delete;
        input::KeyboardKey rotateRight = input::KeyboardKey::End;
        input::KeyboardKey pitchUp = input::KeyboardKey::Up;
        input::KeyboardKey pitchDown = input::KeyboardKey::Down;
    } axisKeys;

    /// @brief Keys tapped by each button, indexed by button number.
    std::map<uint32, input::KeySequence> buttons = DefaultButtons();

    /// @brief Returns the default button mappings.
    static std::map<uint32, input::KeySequence> DefaultButtons();

    /// @brief Replaces out-of-range pulse parameters with their defaults.
    /// @return `true` if any value was replaced
    bool Sanitize();
};

} // namespace pulsekey::core
