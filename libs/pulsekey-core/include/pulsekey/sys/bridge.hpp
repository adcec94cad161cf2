#pragma once

/**
@file
@brief Defines `pulsekey::sys::Bridge`, the complete motion-to-keyboard pipeline for one device.
*/

#include <pulsekey/core/configuration.hpp>

#include <pulsekey/input/axis_group_mode_switch.hpp>
#include <pulsekey/input/button_edge_dispatcher.hpp>
#include <pulsekey/input/key_actuator.hpp>
#include <pulsekey/input/motion_router.hpp>
#include <pulsekey/input/motion_sample.hpp>
#include <pulsekey/input/pulse_key_engine.hpp>

#include <pulsekey/core/types.hpp>

#include <string>

namespace pulsekey::sys {

/// @brief Engine axis names used by the bridge.
namespace axis {
    inline const std::string kMoveLeft = "move_left";
    inline const std::string kMoveRight = "move_right";
    inline const std::string kMoveForward = "move_forward";
    inline const std::string kMoveBackward = "move_backward";
    inline const std::string kRotateLeft = "rotate_left";
    inline const std::string kRotateRight = "rotate_right";
    inline const std::string kPitchUp = "pitch_up";
    inline const std::string kPitchDown = "pitch_down";
    inline const std::string kZoomIn = "zoom_in";
    inline const std::string kZoomOut = "zoom_out";
} // namespace axis

/// @brief Wires one device's samples to the keyboard.
///
/// Translation, rotation and pitch go through the movement engine; the two zoom directions go through a separate zoom
/// engine with its own rate range. Buttons are tapped through an edge dispatcher. The four translation axes follow
/// `Configuration::mode.characterMode`: hold in character mode, pulse in camera mode. Rotation and pitch always hold,
/// zoom always pulses.
///
/// Each device needs its own bridge. The configuration and the actuator must outlive the bridge.
class Bridge {
public:
    using SettleFn = input::ButtonEdgeDispatcher::SettleFn;

    /// @brief Builds the pipeline from the configuration.
    /// @param[in] config the configuration; its pulse parameters are sanitized and its mode observable is followed
    /// @param[in] actuator the key sink
    /// @param[in] settle the button settle function, or empty to sleep the calling thread
    Bridge(core::Configuration &config, input::IKeyActuator &actuator,
           SettleFn settle = {});
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    /// @brief Processes one sample taken at time `now` (monotonic seconds).
    void Tick(const input::MotionSample &sample, Seconds now);

    /// @brief Releases every key the bridge holds down.
    ///
    /// Safe to call repeatedly. Also invoked by the destructor.
    void Shutdown();

    /// @brief Releases every key and forgets all input history, ready for samples from a different device.
    void Reset();

    input::PulseKeyEngine &GetMovementEngine() {
        return m_movement;
    }

    input::PulseKeyEngine &GetZoomEngine() {
        return m_zoom;
    }

    input::ButtonEdgeDispatcher &GetButtonDispatcher() {
        return m_buttons;
    }

    /// @brief Returns the current mode of the four translation axes.
    input::AxisMode GetMovementMode() const {
        return m_movementModeSwitch.GetMode();
    }

private:
    core::Configuration &m_config;
    util::Observable<bool>::ObserverID m_modeObserver = 0;

    input::PulseKeyEngine m_movement;
    input::PulseKeyEngine m_zoom;
    input::ButtonEdgeDispatcher m_buttons;
    input::MotionRouter m_router;
    input::AxisGroupModeSwitch m_movementModeSwitch;
};

} // namespace pulsekey::sys
