#pragma once

#include <app/settings.hpp>

#include <pulsekey/input/motion_sample.hpp>

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_joystick.h>

#include <optional>
#include <string>
#include <vector>

namespace app::input {

struct JoystickInfo {
    SDL_JoystickID id;
    std::string name;
    int numAxes;
    int numButtons;
};

// Reads 6-DOF motion from an SDL3 joystick.
//
// The first joystick with at least six axes whose name contains the configured filter is opened. Hot-plugged devices
// are picked up through ProcessEvent; if the open joystick is removed, the next suitable one is opened.
// Requires SDL_INIT_JOYSTICK.
class SDL3MotionReader final : public pulsekey::input::IMotionReader {
public:
    SDL3MotionReader(const Settings::Device &settings);
    ~SDL3MotionReader();

    SDL3MotionReader(const SDL3MotionReader &) = delete;
    SDL3MotionReader &operator=(const SDL3MotionReader &) = delete;

    // Opens the first suitable joystick among those already connected.
    void OpenFirstAvailable();

    // Handles joystick added/removed events. Returns true if the event was consumed.
    bool ProcessEvent(const SDL_Event &evt);

    std::optional<pulsekey::input::MotionSample> Read() final;

    bool IsConnected() const {
        return m_joystick != nullptr;
    }

    // Returns the ID of the open joystick, or 0 if none is open.
    SDL_JoystickID GetDeviceID() const {
        return m_joystickID;
    }

    const std::string &GetDeviceName() const {
        return m_name;
    }

    // Lists every connected joystick.
    static std::vector<JoystickInfo> ListDevices();

private:
    const Settings::Device &m_settings;

    SDL_Joystick *m_joystick = nullptr;
    SDL_JoystickID m_joystickID = 0;
    std::string m_name;

    bool IsSuitable(SDL_JoystickID id) const;
    bool Open(SDL_JoystickID id);
    void Close();
};

} // namespace app::input
