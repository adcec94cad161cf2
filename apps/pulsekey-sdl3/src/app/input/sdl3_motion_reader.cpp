#include "sdl3_motion_reader.hpp"

#include <pulsekey/util/dev_log.hpp>
#include <pulsekey/util/scope_guard.hpp>

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_stdinc.h>

#include <algorithm>

namespace app::input {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // reader

    struct reader {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "MotionReader";
    };

} // namespace grp

// The degrees of freedom a joystick needs to be considered a motion controller.
static constexpr int kMinAxes = 6;

static double NormalizeAxis(Sint16 value) {
    return std::clamp(static_cast<double>(value) / static_cast<double>(SDL_JOYSTICK_AXIS_MAX), -1.0, 1.0);
}

SDL3MotionReader::SDL3MotionReader(const Settings::Device &settings)
    : m_settings(settings) {}

SDL3MotionReader::~SDL3MotionReader() {
    Close();
}

void SDL3MotionReader::OpenFirstAvailable() {
    int count = 0;
    SDL_JoystickID *ids = SDL_GetJoysticks(&count);
    if (ids == nullptr) {
        devlog::warn<grp::reader>("Could not enumerate joysticks: {}", SDL_GetError());
        return;
    }
    util::ScopeGuard sgFreeIDs{[&] { SDL_free(ids); }};

    for (int i = 0; i < count && m_joystick == nullptr; i++) {
        if (IsSuitable(ids[i])) {
            Open(ids[i]);
        }
    }
}

bool SDL3MotionReader::ProcessEvent(const SDL_Event &evt) {
    switch (evt.type) {
    case SDL_EVENT_JOYSTICK_ADDED:
        devlog::debug<grp::reader>("Joystick {} added", evt.jdevice.which);
        if (m_joystick == nullptr && IsSuitable(evt.jdevice.which)) {
            Open(evt.jdevice.which);
        }
        return true;
    case SDL_EVENT_JOYSTICK_REMOVED:
        devlog::debug<grp::reader>("Joystick {} removed", evt.jdevice.which);
        if (m_joystick != nullptr && evt.jdevice.which == m_joystickID) {
            Close();
            OpenFirstAvailable();
        }
        return true;
    default: return false;
    }
}

std::optional<pulsekey::input::MotionSample> SDL3MotionReader::Read() {
    if (m_joystick == nullptr) {
        return std::nullopt;
    }

    const int numAxes = SDL_GetNumJoystickAxes(m_joystick);
    auto readAxis = [&](int index) -> double {
        if (index < 0 || index >= numAxes) {
            return 0.0;
        }
        return NormalizeAxis(SDL_GetJoystickAxis(m_joystick, index));
    };

    pulsekey::input::MotionSample sample{};
    const auto &map = m_settings.axisMap;
    for (size_t i = 0; i < pulsekey::input::kAllMotionAxes.size(); i++) {
        sample.Get(pulsekey::input::kAllMotionAxes[i]) = readAxis(map[i]);
    }

    const int numButtons = SDL_GetNumJoystickButtons(m_joystick);
    if (numButtons > 0) {
        sample.buttons.resize(numButtons);
        for (int i = 0; i < numButtons; i++) {
            sample.buttons[i] = SDL_GetJoystickButton(m_joystick, i);
        }
    }

    return sample;
}

std::vector<JoystickInfo> SDL3MotionReader::ListDevices() {
    std::vector<JoystickInfo> devices{};

    int count = 0;
    SDL_JoystickID *ids = SDL_GetJoysticks(&count);
    if (ids == nullptr) {
        devlog::warn<grp::reader>("Could not enumerate joysticks: {}", SDL_GetError());
        return devices;
    }
    util::ScopeGuard sgFreeIDs{[&] { SDL_free(ids); }};

    for (int i = 0; i < count; i++) {
        SDL_Joystick *joystick = SDL_OpenJoystick(ids[i]);
        if (joystick == nullptr) {
            continue;
        }
        util::ScopeGuard sgClose{[&] { SDL_CloseJoystick(joystick); }};

        const char *name = SDL_GetJoystickName(joystick);
        devices.push_back({
            .id = ids[i],
            .name = name != nullptr ? name : "",
            .numAxes = SDL_GetNumJoystickAxes(joystick),
            .numButtons = SDL_GetNumJoystickButtons(joystick),
        });
    }
    return devices;
}

bool SDL3MotionReader::IsSuitable(SDL_JoystickID id) const {
    const char *name = SDL_GetJoystickNameForID(id);
    const std::string_view nameView = name != nullptr ? name : "";
    if (!m_settings.nameFilter.empty() && nameView.find(m_settings.nameFilter) == std::string_view::npos) {
        return false;
    }

    // The axis count is only known once the joystick is opened
    SDL_Joystick *joystick = SDL_OpenJoystick(id);
    if (joystick == nullptr) {
        devlog::debug<grp::reader>("Could not open joystick {}: {}", id, SDL_GetError());
        return false;
    }
    util::ScopeGuard sgClose{[&] { SDL_CloseJoystick(joystick); }};
    return SDL_GetNumJoystickAxes(joystick) >= kMinAxes;
}

bool SDL3MotionReader::Open(SDL_JoystickID id) {
    SDL_Joystick *joystick = SDL_OpenJoystick(id);
    if (joystick == nullptr) {
        devlog::warn<grp::reader>("Could not open joystick {}: {}", id, SDL_GetError());
        return false;
    }

    m_joystick = joystick;
    m_joystickID = id;
    const char *name = SDL_GetJoystickName(joystick);
    m_name = name != nullptr ? name : "Unnamed joystick";
    devlog::info<grp::reader>("Opened {} ({} axes, {} buttons)", m_name, SDL_GetNumJoystickAxes(joystick),
                              SDL_GetNumJoystickButtons(joystick));
    return true;
}

void SDL3MotionReader::Close() {
    if (m_joystick != nullptr) {
        devlog::info<grp::reader>("Closed {}", m_name);
        SDL_CloseJoystick(m_joystick);
        m_joystick = nullptr;
        m_joystickID = 0;
        m_name.clear();
    }
}

} // namespace app::input
