#include <pulsekey/input/axis_group_mode_switch.hpp>

#include "input_devlog.hpp"

namespace pulsekey::input {

AxisGroupModeSwitch::AxisGroupModeSwitch(PulseKeyEngine &engine, std::vector<std::string> names, AxisMode mode)
    : m_engine(engine)
    , m_names(std::move(names))
    , m_mode(mode) {}

bool AxisGroupModeSwitch::Apply(AxisMode mode) {
    if (mode == m_mode) {
        return false;
    }

    devlog::debug<grp::mode_switch>("Switching {} axes from {} to {}", m_names.size(), ToString(m_mode),
                                    ToString(mode));

    m_mode = mode;
    for (const std::string &name : m_names) {
        m_engine.SetMode(name, mode);
    }
    for (const std::string &name : m_names) {
        m_engine.ForceRelease(name);
    }
    return true;
}

} // namespace pulsekey::input
