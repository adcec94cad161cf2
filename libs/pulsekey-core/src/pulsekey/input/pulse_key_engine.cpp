#include <pulsekey/input/pulse_key_engine.hpp>

#include "input_devlog.hpp"

#include <algorithm>
#include <cmath>

namespace pulsekey::input {

// Lower bounds that keep the rate mapping finite when the parameters are degenerate.
static constexpr double kMinSpan = 1e-6;
static constexpr double kMinFrequency = 1e-6;

PulseKeyEngine::PulseKeyEngine(IKeyActuator &actuator, const PulseParams &params)
    : m_actuator(actuator)
    , m_params(params) {

    if (m_params.Sanitize()) {
        devlog::warn<grp::engine>("Some pulse parameters were out of range and have been replaced with defaults");
    }
    if (m_params.holdThreshold <= m_params.deadzone) {
        devlog::warn<grp::engine>("Hold threshold {} is not above deadzone {}; pulse rate will saturate",
                                  m_params.holdThreshold, m_params.deadzone);
    }
    m_filter.SetAlpha(m_params.emaAlpha);
}

void PulseKeyEngine::Bind(const std::string &name, KeyboardKey key, AxisMode mode) {
    if (mode != AxisMode::Pulse && mode != AxisMode::Hold) {
        mode = AxisMode::Pulse;
    }

    if (auto it = m_axes.find(name); it != m_axes.end()) {
        EnsureReleased(name, it->second);
    }

    m_axes[name] = BoundAxis{.key = key, .mode = mode};
    m_filter.Reset(name);

    devlog::debug<grp::engine>("Bound {} to {} ({})", name, ToString(key), ToString(mode));
}

void PulseKeyEngine::Update(const std::string &name, double rawValue, Seconds now) {
    auto it = m_axes.find(name);
    if (it == m_axes.end()) {
        return;
    }
    BoundAxis &axis = it->second;

    const double magnitude = std::abs(m_filter.Filter(name, rawValue));

    // Rest: drop a hold immediately, let a pulse run to its scheduled end
    if (magnitude <= m_params.deadzone) {
        if (axis.held) {
            EnsureReleased(name, axis);
        } else if (axis.pressed && now >= axis.scheduledReleaseTime) {
            Release(name, axis);
        }
        return;
    }

    if (axis.mode == AxisMode::Hold) {
        if (!axis.held) {
            Press(name, axis);
            axis.held = true;
        }
        return;
    }

    // Pulse mode override band
    if (magnitude >= m_params.holdThreshold) {
        if (!axis.held) {
            Press(name, axis);
            axis.held = true;
            devlog::trace<grp::engine_pulse>("{}: entered hold band at {:.2f}", name, magnitude);
        }
        return;
    }

    // Coming back down from the override band
    if (axis.held) {
        Release(name, axis);
        axis.held = false;
    }

    const Seconds interval = PulseInterval(magnitude);
    if (now - axis.lastPulseStartTime >= interval) {
        Press(name, axis);
        axis.scheduledReleaseTime = now + m_params.pressDuration;
        axis.lastPulseStartTime = now;
        devlog::trace<grp::engine_pulse>("{}: pulse at {:.3f}, interval {:.3f}", name, now, interval);
    }

    if (axis.pressed && now >= axis.scheduledReleaseTime) {
        Release(name, axis);
    }
}

void PulseKeyEngine::SetMode(const std::string &name, AxisMode mode) {
    if (auto it = m_axes.find(name); it != m_axes.end()) {
        it->second.mode = mode;
    }
}

void PulseKeyEngine::ForceRelease(const std::string &name) {
    if (auto it = m_axes.find(name); it != m_axes.end()) {
        EnsureReleased(name, it->second);
    }
}

void PulseKeyEngine::ForceReleaseAll() {
    for (auto &[name, axis] : m_axes) {
        EnsureReleased(name, axis);
    }
}

void PulseKeyEngine::Reset() {
    ForceReleaseAll();
    m_filter.ResetAll();
    devlog::debug<grp::engine>("Reset {} axes", m_axes.size());
}

const BoundAxis *PulseKeyEngine::GetAxis(const std::string &name) const {
    auto it = m_axes.find(name);
    return it != m_axes.end() ? &it->second : nullptr;
}

bool PulseKeyEngine::IsPressed(const std::string &name) const {
    const BoundAxis *axis = GetAxis(name);
    return axis != nullptr && axis->pressed;
}

bool PulseKeyEngine::IsHeld(const std::string &name) const {
    const BoundAxis *axis = GetAxis(name);
    return axis != nullptr && axis->held;
}

void PulseKeyEngine::Press(const std::string &name, BoundAxis &axis) {
    if (!axis.pressed) {
        m_actuator.Press(axis.key);
        axis.pressed = true;
        devlog::trace<grp::engine>("{}: press {}", name, ToString(axis.key));
    }
}

void PulseKeyEngine::Release(const std::string &name, BoundAxis &axis) {
    if (axis.pressed) {
        m_actuator.Release(axis.key);
        axis.pressed = false;
        devlog::trace<grp::engine>("{}: release {}", name, ToString(axis.key));
    }
}

void PulseKeyEngine::EnsureReleased(const std::string &name, BoundAxis &axis) {
    if (axis.pressed || axis.held) {
        m_actuator.Release(axis.key);
        devlog::trace<grp::engine>("{}: force release {}", name, ToString(axis.key));
    }
    axis.pressed = false;
    axis.held = false;
    axis.scheduledReleaseTime = 0.0;
}

Seconds PulseKeyEngine::PulseInterval(double magnitude) const {
    const double span = std::max(kMinSpan, m_params.holdThreshold - m_params.deadzone);
    const double unit = std::clamp((magnitude - m_params.deadzone) / span, 0.0, 1.0);
    const double freq = m_params.minHz + unit * (m_params.maxHz - m_params.minHz);
    return 1.0 / std::max(kMinFrequency, freq);
}

} // namespace pulsekey::input
