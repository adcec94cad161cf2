#include <pulsekey/input/button_edge_dispatcher.hpp>

#include "input_devlog.hpp"

#include <ranges>
#include <thread>

namespace pulsekey::input {

ButtonEdgeDispatcher::ButtonEdgeDispatcher(IKeyActuator &actuator, SettleFn settle)
    : m_actuator(actuator)
    , m_settle(std::move(settle)) {

    if (!m_settle) {
        m_settle = [](std::chrono::microseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void ButtonEdgeDispatcher::Map(uint32 index, KeySequence keys) {
    if (keys.empty()) {
        Unmap(index);
        return;
    }
    devlog::debug<grp::buttons>("Button {} mapped to {}", index, ToString(keys));
    m_mappings[index] = std::move(keys);
}

void ButtonEdgeDispatcher::Unmap(uint32 index) {
    m_mappings.erase(index);
}

const KeySequence &ButtonEdgeDispatcher::GetMapping(uint32 index) const {
    static const KeySequence kEmpty{};
    auto it = m_mappings.find(index);
    return it != m_mappings.end() ? it->second : kEmpty;
}

void ButtonEdgeDispatcher::Dispatch(const std::vector<bool> &buttons, Seconds now) {
    if (buttons.empty()) {
        return;
    }

    if (buttons.size() != m_previous.size()) {
        devlog::debug<grp::buttons>("Button count changed from {} to {}", m_previous.size(), buttons.size());
        m_previous.assign(buttons.size(), false);
    }

    for (size_t i = 0; i < buttons.size(); ++i) {
        if (!buttons[i] || m_previous[i]) {
            continue;
        }
        auto it = m_mappings.find(static_cast<uint32>(i));
        if (it == m_mappings.end()) {
            continue;
        }
        devlog::trace<grp::buttons>("Button {} pressed at {:.3f}, tapping {}", i, now, ToString(it->second));
        Tap(it->second);
    }

    m_previous = buttons;
}

void ButtonEdgeDispatcher::Tap(const KeySequence &keys) {
    for (KeyboardKey key : keys) {
        m_actuator.Press(key);
    }
    m_settle(kSettleDelay);
    for (KeyboardKey key : std::views::reverse(keys)) {
        m_actuator.Release(key);
    }
}

} // namespace pulsekey::input
