#pragma once

#include <pulsekey/input/key_actuator.hpp>

#include <pulsekey/core/types.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <ostream>
#include <vector>

namespace test {

struct KeyEvent {
    pulsekey::input::KeyboardKey key;
    bool press;
    Seconds time = 0.0;

    // Time is informational; events compare by key and direction only
    constexpr bool operator==(const KeyEvent &rhs) const {
        return key == rhs.key && press == rhs.press;
    }
};

inline KeyEvent Press(pulsekey::input::KeyboardKey key) {
    return {key, true};
}

inline KeyEvent Release(pulsekey::input::KeyboardKey key) {
    return {key, false};
}

inline std::ostream &operator<<(std::ostream &os, const KeyEvent &value) {
    os << fmt::format("{} {} @ {:.3f}", value.press ? "press" : "release", pulsekey::input::ToString(value.key),
                      value.time);
    return os;
}

// Records every key event along with the timestamp set by the test.
struct RecordingKeyActuator : public pulsekey::input::IKeyActuator {
    void Press(pulsekey::input::KeyboardKey key) override {
        events.push_back({key, true, now});
    }

    void Release(pulsekey::input::KeyboardKey key) override {
        events.push_back({key, false, now});
    }

    size_t CountPresses() const {
        return std::ranges::count_if(events, [](const KeyEvent &event) { return event.press; });
    }

    size_t CountReleases() const {
        return events.size() - CountPresses();
    }

    // Determines if the key is down according to the recorded events.
    bool IsDown(pulsekey::input::KeyboardKey key) const {
        bool down = false;
        for (const KeyEvent &event : events) {
            if (event.key == key) {
                down = event.press;
            }
        }
        return down;
    }

    // Determines if any key is down according to the recorded events.
    bool AnyDown() const {
        return std::ranges::any_of(events, [&](const KeyEvent &event) { return IsDown(event.key); });
    }

    void Clear() {
        events.clear();
    }

    Seconds now = 0.0;
    std::vector<KeyEvent> events;
};

} // namespace test
