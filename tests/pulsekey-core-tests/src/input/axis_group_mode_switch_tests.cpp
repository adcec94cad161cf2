#include <catch2/catch_test_macros.hpp>

#include <pulsekey/input/axis_group_mode_switch.hpp>

#include "../recording_key_actuator.hpp"

using namespace pulsekey;
using Key = input::KeyboardKey;

namespace axis_group_mode_switch {

struct TestSubject {
    test::RecordingKeyActuator actuator;
    input::PulseKeyEngine engine{actuator, input::PulseParams{.emaAlpha = 1.0}};
    input::AxisGroupModeSwitch modeSwitch{engine, {"left", "right"}, input::AxisMode::Hold};

    TestSubject() {
        engine.Bind("left", Key::A, input::AxisMode::Hold);
        engine.Bind("right", Key::D, input::AxisMode::Hold);
        engine.Bind("turn", Key::End, input::AxisMode::Hold);
    }
};

TEST_CASE_METHOD(TestSubject, "Mode switch releases the group once on change", "[input][modeswitch]") {
    engine.Update("left", 1.0, 0.0);
    engine.Update("turn", 1.0, 0.0);
    REQUIRE(actuator.events == std::vector{test::Press(Key::A), test::Press(Key::End)});

    CHECK(modeSwitch.Apply(input::AxisMode::Pulse));
    CHECK(modeSwitch.GetMode() == input::AxisMode::Pulse);
    CHECK(engine.GetAxis("left")->mode == input::AxisMode::Pulse);
    CHECK(engine.GetAxis("right")->mode == input::AxisMode::Pulse);
    CHECK(engine.GetAxis("turn")->mode == input::AxisMode::Hold);

    // Only the group's down key is released; other axes keep their keys
    CHECK(actuator.events ==
          std::vector{test::Press(Key::A), test::Press(Key::End), test::Release(Key::A)});
    CHECK_FALSE(engine.IsPressed("left"));
    CHECK(engine.IsHeld("turn"));

    SECTION("applying the same mode again does nothing") {
        CHECK_FALSE(modeSwitch.Apply(input::AxisMode::Pulse));
        CHECK(actuator.events.size() == 3);
    }

    SECTION("switching back releases nothing when nothing is down") {
        CHECK(modeSwitch.Apply(input::AxisMode::Hold));
        CHECK(actuator.events.size() == 3);
        CHECK(engine.GetAxis("right")->mode == input::AxisMode::Hold);
    }
}

TEST_CASE_METHOD(TestSubject, "Mode switch to the current mode leaves keys alone", "[input][modeswitch]") {
    engine.Update("right", 1.0, 0.0);

    CHECK_FALSE(modeSwitch.Apply(input::AxisMode::Hold));
    CHECK(actuator.events == std::vector{test::Press(Key::D)});
    CHECK(engine.IsHeld("right"));
}

} // namespace axis_group_mode_switch
