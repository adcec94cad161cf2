#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <pulsekey/input/motion_router.hpp>

#include "../recording_key_actuator.hpp"

using namespace pulsekey;
using Key = input::KeyboardKey;

namespace motion_router {

TEST_CASE("Motion router transforms samples", "[input][router]") {
    const input::MotionSample sample{.x = 0.1, .y = 0.2, .z = 0.3, .roll = 0.4, .pitch = 0.5, .yaw = 0.6};

    SECTION("default orientation inverts Y, Z and yaw") {
        input::MotionRouter router{};
        const auto out = router.Transform(sample);
        CHECK(out.x == 0.1);
        CHECK(out.y == -0.2);
        CHECK(out.z == -0.3);
        CHECK(out.roll == 0.4);
        CHECK(out.pitch == 0.5);
        CHECK(out.yaw == -0.6);
    }

    SECTION("no inversions") {
        input::MotionRouter router{input::AxisTransform{.invertY = false, .invertZ = false, .invertYaw = false}};
        const auto out = router.Transform(sample);
        CHECK(out.x == 0.1);
        CHECK(out.y == 0.2);
        CHECK(out.z == 0.3);
        CHECK(out.yaw == 0.6);
    }

    SECTION("all inversions") {
        input::MotionRouter router{input::AxisTransform{.invertX = true,
                                                        .invertY = true,
                                                        .invertZ = true,
                                                        .invertRoll = true,
                                                        .invertPitch = true,
                                                        .invertYaw = true}};
        const auto out = router.Transform(sample);
        CHECK(out.x == -0.1);
        CHECK(out.y == -0.2);
        CHECK(out.z == -0.3);
        CHECK(out.roll == -0.4);
        CHECK(out.pitch == -0.5);
        CHECK(out.yaw == -0.6);
    }

    SECTION("Y/Z swap happens after inversion") {
        input::MotionRouter router{input::AxisTransform{.invertY = true, .invertZ = false, .swapYZ = true}};
        const auto out = router.Transform(sample);
        CHECK(out.y == 0.3);
        CHECK(out.z == -0.2);
    }

    SECTION("buttons pass through") {
        input::MotionSample withButtons = sample;
        withButtons.buttons = {true, false, true};
        input::MotionRouter router{};
        CHECK(router.Transform(withButtons).buttons == std::vector<bool>{true, false, true});
    }
}

TEST_CASE("Motion router drives exactly one direction per axis", "[input][router]") {
    test::RecordingKeyActuator actuator{};
    input::PulseKeyEngine engine{actuator, input::PulseParams{.emaAlpha = 1.0}};
    engine.Bind("right", Key::D, input::AxisMode::Hold);
    engine.Bind("left", Key::A, input::AxisMode::Hold);

    input::MotionRouter router{input::AxisTransform{.invertY = false, .invertZ = false, .invertYaw = false}};
    router.AddRoute(input::MotionAxis::X, engine, "right", "left");

    const double value = GENERATE(-1.0, -0.5, -0.01, 0.0, 0.01, 0.5, 1.0);
    router.Route(input::MotionSample{.x = value}, 0.0);

    if (value > 0.0) {
        CHECK(engine.GetFilteredValue("right") == value);
        CHECK(engine.GetFilteredValue("left") == 0.0);
        CHECK(actuator.events == std::vector{test::Press(Key::D)});
    } else if (value < 0.0) {
        CHECK(engine.GetFilteredValue("left") == -value);
        CHECK(engine.GetFilteredValue("right") == 0.0);
        CHECK(actuator.events == std::vector{test::Press(Key::A)});
    } else {
        CHECK(engine.GetFilteredValue("left") == 0.0);
        CHECK(engine.GetFilteredValue("right") == 0.0);
        CHECK(actuator.events.empty());
    }
}

TEST_CASE("Motion router releases the opposite direction on reversal", "[input][router]") {
    test::RecordingKeyActuator actuator{};
    input::PulseKeyEngine engine{actuator, input::PulseParams{.emaAlpha = 1.0}};
    engine.Bind("up", Key::Up, input::AxisMode::Hold);
    engine.Bind("down", Key::Down, input::AxisMode::Hold);

    input::MotionRouter router{};
    router.AddRoute(input::MotionAxis::Pitch, engine, "up", "down");

    router.Route(input::MotionSample{.pitch = 0.8}, 0.0);
    router.Route(input::MotionSample{.pitch = -0.8}, 0.01);

    // The active direction is updated before the opposite one
    CHECK(actuator.events == std::vector{test::Press(Key::Up), test::Press(Key::Down), test::Release(Key::Up)});
    CHECK(engine.IsHeld("down"));
    CHECK_FALSE(engine.IsPressed("up"));
}

} // namespace motion_router
