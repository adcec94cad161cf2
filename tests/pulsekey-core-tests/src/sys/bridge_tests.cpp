#include <catch2/catch_test_macros.hpp>

#include <pulsekey/sys/bridge.hpp>

#include "../recording_key_actuator.hpp"

#include <chrono>

using namespace pulsekey;
using Key = input::KeyboardKey;

namespace bridge {

struct TestSubject {
    core::Configuration config;
    test::RecordingKeyActuator actuator;
    int settleCount = 0;

    // Ticks every 5 ms, starting at tick `firstTick`.
    void Run(sys::Bridge &bridge, const input::MotionSample &sample, int firstTick, int count) {
        for (int tick = firstTick; tick < firstTick + count; tick++) {
            actuator.now = tick * 0.005;
            bridge.Tick(sample, actuator.now);
        }
    }

    sys::Bridge::SettleFn Settle() {
        return [this](std::chrono::microseconds) { ++settleCount; };
    }
};

TEST_CASE_METHOD(TestSubject, "Bridge binds the default layout", "[sys][bridge]") {
    sys::Bridge bridge{config, actuator, Settle()};

    auto &movement = bridge.GetMovementEngine();
    auto &zoom = bridge.GetZoomEngine();

    CHECK(movement.GetAxis(sys::axis::kMoveLeft)->key == Key::A);
    CHECK(movement.GetAxis(sys::axis::kMoveRight)->key == Key::D);
    CHECK(movement.GetAxis(sys::axis::kMoveForward)->key == Key::W);
    CHECK(movement.GetAxis(sys::axis::kMoveBackward)->key == Key::S);
    CHECK(movement.GetAxis(sys::axis::kRotateLeft)->key == Key::Delete);
    CHECK(movement.GetAxis(sys::axis::kRotateRight)->key == Key::End);
    CHECK(movement.GetAxis(sys::axis::kPitchUp)->key == Key::Up);
    CHECK(movement.GetAxis(sys::axis::kPitchDown)->key == Key::Down);
    CHECK(zoom.GetAxis(sys::axis::kZoomIn)->key == Key::PageUp);
    CHECK(zoom.GetAxis(sys::axis::kZoomOut)->key == Key::PageDown);

    // Camera mode by default
    CHECK(bridge.GetMovementMode() == input::AxisMode::Pulse);
    CHECK(movement.GetAxis(sys::axis::kMoveLeft)->mode == input::AxisMode::Pulse);
    CHECK(movement.GetAxis(sys::axis::kRotateLeft)->mode == input::AxisMode::Hold);
    CHECK(movement.GetAxis(sys::axis::kPitchDown)->mode == input::AxisMode::Hold);
    CHECK(zoom.GetAxis(sys::axis::kZoomIn)->mode == input::AxisMode::Pulse);

    CHECK(movement.GetParams() == config.move);
    CHECK(zoom.GetParams() == config.zoom);

    CHECK(bridge.GetButtonDispatcher().GetMapping(14) == input::KeySequence{Key::LeftShift, Key::Spacebar});
}

TEST_CASE_METHOD(TestSubject, "Bridge drives keys from samples", "[sys][bridge]") {
    sys::Bridge bridge{config, actuator, Settle()};

    SECTION("full deflection to the right holds D") {
        Run(bridge, input::MotionSample{.x = 1.0}, 0, 40);
        CHECK(bridge.GetMovementEngine().IsHeld(sys::axis::kMoveRight));
        CHECK(actuator.IsDown(Key::D));
        CHECK_FALSE(actuator.IsDown(Key::A));
        CHECK(actuator.CountPresses() == 1);
    }

    SECTION("the inverted Y axis moves forward on positive raw values") {
        Run(bridge, input::MotionSample{.y = 1.0}, 0, 40);
        CHECK(actuator.IsDown(Key::W));
        CHECK_FALSE(actuator.IsDown(Key::S));
    }

    SECTION("the inverted yaw rotates left on positive raw values") {
        Run(bridge, input::MotionSample{.yaw = 0.5}, 0, 40);
        CHECK(actuator.IsDown(Key::Delete));
        CHECK_FALSE(actuator.IsDown(Key::End));
    }

    SECTION("zoom pulses") {
        Run(bridge, input::MotionSample{.z = -0.3}, 0, 400);
        CHECK(actuator.CountPresses() > 1);
        for (const auto &event : actuator.events) {
            CHECK(event.key == Key::PageUp);
        }
    }

    SECTION("buttons tap on press edges") {
        input::MotionSample sample{};
        sample.buttons = {false, false};
        Run(bridge, sample, 0, 2);
        sample.buttons = {true, false};
        Run(bridge, sample, 2, 10);

        CHECK(actuator.events == std::vector{test::Press(Key::B), test::Release(Key::B)});
        CHECK(settleCount == 1);
    }

    SECTION("returning to rest releases everything") {
        Run(bridge, input::MotionSample{.x = 1.0, .y = -1.0, .z = 1.0, .pitch = 1.0, .yaw = 1.0}, 0, 100);
        Run(bridge, input::MotionSample{}, 100, 100);
        CHECK_FALSE(actuator.AnyDown());
    }
}

TEST_CASE_METHOD(TestSubject, "Bridge shutdown leaves no key down", "[sys][bridge]") {
    {
        sys::Bridge bridge{config, actuator, Settle()};
        Run(bridge, input::MotionSample{.x = 1.0, .y = 1.0, .z = 0.3, .pitch = -1.0, .yaw = 1.0}, 0, 21);
        REQUIRE(actuator.AnyDown());

        bridge.Shutdown();
        CHECK_FALSE(actuator.AnyDown());

        const size_t count = actuator.events.size();
        bridge.Shutdown();
        CHECK(actuator.events.size() == count);

        Run(bridge, input::MotionSample{.x = -1.0}, 21, 20);
        REQUIRE(actuator.IsDown(Key::A));
    }

    // The destructor releases what is still down
    CHECK_FALSE(actuator.AnyDown());
}

TEST_CASE_METHOD(TestSubject, "Bridge reset drops all state from the previous device", "[sys][bridge]") {
    sys::Bridge bridge{config, actuator, Settle()};

    input::MotionSample sample{.x = 1.0, .z = 1.0, .yaw = 1.0};
    sample.buttons = {true, false};
    Run(bridge, sample, 0, 40);
    REQUIRE(actuator.IsDown(Key::D));
    REQUIRE(actuator.IsDown(Key::Delete));
    REQUIRE(settleCount == 1);

    bridge.Reset();
    CHECK_FALSE(actuator.AnyDown());
    CHECK(bridge.GetMovementEngine().GetFilteredValue(sys::axis::kMoveRight) == 0.0);
    CHECK(bridge.GetZoomEngine().GetFilteredValue(sys::axis::kZoomOut) == 0.0);
    CHECK(bridge.GetButtonDispatcher().GetPreviousState().empty());

    // A new device at rest does not bring the old deflection back
    const size_t count = actuator.events.size();
    input::MotionSample rest{};
    rest.buttons = {false, false};
    Run(bridge, rest, 40, 20);
    CHECK(actuator.events.size() == count);
    CHECK(bridge.GetMovementMode() == input::AxisMode::Pulse);
}

TEST_CASE_METHOD(TestSubject, "Bridge follows the character mode flag", "[sys][bridge]") {
    sys::Bridge bridge{config, actuator, Settle()};

    Run(bridge, input::MotionSample{.x = 1.0, .yaw = 1.0}, 0, 40);
    REQUIRE(actuator.IsDown(Key::D));
    REQUIRE(actuator.IsDown(Key::Delete));

    config.mode.characterMode = true;

    CHECK(bridge.GetMovementMode() == input::AxisMode::Hold);
    CHECK(bridge.GetMovementEngine().GetAxis(sys::axis::kMoveRight)->mode == input::AxisMode::Hold);
    CHECK_FALSE(actuator.IsDown(Key::D));
    CHECK(actuator.IsDown(Key::Delete));

    SECTION("movement holds in character mode") {
        Run(bridge, input::MotionSample{.x = 0.1}, 40, 40);
        CHECK(actuator.IsDown(Key::D));
        CHECK(bridge.GetMovementEngine().IsHeld(sys::axis::kMoveRight));
    }

    SECTION("reassigning the same mode changes nothing") {
        const size_t count = actuator.events.size();
        config.mode.characterMode = true;
        CHECK(actuator.events.size() == count);
    }
}

TEST_CASE_METHOD(TestSubject, "Bridge starts in character mode when the flag is set", "[sys][bridge]") {
    config.mode.characterMode = true;
    sys::Bridge bridge{config, actuator, Settle()};

    CHECK(bridge.GetMovementMode() == input::AxisMode::Hold);
    CHECK(bridge.GetMovementEngine().GetAxis(sys::axis::kMoveForward)->mode == input::AxisMode::Hold);
}

TEST_CASE_METHOD(TestSubject, "Bridge stops observing the configuration when destroyed", "[sys][bridge]") {
    {
        sys::Bridge bridge{config, actuator, Settle()};
    }
    // Would touch a destroyed bridge if the observer were still registered
    config.mode.characterMode = true;
    CHECK(actuator.events.empty());
}

TEST_CASE_METHOD(TestSubject, "Bridge sanitizes the configuration", "[sys][bridge]") {
    config.move.minHz = -5.0;
    config.zoom.emaAlpha = 3.0;
    sys::Bridge bridge{config, actuator, Settle()};

    CHECK(config.move.minHz == core::Configuration::kDefaultMoveParams.minHz);
    CHECK(config.zoom.emaAlpha == core::Configuration::kDefaultZoomParams.emaAlpha);
    CHECK(bridge.GetMovementEngine().GetParams().minHz == core::Configuration::kDefaultMoveParams.minHz);
}

} // namespace bridge
