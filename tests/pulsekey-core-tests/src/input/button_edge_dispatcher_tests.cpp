#include <catch2/catch_test_macros.hpp>

#include <pulsekey/input/button_edge_dispatcher.hpp>

#include "../recording_key_actuator.hpp"

#include <chrono>
#include <vector>

using namespace pulsekey;
using Key = input::KeyboardKey;

namespace button_edge_dispatcher {

struct TestSubject {
    test::RecordingKeyActuator actuator;

    // Event count at each settle delay, along with the requested delay
    std::vector<size_t> settleMarks;
    std::vector<std::chrono::microseconds> settleDelays;

    input::ButtonEdgeDispatcher dispatcher{actuator, [this](std::chrono::microseconds delay) {
                                               settleMarks.push_back(actuator.events.size());
                                               settleDelays.push_back(delay);
                                           }};

    TestSubject() {
        dispatcher.Map(0, {Key::B});
        dispatcher.Map(1, {Key::C});
        dispatcher.Map(2, {Key::LeftShift, Key::Spacebar});
    }
};

TEST_CASE_METHOD(TestSubject, "Buttons tap their keys on press edges only", "[input][buttons]") {
    dispatcher.Dispatch({false, false, false}, 0.0);
    CHECK(actuator.events.empty());

    dispatcher.Dispatch({true, false, false}, 0.1);
    CHECK(actuator.events == std::vector{test::Press(Key::B), test::Release(Key::B)});

    dispatcher.Dispatch({true, true, false}, 0.2);
    CHECK(actuator.events == std::vector{test::Press(Key::B), test::Release(Key::B), test::Press(Key::C),
                                         test::Release(Key::C)});

    dispatcher.Dispatch({true, true, false}, 0.3);
    dispatcher.Dispatch({false, false, false}, 0.4);
    CHECK(actuator.events.size() == 4);
    CHECK_FALSE(actuator.AnyDown());

    CHECK(settleMarks == std::vector<size_t>{1, 3});
    CHECK(settleDelays ==
          std::vector<std::chrono::microseconds>{input::ButtonEdgeDispatcher::kSettleDelay,
                                                 input::ButtonEdgeDispatcher::kSettleDelay});
    CHECK(input::ButtonEdgeDispatcher::kSettleDelay == std::chrono::milliseconds{5});
}

TEST_CASE_METHOD(TestSubject, "Combos press in order and release in reverse order", "[input][buttons]") {
    dispatcher.Dispatch({false, false, true}, 0.0);

    CHECK(actuator.events == std::vector{test::Press(Key::LeftShift), test::Press(Key::Spacebar),
                                         test::Release(Key::Spacebar), test::Release(Key::LeftShift)});

    // One settle delay between the last press and the first release
    CHECK(settleMarks == std::vector<size_t>{2});
}

TEST_CASE_METHOD(TestSubject, "Simultaneous press edges tap in button order", "[input][buttons]") {
    dispatcher.Dispatch({true, true, false}, 0.0);

    CHECK(actuator.events == std::vector{test::Press(Key::B), test::Release(Key::B), test::Press(Key::C),
                                         test::Release(Key::C)});
}

TEST_CASE_METHOD(TestSubject, "Button dispatcher handles missing and resized button data", "[input][buttons]") {
    dispatcher.Dispatch({true, false}, 0.0);
    REQUIRE(actuator.events.size() == 2);

    SECTION("empty vectors are ignored") {
        dispatcher.Dispatch({}, 0.1);
        CHECK(dispatcher.GetPreviousState() == std::vector<bool>{true, false});

        // Still held, so no new edge
        dispatcher.Dispatch({true, false}, 0.2);
        CHECK(actuator.events.size() == 2);
    }

    SECTION("a length change starts over from all released") {
        dispatcher.Dispatch({true, false, false}, 0.1);
        CHECK(actuator.events.size() == 4);
        CHECK(actuator.events[2] == test::Press(Key::B));
        CHECK(dispatcher.GetPreviousState() == std::vector<bool>{true, false, false});
    }

    SECTION("a reset forgets buttons that are still held") {
        dispatcher.Reset();
        CHECK(dispatcher.GetPreviousState().empty());

        dispatcher.Dispatch({true, false}, 0.1);
        CHECK(actuator.events.size() == 4);
        CHECK(actuator.events[2] == test::Press(Key::B));
    }
}

TEST_CASE_METHOD(TestSubject, "Unmapped buttons produce no events", "[input][buttons]") {
    SECTION("never mapped") {
        dispatcher.Dispatch({false, false, false, true, true}, 0.0);
        CHECK(actuator.events.empty());
    }

    SECTION("unmapped with an empty sequence") {
        dispatcher.Map(0, {});
        CHECK(dispatcher.GetMapping(0).empty());
        dispatcher.Dispatch({true}, 0.0);
        CHECK(actuator.events.empty());
    }

    SECTION("unmapped explicitly") {
        dispatcher.Unmap(1);
        CHECK(dispatcher.GetMapping(1).empty());
        dispatcher.Dispatch({false, true}, 0.0);
        CHECK(actuator.events.empty());
    }

    CHECK(settleMarks.empty());
}

} // namespace button_edge_dispatcher
