#include <catch2/catch_test_macros.hpp>

#include <pulsekey/input/input_devlog.hpp>

using namespace pulsekey;

namespace input_devlog {

TEST_CASE("Per-update input log groups keep trace messages", "[input][devlog]") {
    STATIC_REQUIRE(input::grp::filter::level == devlog::level::trace);
    STATIC_REQUIRE(input::grp::engine::level == devlog::level::trace);
    STATIC_REQUIRE(input::grp::engine_pulse::level == devlog::level::trace);
    STATIC_REQUIRE(input::grp::buttons::level == devlog::level::trace);

    // Only the global switch decides whether press, release and pulse lines are printed
    STATIC_REQUIRE(devlog::trace_enabled<input::grp::engine> == devlog::globalEnable);
    STATIC_REQUIRE(devlog::trace_enabled<input::grp::engine_pulse> == devlog::globalEnable);
    STATIC_REQUIRE(devlog::trace_enabled<input::grp::buttons> == devlog::globalEnable);
}

TEST_CASE("Configuration-time input log groups stay at debug", "[input][devlog]") {
    STATIC_REQUIRE(input::grp::router::level == devlog::level::debug);
    STATIC_REQUIRE(input::grp::mode_switch::level == devlog::level::debug);
    STATIC_REQUIRE_FALSE(devlog::trace_enabled<input::grp::router>);
}

} // namespace input_devlog
