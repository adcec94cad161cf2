#pragma once

#include <pulsekey/util/dev_log.hpp>

namespace pulsekey::input::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   filter
//   engine
//     engine_pulse
//   buttons
//   router
//   mode_switch

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Input";
};

struct filter : public base {
    static constexpr devlog::Level level = devlog::level::trace;
    static constexpr std::string_view name = "AxisFilter";
};

struct engine : public base {
    static constexpr devlog::Level level = devlog::level::trace;
    static constexpr std::string_view name = "PulseEngine";
};

struct engine_pulse : public engine {
    static constexpr std::string_view name = "PulseEngine-Pulse";
};

struct buttons : public base {
    static constexpr devlog::Level level = devlog::level::trace;
    static constexpr std::string_view name = "Buttons";
};

struct router : public base {
    static constexpr std::string_view name = "Router";
};

struct mode_switch : public base {
    static constexpr std::string_view name = "ModeSwitch";
};

} // namespace pulsekey::input::grp
