#pragma once

/**
@file
@brief Compile-time filtered development log.

Log groups are plain structs with three static members:

```cpp
namespace grp {
    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Engine";
    };

    // Child groups inherit the rules of their parent and override what they need
    struct pulse : public base {
        static constexpr std::string_view name = "Engine-Pulse";
    };
}
```

Messages use {fmt} syntax:

```cpp
devlog::debug<grp::base>("Bound {} to {}", name, key);
devlog::trace<grp::pulse>("Pulse started at {:.3f}", now);
```

Everything below the group's level, and everything when `Pulsekey_ENABLE_DEVLOG` is off, compiles to nothing. Guard
expensive argument computations with `if constexpr (devlog::trace_enabled<grp::pulse>)`.

This is a developer aid; user-facing messages are printed by the application.
*/

#include <pulsekey/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <string_view>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = Pulsekey_ENABLE_DEVLOG;

using Level = uint32;

namespace level {
    inline constexpr Level trace = 1; ///< Per-update details: every pulse, every press and release
    inline constexpr Level debug = 2; ///< Binding changes, mode switches, device events
    inline constexpr Level info = 3;  ///< Infrequent lifecycle events
    inline constexpr Level warn = 4;  ///< Sanitized configuration, failed actuation
    inline constexpr Level error = 5; ///< Failures that disable a feature
    inline constexpr Level off = 6;   ///< Disables a group entirely

    template <Level level>
    inline constexpr const char *name = "unk";
    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    template <Level level, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    template <Level level, Group TGroup, typename... TArgs>
    constexpr void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            fmt::print("{:5s} | {:16s} | ", level::name<level>, TGroup::name);
            fmt::println(fmt, static_cast<TArgs &&>(args)...);
        }
    }

} // namespace detail

template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

template <detail::Group TGroup>
inline constexpr bool info_enabled = detail::enabled<level::info, TGroup>;

template <detail::Group TGroup>
inline constexpr bool warn_enabled = detail::enabled<level::warn, TGroup>;

template <detail::Group TGroup>
inline constexpr bool error_enabled = detail::enabled<level::error, TGroup>;

template <detail::Group TGroup, typename... TArgs>
constexpr void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
