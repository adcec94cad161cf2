#pragma once

/**
@file
@brief Pulsekey library version definitions.
*/

#if Pulsekey_DEV_BUILD
    #define Pulsekey_FULL_VERSION Pulsekey_VERSION "-dev"
#else
    #define Pulsekey_FULL_VERSION Pulsekey_VERSION
#endif

namespace pulsekey::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Pulsekey_VERSION;

/// @brief The library version string in the format "<major>.<minor>.<patch>[-dev]".
///
/// Development builds carry a `-dev` suffix.
inline constexpr auto fullstring = Pulsekey_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(Pulsekey_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Pulsekey_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Pulsekey_VERSION_PATCH); ///< The library's patch version

} // namespace pulsekey::version
