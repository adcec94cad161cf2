#pragma once

/**
@file
@brief Bridge configuration definitions.
*/

namespace pulsekey::core::config {

namespace mode {
    /// @brief Keyboard lock keys whose LED can select the movement mode.
    enum class LockKey { CapsLock, NumLock, ScrollLock };
} // namespace mode

} // namespace pulsekey::core::config
