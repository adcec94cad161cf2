#pragma once

/**
@file
@brief Macros for managing function inlining.

This header defines the `FORCE_INLINE` macro, which forces function inlining and marks the function `inline`.

In Debug builds, the macro has no effect in order to not disrupt the debugging experience. It can also be disabled by
defining `Pulsekey_DISABLE_FORCE_INLINE`.

Note that `FORCE_INLINE` always marks the function `inline` even when disabled.
*/

#if !defined(NDEBUG) || defined(Pulsekey_DISABLE_FORCE_INLINE)
    #define FORCE_INLINE inline
#elif defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    #define FORCE_INLINE [[gnu::always_inline]] inline
#elif defined(_MSC_VER)
    #define FORCE_INLINE [[msvc::forceinline]] inline
#else
    #define FORCE_INLINE inline
#endif
