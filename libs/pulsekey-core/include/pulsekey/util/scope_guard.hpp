#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, which runs a function on scope exit.
*/

#include <utility>

namespace util {

/// @brief Runs a function when leaving the enclosing scope, unless cancelled.
///
/// Used to tie C-style resources (SDL subsystems, file descriptors) and cleanup disciplines (releasing every key on
/// shutdown) to a scope:
///
/// ```cpp
/// int fd = open(path, O_WRONLY);
/// if (fd < 0) {
///     return false;
/// }
/// util::ScopeGuard sgCloseFD{[&] { close(fd); }};
///
/// if (!Configure(fd)) {
///     return false; // fd is closed here
/// }
///
/// m_fd = fd;
/// sgCloseFD.Cancel(); // ownership transferred; keep it open
/// ```
///
/// @tparam Fn the type of the scope guard function
template <typename Fn>
class ScopeGuard {
public:
    ScopeGuard(Fn &&fn) noexcept
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    ~ScopeGuard() noexcept(noexcept(m_fn())) {
        if (!m_cancelled) {
            m_fn();
        }
    }

    /// @brief Prevents the function from running on scope exit.
    void Cancel() noexcept {
        m_cancelled = true;
    }

private:
    Fn m_fn;
    bool m_cancelled = false;
};

} // namespace util
