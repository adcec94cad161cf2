#include "lock_key_state.hpp"

#if defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
#elif defined(__linux__)
    #include <filesystem>
    #include <fstream>
    #include <string>
    #include <string_view>
#endif

using LockKey = pulsekey::core::config::mode::LockKey;

namespace util {

std::optional<bool> QueryLockKeyState(LockKey key) {
#if defined(_WIN32)
    int vk = VK_CAPITAL;
    switch (key) {
    case LockKey::CapsLock: vk = VK_CAPITAL; break;
    case LockKey::NumLock: vk = VK_NUMLOCK; break;
    case LockKey::ScrollLock: vk = VK_SCROLL; break;
    }
    return (GetKeyState(vk) & 0x0001) != 0;
#elif defined(__linux__)
    std::string_view suffix = "::capslock";
    switch (key) {
    case LockKey::CapsLock: suffix = "::capslock"; break;
    case LockKey::NumLock: suffix = "::numlock"; break;
    case LockKey::ScrollLock: suffix = "::scrolllock"; break;
    }

    std::error_code error{};
    std::filesystem::directory_iterator it{"/sys/class/leds", error};
    if (error) {
        return std::nullopt;
    }

    std::optional<bool> state{};
    for (; !error && it != std::filesystem::directory_iterator{}; it.increment(error)) {
        const auto &entry = *it;
        const std::string name = entry.path().filename().string();
        if (!name.ends_with(suffix)) {
            continue;
        }
        std::ifstream in{entry.path() / "brightness"};
        int brightness = 0;
        if (!(in >> brightness)) {
            continue;
        }
        state = state.value_or(false) || brightness > 0;
    }
    return state;
#else
    (void)key;
    return std::nullopt;
#endif
}

} // namespace util
