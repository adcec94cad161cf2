#include "platform_key_actuator.hpp"

#include <pulsekey/util/dev_log.hpp>

#include <fmt/format.h>

#if defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
#elif defined(__linux__)
    #include <cerrno>
    #include <cstring>
    #include <fcntl.h>
    #include <linux/uinput.h>
    #include <sys/ioctl.h>
    #include <unistd.h>
#endif

using Key = pulsekey::input::KeyboardKey;

namespace app::input {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // actuator

    struct actuator {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "KeyActuator";
    };

} // namespace grp

#if defined(__linux__)

// Returns the Linux input event code for the key, or KEY_RESERVED if there is none.
static int ToLinuxKeyCode(Key key) {
    switch (key) {
    case Key::A: return KEY_A;
    case Key::B: return KEY_B;
    case Key::C: return KEY_C;
    case Key::D: return KEY_D;
    case Key::E: return KEY_E;
    case Key::F: return KEY_F;
    case Key::G: return KEY_G;
    case Key::H: return KEY_H;
    case Key::I: return KEY_I;
    case Key::J: return KEY_J;
    case Key::K: return KEY_K;
    case Key::L: return KEY_L;
    case Key::M: return KEY_M;
    case Key::N: return KEY_N;
    case Key::O: return KEY_O;
    case Key::P: return KEY_P;
    case Key::Q: return KEY_Q;
    case Key::R: return KEY_R;
    case Key::S: return KEY_S;
    case Key::T: return KEY_T;
    case Key::U: return KEY_U;
    case Key::V: return KEY_V;
    case Key::W: return KEY_W;
    case Key::X: return KEY_X;
    case Key::Y: return KEY_Y;
    case Key::Z: return KEY_Z;

    case Key::Alpha1: return KEY_1;
    case Key::Alpha2: return KEY_2;
    case Key::Alpha3: return KEY_3;
    case Key::Alpha4: return KEY_4;
    case Key::Alpha5: return KEY_5;
    case Key::Alpha6: return KEY_6;
    case Key::Alpha7: return KEY_7;
    case Key::Alpha8: return KEY_8;
    case Key::Alpha9: return KEY_9;
    case Key::Alpha0: return KEY_0;

    case Key::Return: return KEY_ENTER;
    case Key::Escape: return KEY_ESC;
    case Key::Backspace: return KEY_BACKSPACE;
    case Key::Tab: return KEY_TAB;
    case Key::Spacebar: return KEY_SPACE;
    case Key::MinusUnderscore: return KEY_MINUS;
    case Key::EqualsPlus: return KEY_EQUAL;
    case Key::LeftBracket: return KEY_LEFTBRACE;
    case Key::RightBracket: return KEY_RIGHTBRACE;
    case Key::Backslash: return KEY_BACKSLASH;
    case Key::Semicolon: return KEY_SEMICOLON;
    case Key::Apostrophe: return KEY_APOSTROPHE;
    case Key::GraveAccent: return KEY_GRAVE;
    case Key::Comma: return KEY_COMMA;
    case Key::Period: return KEY_DOT;
    case Key::Slash: return KEY_SLASH;
    case Key::CapsLock: return KEY_CAPSLOCK;

    case Key::F1: return KEY_F1;
    case Key::F2: return KEY_F2;
    case Key::F3: return KEY_F3;
    case Key::F4: return KEY_F4;
    case Key::F5: return KEY_F5;
    case Key::F6: return KEY_F6;
    case Key::F7: return KEY_F7;
    case Key::F8: return KEY_F8;
    case Key::F9: return KEY_F9;
    case Key::F10: return KEY_F10;
    case Key::F11: return KEY_F11;
    case Key::F12: return KEY_F12;

    case Key::PrintScreen: return KEY_SYSRQ;
    case Key::ScrollLock: return KEY_SCROLLLOCK;
    case Key::Pause: return KEY_PAUSE;

    case Key::Insert: return KEY_INSERT;
    case Key::Home: return KEY_HOME;
    case Key::PageUp: return KEY_PAGEUP;
    case Key::Delete: return KEY_DELETE;
    case Key::End: return KEY_END;
    case Key::PageDown: return KEY_PAGEDOWN;

    case Key::Right: return KEY_RIGHT;
    case Key::Left: return KEY_LEFT;
    case Key::Down: return KEY_DOWN;
    case Key::Up: return KEY_UP;

    case Key::NumLock: return KEY_NUMLOCK;
    case Key::KeyPadDivide: return KEY_KPSLASH;
    case Key::KeyPadMultiply: return KEY_KPASTERISK;
    case Key::KeyPadSubtract: return KEY_KPMINUS;
    case Key::KeyPadAdd: return KEY_KPPLUS;
    case Key::KeyPadEnter: return KEY_KPENTER;
    case Key::KeyPad1: return KEY_KP1;
    case Key::KeyPad2: return KEY_KP2;
    case Key::KeyPad3: return KEY_KP3;
    case Key::KeyPad4: return KEY_KP4;
    case Key::KeyPad5: return KEY_KP5;
    case Key::KeyPad6: return KEY_KP6;
    case Key::KeyPad7: return KEY_KP7;
    case Key::KeyPad8: return KEY_KP8;
    case Key::KeyPad9: return KEY_KP9;
    case Key::KeyPad0: return KEY_KP0;
    case Key::KeyPadPeriod: return KEY_KPDOT;

    case Key::Application: return KEY_COMPOSE;

    case Key::LeftControl: return KEY_LEFTCTRL;
    case Key::LeftShift: return KEY_LEFTSHIFT;
    case Key::LeftAlt: return KEY_LEFTALT;
    case Key::LeftGui: return KEY_LEFTMETA;
    case Key::RightControl: return KEY_RIGHTCTRL;
    case Key::RightShift: return KEY_RIGHTSHIFT;
    case Key::RightAlt: return KEY_RIGHTALT;
    case Key::RightGui: return KEY_RIGHTMETA;

    default: return KEY_RESERVED;
    }
}

// Injects key events through a virtual keyboard created with /dev/uinput.
class UInputKeyActuator final : public pulsekey::input::IKeyActuator {
public:
    ~UInputKeyActuator() {
        if (m_fd >= 0) {
            ioctl(m_fd, UI_DEV_DESTROY);
            close(m_fd);
        }
    }

    bool Create(std::string &error) {
        m_fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
        if (m_fd < 0) {
            error = fmt::format("Could not open /dev/uinput: {}", std::strerror(errno));
            return false;
        }

        bool ok = ioctl(m_fd, UI_SET_EVBIT, EV_KEY) >= 0 && ioctl(m_fd, UI_SET_EVBIT, EV_SYN) >= 0;
        for (Key key : pulsekey::input::GetAllKeys()) {
            const int code = ToLinuxKeyCode(key);
            if (ok && code != KEY_RESERVED) {
                ok = ioctl(m_fd, UI_SET_KEYBIT, code) >= 0;
            }
        }

        uinput_setup setup{};
        setup.id.bustype = BUS_VIRTUAL;
        setup.id.vendor = 0x1209;  // pid.codes
        setup.id.product = 0x0001; // test PID
        std::strncpy(setup.name, "Pulsekey virtual keyboard", UINPUT_MAX_NAME_SIZE - 1);

        ok = ok && ioctl(m_fd, UI_DEV_SETUP, &setup) >= 0 && ioctl(m_fd, UI_DEV_CREATE) >= 0;
        if (!ok) {
            error = fmt::format("Could not create the virtual keyboard: {}", std::strerror(errno));
            close(m_fd);
            m_fd = -1;
            return false;
        }
        return true;
    }

    void Press(Key key) final {
        Emit(key, 1);
    }

    void Release(Key key) final {
        Emit(key, 0);
    }

private:
    int m_fd = -1;

    void Emit(Key key, int value) {
        const int code = ToLinuxKeyCode(key);
        if (code == KEY_RESERVED) {
            devlog::warn<grp::actuator>("{} has no Linux key code", pulsekey::input::ToString(key));
            return;
        }
        if (!Write(EV_KEY, code, value) || !Write(EV_SYN, SYN_REPORT, 0)) {
            devlog::warn<grp::actuator>("Failed to inject {} {}: {}", value != 0 ? "press" : "release",
                                        pulsekey::input::ToString(key), std::strerror(errno));
        }
    }

    bool Write(uint16_t type, uint16_t code, int32_t value) {
        input_event event{};
        event.type = type;
        event.code = code;
        event.value = value;
        return write(m_fd, &event, sizeof(event)) == static_cast<ssize_t>(sizeof(event));
    }
};

#elif defined(_WIN32)

struct ScanCode {
    WORD code;
    bool extended;
};

// Returns the set 1 scan code for the key, or a zero code if there is none.
static ScanCode ToScanCode(Key key) {
    switch (key) {
    case Key::A: return {0x1E, false};
    case Key::B: return {0x30, false};
    case Key::C: return {0x2E, false};
    case Key::D: return {0x20, false};
    case Key::E: return {0x12, false};
    case Key::F: return {0x21, false};
    case Key::G: return {0x22, false};
    case Key::H: return {0x23, false};
    case Key::I: return {0x17, false};
    case Key::J: return {0x24, false};
    case Key::K: return {0x25, false};
    case Key::L: return {0x26, false};
    case Key::M: return {0x32, false};
    case Key::N: return {0x31, false};
    case Key::O: return {0x18, false};
    case Key::P: return {0x19, false};
    case Key::Q: return {0x10, false};
    case Key::R: return {0x13, false};
    case Key::S: return {0x1F, false};
    case Key::T: return {0x14, false};
    case Key::U: return {0x16, false};
    case Key::V: return {0x2F, false};
    case Key::W: return {0x11, false};
    case Key::X: return {0x2D, false};
    case Key::Y: return {0x15, false};
    case Key::Z: return {0x2C, false};

    case Key::Alpha1: return {0x02, false};
    case Key::Alpha2: return {0x03, false};
    case Key::Alpha3: return {0x04, false};
    case Key::Alpha4: return {0x05, false};
    case Key::Alpha5: return {0x06, false};
    case Key::Alpha6: return {0x07, false};
    case Key::Alpha7: return {0x08, false};
    case Key::Alpha8: return {0x09, false};
    case Key::Alpha9: return {0x0A, false};
    case Key::Alpha0: return {0x0B, false};

    case Key::Return: return {0x1C, false};
    case Key::Escape: return {0x01, false};
    case Key::Backspace: return {0x0E, false};
    case Key::Tab: return {0x0F, false};
    case Key::Spacebar: return {0x39, false};
    case Key::MinusUnderscore: return {0x0C, false};
    case Key::EqualsPlus: return {0x0D, false};
    case Key::LeftBracket: return {0x1A, false};
    case Key::RightBracket: return {0x1B, false};
    case Key::Backslash: return {0x2B, false};
    case Key::Semicolon: return {0x27, false};
    case Key::Apostrophe: return {0x28, false};
    case Key::GraveAccent: return {0x29, false};
    case Key::Comma: return {0x33, false};
    case Key::Period: return {0x34, false};
    case Key::Slash: return {0x35, false};
    case Key::CapsLock: return {0x3A, false};

    case Key::F1: return {0x3B, false};
    case Key::F2: return {0x3C, false};
    case Key::F3: return {0x3D, false};
    case Key::F4: return {0x3E, false};
    case Key::F5: return {0x3F, false};
    case Key::F6: return {0x40, false};
    case Key::F7: return {0x41, false};
    case Key::F8: return {0x42, false};
    case Key::F9: return {0x43, false};
    case Key::F10: return {0x44, false};
    case Key::F11: return {0x57, false};
    case Key::F12: return {0x58, false};

    case Key::PrintScreen: return {0x37, true};
    case Key::ScrollLock: return {0x46, false};

    case Key::Insert: return {0x52, true};
    case Key::Home: return {0x47, true};
    case Key::PageUp: return {0x49, true};
    case Key::Delete: return {0x53, true};
    case Key::End: return {0x4F, true};
    case Key::PageDown: return {0x51, true};

    case Key::Right: return {0x4D, true};
    case Key::Left: return {0x4B, true};
    case Key::Down: return {0x50, true};
    case Key::Up: return {0x48, true};

    case Key::NumLock: return {0x45, false};
    case Key::KeyPadDivide: return {0x35, true};
    case Key::KeyPadMultiply: return {0x37, false};
    case Key::KeyPadSubtract: return {0x4A, false};
    case Key::KeyPadAdd: return {0x4E, false};
    case Key::KeyPadEnter: return {0x1C, true};
    case Key::KeyPad1: return {0x4F, false};
    case Key::KeyPad2: return {0x50, false};
    case Key::KeyPad3: return {0x51, false};
    case Key::KeyPad4: return {0x4B, false};
    case Key::KeyPad5: return {0x4C, false};
    case Key::KeyPad6: return {0x4D, false};
    case Key::KeyPad7: return {0x47, false};
    case Key::KeyPad8: return {0x48, false};
    case Key::KeyPad9: return {0x49, false};
    case Key::KeyPad0: return {0x52, false};
    case Key::KeyPadPeriod: return {0x53, false};

    case Key::Application: return {0x5D, true};

    case Key::LeftControl: return {0x1D, false};
    case Key::LeftShift: return {0x2A, false};
    case Key::LeftAlt: return {0x38, false};
    case Key::LeftGui: return {0x5B, true};
    case Key::RightControl: return {0x1D, true};
    case Key::RightShift: return {0x36, false};
    case Key::RightAlt: return {0x38, true};
    case Key::RightGui: return {0x5C, true};

    // Pause has no single make/break scan code pair
    default: return {0, false};
    }
}

// Injects key events with SendInput using hardware scan codes, which games read more reliably than virtual keys.
class SendInputKeyActuator final : public pulsekey::input::IKeyActuator {
public:
    void Press(Key key) final {
        Send(key, false);
    }

    void Release(Key key) final {
        Send(key, true);
    }

private:
    void Send(Key key, bool release) {
        const ScanCode scanCode = ToScanCode(key);
        if (scanCode.code == 0) {
            devlog::warn<grp::actuator>("{} has no scan code", pulsekey::input::ToString(key));
            return;
        }

        INPUT input{};
        input.type = INPUT_KEYBOARD;
        input.ki.wScan = scanCode.code;
        input.ki.dwFlags = KEYEVENTF_SCANCODE;
        if (scanCode.extended) {
            input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
        }
        if (release) {
            input.ki.dwFlags |= KEYEVENTF_KEYUP;
        }
        if (SendInput(1, &input, sizeof(INPUT)) != 1) {
            devlog::warn<grp::actuator>("Failed to inject {} {}: error {}", release ? "release" : "press",
                                        pulsekey::input::ToString(key), GetLastError());
        }
    }
};

#endif

std::unique_ptr<pulsekey::input::IKeyActuator> CreatePlatformKeyActuator(std::string &error) {
#if defined(__linux__)
    auto actuator = std::make_unique<UInputKeyActuator>();
    if (!actuator->Create(error)) {
        return nullptr;
    }
    return actuator;
#elif defined(_WIN32)
    return std::make_unique<SendInputKeyActuator>();
#else
    error = "Key injection is not supported on this platform";
    return nullptr;
#endif
}

} // namespace app::input
