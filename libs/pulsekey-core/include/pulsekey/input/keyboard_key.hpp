#pragma once

/**
@file
@brief Abstract keyboard key symbols, key sequences and their string forms.
*/

#include <string>
#include <string_view>
#include <vector>

namespace pulsekey::input {

/// @brief A keyboard key, identified by its USB HID Keyboard/Keypad page (0x07) usage code.
///
/// Key actuators translate these into whatever the host platform injects (Linux input event codes, Windows scan codes).
enum class KeyboardKey {
    None = 0,

    A = 4,
    B = 5,
    C = 6,
    D = 7,
    E = 8,
    F = 9,
    G = 10,
    H = 11,
    I = 12,
    J = 13,
    K = 14,
    L = 15,
    M = 16,
    N = 17,
    O = 18,
    P = 19,
    Q = 20,
    R = 21,
    S = 22,
    T = 23,
    U = 24,
    V = 25,
    W = 26,
    X = 27,
    Y = 28,
    Z = 29,

    Alpha1 = 30,
    Alpha2 = 31,
    Alpha3 = 32,
    Alpha4 = 33,
    Alpha5 = 34,
    Alpha6 = 35,
    Alpha7 = 36,
    Alpha8 = 37,
    Alpha9 = 38,
    Alpha0 = 39,

    Return = 40,
    Escape = 41,
    Backspace = 42,
    Tab = 43,
    Spacebar = 44,
    MinusUnderscore = 45, // - _
    EqualsPlus = 46,      // = +
    LeftBracket = 47,     // [ {
    RightBracket = 48,    // ] }
    Backslash = 49,       // \ |
    Semicolon = 51,       // ; :
    Apostrophe = 52,      // ' "
    GraveAccent = 53,     // ` ~
    Comma = 54,           // , <
    Period = 55,          // . >
    Slash = 56,           // / ?
    CapsLock = 57,

    F1 = 58,
    F2 = 59,
    F3 = 60,
    F4 = 61,
    F5 = 62,
    F6 = 63,
    F7 = 64,
    F8 = 65,
    F9 = 66,
    F10 = 67,
    F11 = 68,
    F12 = 69,

    PrintScreen = 70,
    ScrollLock = 71,
    Pause = 72,

    Insert = 73,
    Home = 74,
    PageUp = 75,
    Delete = 76,
    End = 77,
    PageDown = 78,

    Right = 79,
    Left = 80,
    Down = 81,
    Up = 82,

    NumLock = 83,
    KeyPadDivide = 84,
    KeyPadMultiply = 85,
    KeyPadSubtract = 86,
    KeyPadAdd = 87,
    KeyPadEnter = 88,
    KeyPad1 = 89,
    KeyPad2 = 90,
    KeyPad3 = 91,
    KeyPad4 = 92,
    KeyPad5 = 93,
    KeyPad6 = 94,
    KeyPad7 = 95,
    KeyPad8 = 96,
    KeyPad9 = 97,
    KeyPad0 = 98,
    KeyPadPeriod = 99,

    Application = 101, // Context menu key

    LeftControl = 224,
    LeftShift = 225,
    LeftAlt = 226,
    LeftGui = 227, // Windows/Command key
    RightControl = 228,
    RightShift = 229,
    RightAlt = 230,
    RightGui = 231, // Windows/Command key
};

/// @brief An ordered sequence of keys tapped together.
///
/// A single element is a plain key tap. Longer sequences are modifier combos: keys are pressed front to back and
/// released back to front.
using KeySequence = std::vector<KeyboardKey>;

/// @brief Determines if the key is one of the Control, Shift, Alt or GUI modifiers.
bool IsModifier(KeyboardKey key);

/// @brief Returns every key that has a name, in usage code order. Actuators use this to declare their key sets.
const std::vector<KeyboardKey> &GetAllKeys();

// ---------------------------------------------------------------------------------------------------------------------
// String converters

/// @brief Returns the canonical name of the key, as accepted by `TryParse`. Unnamed values return "Unknown".
std::string_view ToString(KeyboardKey key);

/// @brief Joins the canonical names of the keys with '+'.
std::string ToString(const KeySequence &keys);

// ---------------------------------------------------------------------------------------------------------------------
// String parsers
//
// Names are matched case-insensitively, ignoring '_', '-' and spaces between words, so "PageUp", "page_up" and
// "Page Up" are all equivalent. Common short forms ("Esc", "Space", "Shift", "Ctrl", "Enter", "1") are accepted as
// aliases.

/// @brief Parses a single key name.
/// @param[in] str the key name
/// @param[out] key receives the key if the name is valid; left untouched otherwise
/// @return `true` if the name was recognized
bool TryParse(std::string_view str, KeyboardKey &key);

/// @brief Parses a '+'-separated key sequence, such as "Shift+Spacebar".
/// @param[in] str the sequence
/// @param[out] keys receives the keys if every element is valid; left untouched otherwise
/// @return `true` if every element was recognized
bool TryParse(std::string_view str, KeySequence &keys);

} // namespace pulsekey::input
