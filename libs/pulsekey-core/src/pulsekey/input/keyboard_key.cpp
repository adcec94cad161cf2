#include <pulsekey/input/keyboard_key.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace pulsekey::input {

namespace {

    struct KeyName {
        KeyboardKey key;
        std::string_view name;
    };

    // Canonical names, in usage code order
    constexpr auto kKeyNames = std::to_array<KeyName>({
        {KeyboardKey::A, "A"},
        {KeyboardKey::B, "B"},
        {KeyboardKey::C, "C"},
        {KeyboardKey::D, "D"},
        {KeyboardKey::E, "E"},
        {KeyboardKey::F, "F"},
        {KeyboardKey::G, "G"},
        {KeyboardKey::H, "H"},
        {KeyboardKey::I, "I"},
        {KeyboardKey::J, "J"},
        {KeyboardKey::K, "K"},
        {KeyboardKey::L, "L"},
        {KeyboardKey::M, "M"},
        {KeyboardKey::N, "N"},
        {KeyboardKey::O, "O"},
        {KeyboardKey::P, "P"},
        {KeyboardKey::Q, "Q"},
        {KeyboardKey::R, "R"},
        {KeyboardKey::S, "S"},
        {KeyboardKey::T, "T"},
        {KeyboardKey::U, "U"},
        {KeyboardKey::V, "V"},
        {KeyboardKey::W, "W"},
        {KeyboardKey::X, "X"},
        {KeyboardKey::Y, "Y"},
        {KeyboardKey::Z, "Z"},

        {KeyboardKey::Alpha1, "Alpha1"},
        {KeyboardKey::Alpha2, "Alpha2"},
        {KeyboardKey::Alpha3, "Alpha3"},
        {KeyboardKey::Alpha4, "Alpha4"},
        {KeyboardKey::Alpha5, "Alpha5"},
        {KeyboardKey::Alpha6, "Alpha6"},
        {KeyboardKey::Alpha7, "Alpha7"},
        {KeyboardKey::Alpha8, "Alpha8"},
        {KeyboardKey::Alpha9, "Alpha9"},
        {KeyboardKey::Alpha0, "Alpha0"},

        {KeyboardKey::Return, "Return"},
        {KeyboardKey::Escape, "Escape"},
        {KeyboardKey::Backspace, "Backspace"},
        {KeyboardKey::Tab, "Tab"},
        {KeyboardKey::Spacebar, "Spacebar"},
        {KeyboardKey::MinusUnderscore, "MinusUnderscore"},
        {KeyboardKey::EqualsPlus, "EqualsPlus"},
        {KeyboardKey::LeftBracket, "LeftBracket"},
        {KeyboardKey::RightBracket, "RightBracket"},
        {KeyboardKey::Backslash, "Backslash"},
        {KeyboardKey::Semicolon, "Semicolon"},
        {KeyboardKey::Apostrophe, "Apostrophe"},
        {KeyboardKey::GraveAccent, "GraveAccent"},
        {KeyboardKey::Comma, "Comma"},
        {KeyboardKey::Period, "Period"},
        {KeyboardKey::Slash, "Slash"},
        {KeyboardKey::CapsLock, "CapsLock"},

        {KeyboardKey::F1, "F1"},
        {KeyboardKey::F2, "F2"},
        {KeyboardKey::F3, "F3"},
        {KeyboardKey::F4, "F4"},
        {KeyboardKey::F5, "F5"},
        {KeyboardKey::F6, "F6"},
        {KeyboardKey::F7, "F7"},
        {KeyboardKey::F8, "F8"},
        {KeyboardKey::F9, "F9"},
        {KeyboardKey::F10, "F10"},
        {KeyboardKey::F11, "F11"},
        {KeyboardKey::F12, "F12"},

        {KeyboardKey::PrintScreen, "PrintScreen"},
        {KeyboardKey::ScrollLock, "ScrollLock"},
        {KeyboardKey::Pause, "Pause"},

        {KeyboardKey::Insert, "Insert"},
        {KeyboardKey::Home, "Home"},
        {KeyboardKey::PageUp, "PageUp"},
        {KeyboardKey::Delete, "Delete"},
        {KeyboardKey::End, "End"},
        {KeyboardKey::PageDown, "PageDown"},

        {KeyboardKey::Right, "Right"},
        {KeyboardKey::Left, "Left"},
        {KeyboardKey::Down, "Down"},
        {KeyboardKey::Up, "Up"},

        {KeyboardKey::NumLock, "NumLock"},
        {KeyboardKey::KeyPadDivide, "KeyPadDivide"},
        {KeyboardKey::KeyPadMultiply, "KeyPadMultiply"},
        {KeyboardKey::KeyPadSubtract, "KeyPadSubtract"},
        {KeyboardKey::KeyPadAdd, "KeyPadAdd"},
        {KeyboardKey::KeyPadEnter, "KeyPadEnter"},
        {KeyboardKey::KeyPad1, "KeyPad1"},
        {KeyboardKey::KeyPad2, "KeyPad2"},
        {KeyboardKey::KeyPad3, "KeyPad3"},
        {KeyboardKey::KeyPad4, "KeyPad4"},
        {KeyboardKey::KeyPad5, "KeyPad5"},
        {KeyboardKey::KeyPad6, "KeyPad6"},
        {KeyboardKey::KeyPad7, "KeyPad7"},
        {KeyboardKey::KeyPad8, "KeyPad8"},
        {KeyboardKey::KeyPad9, "KeyPad9"},
        {KeyboardKey::KeyPad0, "KeyPad0"},
        {KeyboardKey::KeyPadPeriod, "KeyPadPeriod"},

        {KeyboardKey::Application, "Application"},

        {KeyboardKey::LeftControl, "LeftControl"},
        {KeyboardKey::LeftShift, "LeftShift"},
        {KeyboardKey::LeftAlt, "LeftAlt"},
        {KeyboardKey::LeftGui, "LeftGui"},
        {KeyboardKey::RightControl, "RightControl"},
        {KeyboardKey::RightShift, "RightShift"},
        {KeyboardKey::RightAlt, "RightAlt"},
        {KeyboardKey::RightGui, "RightGui"},
    });

    // Short forms, written already normalized
    constexpr auto kKeyAliases = std::to_array<KeyName>({
        {KeyboardKey::Alpha1, "1"},
        {KeyboardKey::Alpha2, "2"},
        {KeyboardKey::Alpha3, "3"},
        {KeyboardKey::Alpha4, "4"},
        {KeyboardKey::Alpha5, "5"},
        {KeyboardKey::Alpha6, "6"},
        {KeyboardKey::Alpha7, "7"},
        {KeyboardKey::Alpha8, "8"},
        {KeyboardKey::Alpha9, "9"},
        {KeyboardKey::Alpha0, "0"},

        {KeyboardKey::Return, "enter"},
        {KeyboardKey::Escape, "esc"},
        {KeyboardKey::Spacebar, "space"},
        {KeyboardKey::Delete, "del"},
        {KeyboardKey::Insert, "ins"},
        {KeyboardKey::PageUp, "pgup"},
        {KeyboardKey::PageDown, "pgdn"},
        {KeyboardKey::Application, "menu"},

        {KeyboardKey::LeftControl, "ctrl"},
        {KeyboardKey::LeftControl, "control"},
        {KeyboardKey::LeftControl, "ctrll"},
        {KeyboardKey::LeftShift, "shift"},
        {KeyboardKey::LeftShift, "shiftl"},
        {KeyboardKey::LeftAlt, "alt"},
        {KeyboardKey::LeftAlt, "altl"},
        {KeyboardKey::LeftGui, "super"},
        {KeyboardKey::LeftGui, "windows"},
        {KeyboardKey::LeftGui, "command"},
        {KeyboardKey::LeftGui, "cmd"},
        {KeyboardKey::RightControl, "ctrlr"},
        {KeyboardKey::RightShift, "shiftr"},
        {KeyboardKey::RightAlt, "altr"},
        {KeyboardKey::RightAlt, "altgr"},
    });

    std::string Normalize(std::string_view str) {
        std::string out{};
        out.reserve(str.size());
        for (char ch : str) {
            if (ch == '_' || ch == '-' || ch == ' ') {
                continue;
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return out;
    }

    const std::unordered_map<std::string, KeyboardKey> &GetKeyLookup() {
        static const auto lookup = [] {
            std::unordered_map<std::string, KeyboardKey> map{};
            for (const auto &entry : kKeyNames) {
                map.emplace(Normalize(entry.name), entry.key);
            }
            for (const auto &entry : kKeyAliases) {
                map.emplace(std::string(entry.name), entry.key);
            }
            return map;
        }();
        return lookup;
    }

} // namespace

bool IsModifier(KeyboardKey key) {
    switch (key) {
    case KeyboardKey::LeftControl: [[fallthrough]];
    case KeyboardKey::LeftShift: [[fallthrough]];
    case KeyboardKey::LeftAlt: [[fallthrough]];
    case KeyboardKey::LeftGui: [[fallthrough]];
    case KeyboardKey::RightControl: [[fallthrough]];
    case KeyboardKey::RightShift: [[fallthrough]];
    case KeyboardKey::RightAlt: [[fallthrough]];
    case KeyboardKey::RightGui: return true;
    default: return false;
    }
}

const std::vector<KeyboardKey> &GetAllKeys() {
    static const auto keys = [] {
        std::vector<KeyboardKey> out{};
        out.reserve(kKeyNames.size());
        for (const auto &entry : kKeyNames) {
            out.push_back(entry.key);
        }
        return out;
    }();
    return keys;
}

// ---------------------------------------------------------------------------------------------------------------------

std::string_view ToString(KeyboardKey key) {
    if (key == KeyboardKey::None) {
        return "None";
    }
    auto it = std::ranges::find(kKeyNames, key, &KeyName::key);
    if (it == kKeyNames.end()) {
        return "Unknown";
    }
    return it->name;
}

std::string ToString(const KeySequence &keys) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    bool first = true;
    for (KeyboardKey key : keys) {
        if (first) {
            first = false;
        } else {
            fmt::format_to(inserter, "+");
        }
        fmt::format_to(inserter, "{}", ToString(key));
    }
    return fmt::to_string(buf);
}

// ---------------------------------------------------------------------------------------------------------------------

bool TryParse(std::string_view str, KeyboardKey &key) {
    const auto &lookup = GetKeyLookup();
    auto it = lookup.find(Normalize(str));
    if (it == lookup.end()) {
        return false;
    }
    key = it->second;
    return true;
}

bool TryParse(std::string_view str, KeySequence &keys) {
    // Parse into a local sequence so that the output is left untouched on failure
    KeySequence out{};
    size_t offset = 0;
    size_t indexOfPlus;
    do {
        indexOfPlus = str.find_first_of('+', offset);
        auto keyStr = str.substr(offset, indexOfPlus - offset);
        KeyboardKey key{};
        if (!TryParse(keyStr, key) || key == KeyboardKey::None) {
            return false;
        }
        out.push_back(key);
        offset = indexOfPlus + 1;
    } while (indexOfPlus != std::string_view::npos);
    keys = std::move(out);
    return true;
}

} // namespace pulsekey::input
