#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <pulsekey/input/keyboard_key.hpp>

#include <string_view>
#include <utility>

using namespace pulsekey;
using Key = input::KeyboardKey;

namespace keyboard_key {

TEST_CASE("Key names are parsed leniently", "[input][keys]") {
    const auto &[name, expected] = GENERATE(values<std::pair<std::string_view, Key>>({
        {"W", Key::W},
        {"w", Key::W},
        {"PageUp", Key::PageUp},
        {"page_up", Key::PageUp},
        {"Page Up", Key::PageUp},
        {"PAGE-UP", Key::PageUp},
        {"Spacebar", Key::Spacebar},
        {"space", Key::Spacebar},
        {"Esc", Key::Escape},
        {"Enter", Key::Return},
        {"1", Key::Alpha1},
        {"Alpha0", Key::Alpha0},
        {"Ctrl", Key::LeftControl},
        {"Shift", Key::LeftShift},
        {"Alt", Key::LeftAlt},
        {"AltGr", Key::RightAlt},
        {"Delete", Key::Delete},
        {"del", Key::Delete},
        {"F12", Key::F12},
        {"KeyPadEnter", Key::KeyPadEnter},
    }));

    Key key = Key::None;
    CHECK(input::TryParse(name, key));
    CHECK(key == expected);
}

TEST_CASE("Unknown key names are rejected", "[input][keys]") {
    const std::string_view name = GENERATE(as<std::string_view>{}, "", "None", "Banana", "F13", "Shift+", "+");

    Key key = Key::Z;
    CHECK_FALSE(input::TryParse(name, key));
    CHECK(key == Key::Z);
}

TEST_CASE("Canonical key names parse back to the same key", "[input][keys]") {
    for (Key key : input::GetAllKeys()) {
        Key parsed = Key::None;
        CHECK(input::TryParse(input::ToString(key), parsed));
        CHECK(parsed == key);
    }
    CHECK(input::ToString(Key::None) == "None");
}

TEST_CASE("Key sequences are parsed from '+'-separated names", "[input][keys]") {
    SECTION("single key") {
        input::KeySequence keys{};
        CHECK(input::TryParse("Tab", keys));
        CHECK(keys == input::KeySequence{Key::Tab});
    }

    SECTION("modifier combo") {
        input::KeySequence keys{};
        CHECK(input::TryParse("Shift+Space", keys));
        CHECK(keys == input::KeySequence{Key::LeftShift, Key::Spacebar});
        CHECK(input::ToString(keys) == "LeftShift+Spacebar");
    }

    SECTION("three keys") {
        input::KeySequence keys{};
        CHECK(input::TryParse("Ctrl+Alt+Delete", keys));
        CHECK(keys == input::KeySequence{Key::LeftControl, Key::LeftAlt, Key::Delete});
    }

    SECTION("invalid elements leave the output untouched") {
        input::KeySequence keys{Key::B};
        CHECK_FALSE(input::TryParse("Shift+Banana", keys));
        CHECK_FALSE(input::TryParse("Shift++Space", keys));
        CHECK_FALSE(input::TryParse("", keys));
        CHECK(keys == input::KeySequence{Key::B});
    }
}

TEST_CASE("Modifier keys are identified", "[input][keys]") {
    CHECK(input::IsModifier(Key::LeftShift));
    CHECK(input::IsModifier(Key::RightControl));
    CHECK(input::IsModifier(Key::LeftGui));
    CHECK_FALSE(input::IsModifier(Key::Spacebar));
    CHECK_FALSE(input::IsModifier(Key::CapsLock));
}

} // namespace keyboard_key
