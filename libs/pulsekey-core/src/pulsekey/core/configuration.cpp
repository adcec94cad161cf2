#include <pulsekey/core/configuration.hpp>

namespace pulsekey::core {

std::map<uint32, input::KeySequence> Configuration::DefaultButtons() {
    using Key = input::KeyboardKey;
    return {
        {0, {Key::B}},          {1, {Key::LeftAlt}}, {2, {Key::LeftControl}},
        {3, {Key::LeftShift}},  {4, {Key::Escape}},  {5, {Key::O}},
        {6, {Key::Tab}},        {7, {Key::C}},       {8, {Key::Spacebar}},
        {9, {Key::Home}},       {10, {Key::M}},      {11, {Key::CapsLock}},
        {12, {Key::I}},         {13, {Key::L}},      {14, {Key::LeftShift, Key::Spacebar}},
    };
}

bool Configuration::Sanitize() {
    const bool moveFixed = move.Sanitize(kDefaultMoveParams);
    const bool zoomFixed = zoom.Sanitize(kDefaultZoomParams);
    return moveFixed || zoomFixed;
}

} // namespace pulsekey::core
