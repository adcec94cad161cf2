#include "settings.hpp"

#include <pulsekey/util/dev_log.hpp>
#include <pulsekey/util/inline.hpp>

#include <algorithm>
#include <charconv>

using namespace std::literals;
using namespace pulsekey;

namespace app {

// Increment this version and implement conversions when making breaking changes to the settings file structure.
// Existing versions should convert old formats on a best-effort basis.
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // settings

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Enum parsers

FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, core::config::mode::LockKey &value) {
    value = core::config::mode::LockKey::CapsLock;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "CapsLock"s) {
            value = core::config::mode::LockKey::CapsLock;
        } else if (*opt == "NumLock"s) {
            value = core::config::mode::LockKey::NumLock;
        } else if (*opt == "ScrollLock"s) {
            value = core::config::mode::LockKey::ScrollLock;
        }
    }
}

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

// Keeps the current key if the name is not recognized.
FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, const char *name, input::KeyboardKey &value) {
    if (auto opt = node[name].value<std::string_view>()) {
        if (!input::TryParse(*opt, value)) {
            devlog::warn<grp::settings>("Unknown key \"{}\" for {}, keeping {}", *opt, name, input::ToString(value));
        }
    }
}

FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, const char *name, std::chrono::milliseconds &value) {
    if (auto opt = node[name].value<int64_t>()) {
        value = std::chrono::milliseconds{*opt};
    }
}

FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, input::PulseParams &value) {
    Parse(node, "PressDuration", value.pressDuration);
    Parse(node, "MinHz", value.minHz);
    Parse(node, "MaxHz", value.maxHz);
    Parse(node, "Deadzone", value.deadzone);
    Parse(node, "HoldThreshold", value.holdThreshold);
    Parse(node, "EMAAlpha", value.emaAlpha);
}

// Accepts either a '+'-separated string ("LeftShift+Spacebar") or an array of key names. An empty string or array
// clears the sequence. Returns false if any key name is invalid, leaving the sequence untouched.
FORCE_INLINE static bool Parse(toml::node &node, input::KeySequence &value) {
    if (auto opt = node.value<std::string_view>()) {
        if (opt->empty()) {
            value.clear();
            return true;
        }
        return input::TryParse(*opt, value);
    }
    if (toml::array *arr = node.as_array()) {
        input::KeySequence keys{};
        for (toml::node &element : *arr) {
            auto name = element.value<std::string_view>();
            input::KeyboardKey key = input::KeyboardKey::None;
            if (!name || !input::TryParse(*name, key) || key == input::KeyboardKey::None) {
                return false;
            }
            keys.push_back(key);
        }
        value = std::move(keys);
        return true;
    }
    return false;
}

// -------------------------------------------------------------------------------------------------
// Implementation

Settings::Settings() noexcept {
    ResetToDefaults();
}

void Settings::BindConfiguration(core::Configuration &config) {
    m_config = &config;
    ResetToDefaults();
}

void Settings::ResetToDefaults() {
    device.nameFilter.clear();
    device.axisMap = {0, 1, 2, 3, 4, 5};
    device.pollInterval = std::chrono::milliseconds{5};

    if (m_config != nullptr) {
        auto &config = *m_config;
        config.axes = {};
        config.move = core::Configuration::kDefaultMoveParams;
        config.zoom = core::Configuration::kDefaultZoomParams;
        config.mode.syncWithLockKey = true;
        config.mode.lockKey = core::config::mode::LockKey::CapsLock;
        config.mode.startInCharacterMode = false;
        config.axisKeys = {};
        config.buttons = core::Configuration::DefaultButtons();
    }
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    ResetToDefaults();
    this->path = path;

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (m_config != nullptr) {
        auto &config = *m_config;

        if (auto tblAxes = data["Axes"]) {
            Parse(tblAxes, "InvertX", config.axes.invertX);
            Parse(tblAxes, "InvertY", config.axes.invertY);
            Parse(tblAxes, "InvertZ", config.axes.invertZ);
            Parse(tblAxes, "InvertRoll", config.axes.invertRoll);
            Parse(tblAxes, "InvertPitch", config.axes.invertPitch);
            Parse(tblAxes, "InvertYaw", config.axes.invertYaw);
            Parse(tblAxes, "SwapYZ", config.axes.swapYZ);
        }

        if (auto tblMove = data["Move"]) {
            Parse(tblMove, config.move);
        }
        if (auto tblZoom = data["Zoom"]) {
            Parse(tblZoom, config.zoom);
        }
        if (config.Sanitize()) {
            devlog::warn<grp::settings>("Some pulse parameters were out of range and have been reset to defaults");
        }

        if (auto tblMode = data["Mode"]) {
            Parse(tblMode, "SyncWithLockKey", config.mode.syncWithLockKey);
            Parse(tblMode, "LockKey", config.mode.lockKey);
            Parse(tblMode, "StartInCharacterMode", config.mode.startInCharacterMode);
        }

        if (auto tblAxisKeys = data["AxisKeys"]) {
            auto &keys = config.axisKeys;
            Parse(tblAxisKeys, "MoveLeft", keys.moveLeft);
            Parse(tblAxisKeys, "MoveRight", keys.moveRight);
            Parse(tblAxisKeys, "MoveForward", keys.moveForward);
            Parse(tblAxisKeys, "MoveBackward", keys.moveBackward);
            Parse(tblAxisKeys, "ZoomIn", keys.zoomIn);
            Parse(tblAxisKeys, "ZoomOut", keys.zoomOut);
            Parse(tblAxisKeys, "RotateLeft", keys.rotateLeft);
            Parse(tblAxisKeys, "RotateRight", keys.rotateRight);
            Parse(tblAxisKeys, "PitchUp", keys.pitchUp);
            Parse(tblAxisKeys, "PitchDown", keys.pitchDown);
        }

        // Entries override the default mapping of their button; empty entries unmap it
        if (toml::table *tblButtons = data["Buttons"].as_table()) {
            for (auto &[key, node] : *tblButtons) {
                const std::string_view indexStr = key.str();
                uint32 index = 0;
                auto [ptr, ec] = std::from_chars(indexStr.data(), indexStr.data() + indexStr.size(), index);
                if (ec != std::errc{} || ptr != indexStr.data() + indexStr.size()) {
                    devlog::warn<grp::settings>("Ignoring button entry with invalid index \"{}\"", indexStr);
                    continue;
                }

                input::KeySequence keys{};
                if (!Parse(node, keys)) {
                    devlog::warn<grp::settings>("Ignoring invalid key sequence for button {}", index);
                    continue;
                }
                if (keys.empty()) {
                    config.buttons.erase(index);
                } else {
                    config.buttons[index] = std::move(keys);
                }
            }
        }
    }

    if (auto tblDevice = data["Device"]) {
        Parse(tblDevice, "NameFilter", device.nameFilter);
        Parse(tblDevice, "PollInterval", device.pollInterval);
        device.pollInterval =
            std::clamp(device.pollInterval, std::chrono::milliseconds{1}, std::chrono::milliseconds{100});

        if (toml::array *arr = tblDevice["AxisMap"].as_array()) {
            const size_t count = std::min(arr->size(), device.axisMap.size());
            for (size_t i = 0; i < count; i++) {
                if (auto opt = arr->at(i).value<int>()) {
                    device.axisMap[i] = std::max(*opt, -1);
                }
            }
        }
    }

    devlog::info<grp::settings>("Loaded settings from {}", path.string());

    return SettingsLoadResult::Success();
}

} // namespace app
