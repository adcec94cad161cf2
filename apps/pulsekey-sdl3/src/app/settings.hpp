#pragma once

#include <pulsekey/core/configuration.hpp>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <variant>

namespace app {

struct SettingsLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion };

    static SettingsLoadResult Success() {
        return {.type = Type::Success};
    }

    static SettingsLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static SettingsLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .value = version};
    }

    operator bool() {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::UnsupportedConfigVersion:
            return fmt::format("Unsupported configuration version: {}", std::get<int>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, toml::parse_error, int> value;
};

struct Settings {
    Settings() noexcept;

    // Binds the core configuration that receives the bridge settings.
    // Must be called before Load or ResetToDefaults.
    void BindConfiguration(pulsekey::core::Configuration &config);

    void ResetToDefaults();

    SettingsLoadResult Load(const std::filesystem::path &path);

    // ---------------------------------------------------------------------------------------------

    std::filesystem::path path;

    struct Device {
        // Only joysticks whose name contains this string are considered. Empty accepts any joystick with enough axes.
        std::string nameFilter;

        // Joystick axis index feeding X, Y, Z, Roll, Pitch and Yaw, in that order. -1 leaves the axis at rest.
        std::array<int, 6> axisMap;

        // Delay between device polls.
        std::chrono::milliseconds pollInterval;
    } device;

private:
    pulsekey::core::Configuration *m_config = nullptr;
};

} // namespace app
