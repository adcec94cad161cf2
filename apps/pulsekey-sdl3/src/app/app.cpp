#include "app.hpp"

#include <app/input/logging_key_actuator.hpp>
#include <app/input/platform_key_actuator.hpp>
#include <app/input/sdl3_motion_reader.hpp>

#include <util/lock_key_state.hpp>

#include <pulsekey/pulsekey.hpp>

#include <pulsekey/util/dev_log.hpp>
#include <pulsekey/util/scope_guard.hpp>

#include <SDL3/SDL.h>

#include <fmt/format.h>

#include <chrono>
#include <thread>

using clk = std::chrono::steady_clock;
using namespace pulsekey;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

} // namespace grp

// How often the lock key LED is checked.
static constexpr auto kLockKeyPollInterval = std::chrono::milliseconds{100};

App::App() {
    m_settings.BindConfiguration(m_config);
}

int App::Run(const CommandLineOptions &options) {
    m_options = options;

    fmt::println("Pulsekey {}", version::fullstring);

    // ---------------------------------
    // Load settings

    {
        const std::filesystem::path path = options.configPath.empty() ? "Pulsekey.toml" : options.configPath;
        auto result = m_settings.Load(path);
        if (!result) {
            fmt::println("Failed to load settings from {}: {}", path.string(), result.string());
            return -1;
        }
    }

    m_config.mode.characterMode = m_config.mode.startInCharacterMode;
    SyncModeWithLockKey();

    // ---------------------------------
    // Initialize SDL subsystems

    if (!SDL_Init(SDL_INIT_JOYSTICK | SDL_INIT_EVENTS)) {
        fmt::println("Unable to initialize SDL: {}", SDL_GetError());
        return -1;
    }
    util::ScopeGuard sgQuit{[&] { SDL_Quit(); }};

    if (options.listDevices) {
        ListDevices();
        return 0;
    }

    auto actuator = CreateKeyActuator();
    if (!actuator) {
        return -1;
    }

    // ---------------------------------
    // Build the pipeline

    input::SDL3MotionReader reader{m_settings.device};
    reader.OpenFirstAvailable();
    SDL_JoystickID deviceID = reader.GetDeviceID();
    if (reader.IsConnected()) {
        fmt::println("Using {}", reader.GetDeviceName());
    } else {
        fmt::println("Waiting for a motion controller...");
    }

    const auto modeObserver = m_config.mode.characterMode.ObserveAndNotify(
        [](bool characterMode) { fmt::println("Mode: {}", characterMode ? "character" : "camera"); });
    util::ScopeGuard sgUnobserveMode{[&] { m_config.mode.characterMode.Unobserve(modeObserver); }};

    sys::Bridge bridge{m_config, *actuator};
    util::ScopeGuard sgShutdown{[&] { bridge.Shutdown(); }};

    fmt::println("Press Ctrl+C to quit");

    // ---------------------------------
    // Main loop

    const auto startTime = clk::now();
    auto nextLockKeyPoll = startTime;

    while (true) {
        SDL_Event evt{};
        while (SDL_PollEvent(&evt)) {
            if (evt.type == SDL_EVENT_QUIT) {
                goto end_loop;
            }
            if (reader.ProcessEvent(evt) && reader.GetDeviceID() != deviceID) {
                // Keys held for the previous device must not carry over to the next one
                bridge.Reset();
                deviceID = reader.GetDeviceID();
                if (reader.IsConnected()) {
                    fmt::println("Connected to {}", reader.GetDeviceName());
                } else {
                    fmt::println("Motion controller disconnected");
                }
            }
        }

        const auto now = clk::now();
        if (now >= nextLockKeyPoll) {
            SyncModeWithLockKey();
            nextLockKeyPoll = now + kLockKeyPollInterval;
        }

        if (auto sample = reader.Read()) {
            const Seconds timestamp = std::chrono::duration<double>(now - startTime).count();
            bridge.Tick(*sample, timestamp);
        }

        std::this_thread::sleep_for(m_settings.device.pollInterval);
    }

end_loop:; // the scope guards release every key and shut down SDL

    fmt::println("Exiting");
    return 0;
}

void App::ListDevices() {
    auto devices = input::SDL3MotionReader::ListDevices();
    if (devices.empty()) {
        fmt::println("No joysticks found");
        return;
    }
    for (auto &device : devices) {
        fmt::println("[{}] {} - {} axes, {} buttons", device.id, device.name, device.numAxes, device.numButtons);
    }
}

std::unique_ptr<pulsekey::input::IKeyActuator> App::CreateKeyActuator() {
    if (m_options.dryRun) {
        fmt::println("Dry run: key events are printed instead of injected");
        return std::make_unique<input::LoggingKeyActuator>();
    }

#if defined(__linux__) || defined(_WIN32)
    std::string error{};
    auto actuator = input::CreatePlatformKeyActuator(error);
    if (!actuator) {
        fmt::println("{}", error);
        fmt::println("Use --dry-run to print key events instead");
    }
    return actuator;
#else
    fmt::println("Key injection is not supported on this platform; printing key events instead");
    return std::make_unique<input::LoggingKeyActuator>();
#endif
}

void App::SyncModeWithLockKey() {
    if (!m_config.mode.syncWithLockKey) {
        return;
    }
    const auto state = util::QueryLockKeyState(m_config.mode.lockKey);
    if (!state) {
        return;
    }
    if (*state != m_config.mode.characterMode.Get()) {
        devlog::debug<grp::base>("Lock key turned {}", *state ? "on" : "off");
        m_config.mode.characterMode = *state;
    }
}

} // namespace app
