#pragma once

#include "cmdline_opts.hpp"
#include "settings.hpp"

#include <pulsekey/core/configuration.hpp>
#include <pulsekey/input/key_actuator.hpp>

#include <memory>

namespace app {

class App {
public:
    App();

    int Run(const CommandLineOptions &options);

private:
    CommandLineOptions m_options;

    pulsekey::core::Configuration m_config;
    Settings m_settings;

    void ListDevices();

    // Creates the key actuator selected by the command line options. Returns nullptr if none could be created.
    std::unique_ptr<pulsekey::input::IKeyActuator> CreateKeyActuator();

    // Updates the movement mode from the configured lock key, if enabled and readable.
    void SyncModeWithLockKey();
};

} // namespace app
