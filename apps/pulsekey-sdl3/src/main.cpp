#include "app/app.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <memory>
#include <system_error>

int main(int argc, char **argv) {
    bool showHelp = false;

    app::CommandLineOptions progOpts{};
    cxxopts::Options options("Pulsekey", "Pulsekey - 6-DOF motion controller to keyboard bridge");
    options.add_options()("c,config", "Path to configuration file (default: Pulsekey.toml)",
                          cxxopts::value(progOpts.configPath));
    options.add_options()("n,dry-run", "Print key events instead of injecting them",
                          cxxopts::value(progOpts.dryRun)->default_value("false"));
    options.add_options()("l,list-devices", "List connected joysticks and exit",
                          cxxopts::value(progOpts.listDevices)->default_value("false"));
    options.add_options()("h,help", "Display help text", cxxopts::value(showHelp)->default_value("false"));

    try {
        auto result = options.parse(argc, argv);
        if (showHelp) {
            fmt::println("{}", options.help());
            return 0;
        }

        auto app = std::make_unique<app::App>();
        return app->Run(progOpts);
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::println("Failed to parse arguments: {}", e.what());
        return -1;
    } catch (const std::system_error &e) {
        fmt::println("System error: {}", e.what());
        return e.code().value();
    } catch (const std::exception &e) {
        fmt::println("Unhandled exception: {}", e.what());
        return -1;
    }
}
