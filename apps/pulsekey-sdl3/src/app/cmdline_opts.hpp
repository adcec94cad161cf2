#pragma once

#include <filesystem>

namespace app {

struct CommandLineOptions {
    std::filesystem::path configPath;
    bool dryRun;
    bool listDevices;
};

} // namespace app
