#pragma once

#include <filesystem>

namespace vcs::paths {

// VCSTATUS_CONFIG overrides the default /etc/vcstatus/config.yaml
std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
