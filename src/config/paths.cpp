#include "config/paths.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>

namespace {

std::mutex pathMutex;
std::optional<std::filesystem::path> configOverride;
std::optional<std::filesystem::path> logOverride;

constexpr auto* DEFAULT_CONFIG_PATH = "/etc/vcstatus/config.yaml";

}

namespace vcs::paths {

std::filesystem::path getConfigPath() {
    std::scoped_lock lock(pathMutex);
    if (configOverride) return *configOverride;
    if (const char* env = std::getenv("VCSTATUS_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getLogPath() {
    std::scoped_lock lock(pathMutex);
    if (logOverride) return *logOverride;
    return "/var/log/vcstatus";
}

void setConfigPath(const std::filesystem::path& path) {
    std::scoped_lock lock(pathMutex);
    configOverride = path;
}

void setLogPathForTesting() {
    std::scoped_lock lock(pathMutex);
    logOverride = std::filesystem::temp_directory_path() / "vcstatus_test_logs";
    configOverride = std::filesystem::temp_directory_path() / "vcstatus_test_config.yaml";
}

}
