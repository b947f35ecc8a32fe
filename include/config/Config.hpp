#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace vcs::config {

struct SyncConfig {
    std::chrono::milliseconds tick_interval{300};
    std::chrono::milliseconds incremental_quiet{100};      // settle time before an incremental pass
    std::chrono::milliseconds rebuild_quiet{1000};         // settle time before a full rebuild
    unsigned int rebuild_threshold_files = 200;            // more pending changes than this forces a rebuild
    std::chrono::milliseconds self_modified_window{3000};  // state file changes inside this window are ours
};

struct ToolConfig {
    std::string executable = "hg";
    std::string metadata_dir = ".hg";
    std::string state_file = "dirstate";
    unsigned int max_files_per_invocation = 100;
};

struct WatchConfig {
    bool recursive = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum vcstatus = spdlog::level::info;   // startup/shutdown, roots added
    spdlog::level::level_enum sync     = spdlog::level::info;   // rebuilds and incremental passes
    spdlog::level::level_enum watch    = spdlog::level::warn;   // watch setup failures, overflows
    spdlog::level::level_enum store    = spdlog::level::warn;
    spdlog::level::level_enum roots    = spdlog::level::info;
    spdlog::level::level_enum tool     = spdlog::level::warn;   // failed hg invocations
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/vcstatus";
    unsigned int max_file_size_mb = 10;
    unsigned int max_files = 5;
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    ToolConfig tool;
    WatchConfig watch;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);
void to_json(nlohmann::json& j, const ToolConfig& c);
void from_json(const nlohmann::json& j, ToolConfig& c);
void to_json(nlohmann::json& j, const WatchConfig& c);
void from_json(const nlohmann::json& j, WatchConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace vcs::config
