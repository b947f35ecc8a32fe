#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace vcs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["tool"]) YAML::convert<ToolConfig>::decode(node, cfg.tool);
    if (auto node = root["watch"]) YAML::convert<WatchConfig>::decode(node, cfg.watch);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"sync", c.sync},
        {"tool", c.tool},
        {"watch", c.watch},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("sync").get_to(c.sync);
    j.at("tool").get_to(c.tool);
    j.at("watch").get_to(c.watch);
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"tick_interval_ms", c.tick_interval.count()},
        {"incremental_quiet_ms", c.incremental_quiet.count()},
        {"rebuild_quiet_ms", c.rebuild_quiet.count()},
        {"rebuild_threshold_files", c.rebuild_threshold_files},
        {"self_modified_window_ms", c.self_modified_window.count()}
    };
}

void from_json(const nlohmann::json& j, SyncConfig& c) {
    c.tick_interval = std::chrono::milliseconds(j.value("tick_interval_ms", 300));
    c.incremental_quiet = std::chrono::milliseconds(j.value("incremental_quiet_ms", 100));
    c.rebuild_quiet = std::chrono::milliseconds(j.value("rebuild_quiet_ms", 1000));
    c.rebuild_threshold_files = j.value("rebuild_threshold_files", 200u);
    c.self_modified_window = std::chrono::milliseconds(j.value("self_modified_window_ms", 3000));
}

void to_json(nlohmann::json& j, const ToolConfig& c) {
    j = {
        {"executable", c.executable},
        {"metadata_dir", c.metadata_dir},
        {"state_file", c.state_file},
        {"max_files_per_invocation", c.max_files_per_invocation}
    };
}

void from_json(const nlohmann::json& j, ToolConfig& c) {
    c.executable = j.value("executable", "hg");
    c.metadata_dir = j.value("metadata_dir", ".hg");
    c.state_file = j.value("state_file", "dirstate");
    c.max_files_per_invocation = j.value("max_files_per_invocation", 100u);
}

void to_json(nlohmann::json& j, const WatchConfig& c) {
    j = {{"recursive", c.recursive}};
}

void from_json(const nlohmann::json& j, WatchConfig& c) {
    c.recursive = j.value("recursive", true);
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"vcstatus", levelName(c.vcstatus)},
        {"sync", levelName(c.sync)},
        {"watch", levelName(c.watch)},
        {"store", levelName(c.store)},
        {"roots", levelName(c.roots)},
        {"tool", levelName(c.tool)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.vcstatus = spdlog::level::from_str(j.value("vcstatus", "info"));
    c.sync = spdlog::level::from_str(j.value("sync", "info"));
    c.watch = spdlog::level::from_str(j.value("watch", "warn"));
    c.store = spdlog::level::from_str(j.value("store", "warn"));
    c.roots = spdlog::level::from_str(j.value("roots", "info"));
    c.tool = spdlog::level::from_str(j.value("tool", "warn"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "warn"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"max_file_size_mb", c.max_file_size_mb},
        {"max_files", c.max_files},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string("/var/log/vcstatus"));
    c.max_file_size_mb = j.value("max_file_size_mb", 10u);
    c.max_files = j.value("max_files", 5u);
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace vcs::config
