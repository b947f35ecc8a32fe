#pragma once

#include "config/Config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace vcs::config;

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["tick_interval_ms"] = rhs.tick_interval.count();
        node["incremental_quiet_ms"] = rhs.incremental_quiet.count();
        node["rebuild_quiet_ms"] = rhs.rebuild_quiet.count();
        node["rebuild_threshold_files"] = rhs.rebuild_threshold_files;
        node["self_modified_window_ms"] = rhs.self_modified_window.count();
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tick_interval = std::chrono::milliseconds(node["tick_interval_ms"].as<long>(300));
        rhs.incremental_quiet = std::chrono::milliseconds(node["incremental_quiet_ms"].as<long>(100));
        rhs.rebuild_quiet = std::chrono::milliseconds(node["rebuild_quiet_ms"].as<long>(1000));
        rhs.rebuild_threshold_files = node["rebuild_threshold_files"].as<unsigned int>(200);
        rhs.self_modified_window = std::chrono::milliseconds(node["self_modified_window_ms"].as<long>(3000));
        return true;
    }
};

template<>
struct convert<ToolConfig> {
    static Node encode(const ToolConfig& rhs) {
        Node node;
        node["executable"] = rhs.executable;
        node["metadata_dir"] = rhs.metadata_dir;
        node["state_file"] = rhs.state_file;
        node["max_files_per_invocation"] = rhs.max_files_per_invocation;
        return node;
    }

    static bool decode(const Node& node, ToolConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.executable = node["executable"].as<std::string>("hg");
        rhs.metadata_dir = node["metadata_dir"].as<std::string>(".hg");
        rhs.state_file = node["state_file"].as<std::string>("dirstate");
        rhs.max_files_per_invocation = node["max_files_per_invocation"].as<unsigned int>(100);
        if (rhs.max_files_per_invocation == 0) rhs.max_files_per_invocation = 1;
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static Node encode(const WatchConfig& rhs) {
        Node node;
        node["recursive"] = rhs.recursive;
        return node;
    }

    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.recursive = node["recursive"].as<bool>(true);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["vcstatus"] = to_std_string(spdlog::level::to_string_view(rhs.vcstatus));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["watch"]    = to_std_string(spdlog::level::to_string_view(rhs.watch));
        node["store"]    = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["roots"]    = to_std_string(spdlog::level::to_string_view(rhs.roots));
        node["tool"]     = to_std_string(spdlog::level::to_string_view(rhs.tool));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vcstatus = spdlog::level::from_str(node["vcstatus"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("warn"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.roots = spdlog::level::from_str(node["roots"].as<std::string>("info"));
        rhs.tool = spdlog::level::from_str(node["tool"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["max_file_size_mb"] = rhs.max_file_size_mb;
        node["max_files"] = rhs.max_files;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/vcstatus");
        rhs.max_file_size_mb = std::max(1u, node["max_file_size_mb"].as<unsigned int>(10));
        rhs.max_files = node["max_files"].as<unsigned int>(5);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
