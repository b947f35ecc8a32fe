// Core
#include "core/StatusCache.hpp"
#include "tool/HgCommandTool.hpp"
#include "concurrency/AsioDispatcher.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

using namespace vcs;
using namespace vcs::config;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int sig) {
    if (sig == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

void usage() {
    std::cerr << "usage: vcstatusd [--config PATH] [--dump] DIR...\n";
}

nlohmann::json toJson(const status::RecordMap& records) {
    auto j = nlohmann::json::array();
    for (const auto& [_, record] : records) j.push_back(record);
    return j;
}
}

int main(const int argc, char** argv) {
    std::vector<std::filesystem::path> dirs;
    bool dump = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) paths::setConfigPath(argv[++i]);
        else if (arg == "--dump") dump = true;
        else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            usage();
            return 2;
        } else dirs.emplace_back(arg);
    }

    if (dirs.empty()) {
        usage();
        return 2;
    }

    try {
        ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init(ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize vcstatusd: " << e.what() << std::endl;
        return 1;
    }

    const auto& cfg = ConfigRegistry::get();
    const auto dispatcher = std::make_shared<concurrency::AsioDispatcher>();
    core::StatusCache cache(cfg, std::make_shared<tool::HgCommandTool>(cfg.tool), dispatcher);

    for (const auto& dir : dirs) cache.addRoot(dir);

    if (dump) {
        std::cout << toJson(cache.snapshot()).dump(2) << std::endl;
        return 0;
    }

    if (!cache.anyItemsUnderSourceControl()) {
        log::Registry::vcstatus()->error("[vcstatusd] None of the given directories is inside a repository");
        return 1;
    }

    cache.onStatusChanged([&cache] {
        log::Registry::vcstatus()->info("[vcstatusd] Status changed, {} files cached", cache.count());
    });

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);  // logrotate

    cache.start();
    log::Registry::vcstatus()->info("[vcstatusd] Watching {} director{}", dirs.size(), dirs.size() == 1 ? "y" : "ies");

    while (!shouldExit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (reopenLogs.exchange(false)) log::Registry::reopenMainLog();
    }

    log::Registry::vcstatus()->info("[vcstatusd] Shutting down...");
    cache.stop();
    dispatcher->shutdown();
    return 0;
}
