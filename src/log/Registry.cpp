#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

using namespace vcs::log;

namespace {

constexpr const char* SUBSYSTEMS[] = {"vcstatus", "sync", "watch", "store", "roots", "tool"};

spdlog::level::level_enum levelFor(const std::string& name, const vcs::config::SubsystemLogLevelsConfig& lv) {
    if (name == "sync") return lv.sync;
    if (name == "watch") return lv.watch;
    if (name == "store") return lv.store;
    if (name == "roots") return lv.roots;
    if (name == "tool") return lv.tool;
    return lv.vcstatus;
}

}

Registry::State Registry::state_;

std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> Registry::makeFileSink(const spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        state_.mainLog.string(), state_.maxBytes, state_.maxFiles);
    sink->set_level(level);
    sink->set_pattern(PATTERN);
    return sink;
}

void Registry::init(const std::filesystem::path& logDir) {
    if (state_.initialized) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::filesystem::create_directories(logDir);

    const auto& cnf = config::ConfigRegistry::get().logging;
    state_.mainLog = logDir / "vcstatus.log";
    state_.maxBytes = static_cast<std::size_t>(cnf.max_file_size_mb) * 1024 * 1024;
    state_.maxFiles = cnf.max_files;

    state_.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    state_.console->set_level(cnf.levels.console_log_level);
    state_.console->set_pattern(PATTERN);
    state_.file = makeFileSink(cnf.levels.file_log_level);

    for (const std::string name : SUBSYSTEMS) {
        auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{state_.console, state_.file});
        logger->set_level(levelFor(name, cnf.levels.subsystem_levels));
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    state_.initialized = true;
    vcstatus()->debug("[LogRegistry] Logging to {}", state_.mainLog.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    if (!state_.initialized) throw std::runtime_error("[LogRegistry] Not initialized, cannot get logger: " + name);
    throw std::runtime_error("[LogRegistry] Unknown logger: " + name);
}

bool Registry::isInitialized() { return state_.initialized; }

std::filesystem::path Registry::mainLogPath() { return state_.mainLog; }

void Registry::reopenMainLog() {
    if (!state_.initialized) return;

    const auto old = state_.file;
    const auto fresh = makeFileSink(old->level());

    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        for (auto& sink : lg->sinks()) {
            if (sink != old) continue;
            lg->flush();
            sink = fresh;
        }
    });

    state_.file = fresh;
    vcstatus()->info("[LogRegistry] Reopened {}", state_.mainLog.string());
}
