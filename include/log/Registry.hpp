#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vcs::log {

// Named subsystem loggers sharing one console and one rotating file sink.
// Levels and the rotation policy come from ConfigRegistry, which must be initialized first.
class Registry {
public:
    static void init(const std::filesystem::path& logDir);

    // Throws when the logger is unknown or init() has not run.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> vcstatus() { return get("vcstatus"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> watch()    { return get("watch"); }
    static std::shared_ptr<spdlog::logger> store()    { return get("store"); }
    static std::shared_ptr<spdlog::logger> roots()    { return get("roots"); }
    static std::shared_ptr<spdlog::logger> tool()     { return get("tool"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static std::filesystem::path mainLogPath();

    // Swaps in a fresh file sink, for use after an external logrotate.
    static void reopenMainLog();

private:
    static constexpr const auto* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    struct State {
        bool initialized = false;
        std::filesystem::path mainLog;
        std::size_t maxBytes = 0;
        std::size_t maxFiles = 0;
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console;
        std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file;
    };

    static State state_;

    static std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> makeFileSink(spdlog::level::level_enum level);
};

}
