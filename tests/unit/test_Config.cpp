#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace vcs::config;
using namespace std::chrono;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override { file = fs::temp_directory_path() / "vcstatus_config_test.yaml"; }
    void TearDown() override { fs::remove(file); }

    void write(const std::string& yaml) const { std::ofstream(file) << yaml; }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    write("");
    const auto cfg = loadConfig(file);

    EXPECT_EQ(cfg.sync.tick_interval, milliseconds(300));
    EXPECT_EQ(cfg.sync.incremental_quiet, milliseconds(100));
    EXPECT_EQ(cfg.sync.rebuild_quiet, milliseconds(1000));
    EXPECT_EQ(cfg.sync.rebuild_threshold_files, 200u);
    EXPECT_EQ(cfg.sync.self_modified_window, milliseconds(3000));
    EXPECT_EQ(cfg.tool.executable, "hg");
    EXPECT_EQ(cfg.tool.metadata_dir, ".hg");
    EXPECT_EQ(cfg.tool.state_file, "dirstate");
    EXPECT_TRUE(cfg.watch.recursive);
    EXPECT_EQ(cfg.logging.max_file_size_mb, 10u);
    EXPECT_EQ(cfg.logging.max_files, 5u);
}

TEST_F(ConfigTest, PartialSectionsOverrideOnlyGivenKeys) {
    write(
        "sync:\n"
        "  rebuild_threshold_files: 50\n"
        "  self_modified_window_ms: 1500\n"
        "tool:\n"
        "  executable: /opt/hg/bin/hg\n"
        "  max_files_per_invocation: 0\n"
        "watch:\n"
        "  recursive: false\n"
        "logging:\n"
        "  log_dir: /tmp/vcstatus-logs\n"
        "  log_levels:\n"
        "    console_log_level: debug\n"
        "    subsystem_levels:\n"
        "      sync: trace\n");

    const auto cfg = loadConfig(file);

    EXPECT_EQ(cfg.sync.rebuild_threshold_files, 50u);
    EXPECT_EQ(cfg.sync.self_modified_window, milliseconds(1500));
    EXPECT_EQ(cfg.sync.tick_interval, milliseconds(300));
    EXPECT_EQ(cfg.tool.executable, "/opt/hg/bin/hg");
    EXPECT_EQ(cfg.tool.max_files_per_invocation, 1u);
    EXPECT_FALSE(cfg.watch.recursive);
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/vcstatus-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.watch, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig(file), std::exception);
}

TEST_F(ConfigTest, JsonRoundTripPreservesSyncTimings) {
    Config cfg;
    cfg.sync.rebuild_quiet = milliseconds(2500);
    cfg.tool.state_file = "wstate";

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("sync").at("rebuild_quiet_ms").get<long>(), 2500);

    const auto back = j.get<Config>();
    EXPECT_EQ(back.sync.rebuild_quiet, milliseconds(2500));
    EXPECT_EQ(back.tool.state_file, "wstate");
}

TEST(ConfigRegistryTest, InitializedForTests) {
    EXPECT_NO_THROW(ConfigRegistry::get());
}

TEST(LogRegistryTest, SubsystemLoggersWriteUnderLogDir) {
    ASSERT_TRUE(vcs::log::Registry::isInitialized());
    EXPECT_EQ(vcs::log::Registry::mainLogPath(), vcs::paths::getLogPath() / "vcstatus.log");
    EXPECT_EQ(vcs::log::Registry::sync()->name(), "sync");
    EXPECT_NO_THROW(vcs::log::Registry::reopenMainLog());
    EXPECT_TRUE(fs::exists(vcs::log::Registry::mainLogPath()));
}

TEST(LogRegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW(vcs::log::Registry::get("no-such-subsystem"), std::runtime_error);
}
