#pragma once

#include "tool/VersionControl.hpp"
#include "config/Config.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vcs::tool {

// VersionControl backed by the Mercurial command line client.
class HgCommandTool final : public VersionControl {
public:
    explicit HgCommandTool(config::ToolConfig cfg = {});

    [[nodiscard]] std::filesystem::path findRootDirectory(const std::filesystem::path& path) override;

    [[nodiscard]] std::optional<status::StatusMap> queryRootStatus(const std::filesystem::path& root) override;
    [[nodiscard]] std::optional<status::StatusMap> queryFileStatus(const PathList& paths) override;

    void addFiles(const PathList& paths, const Completion& done) override;
    void addFilesNotIgnored(const PathList& paths, const Completion& done) override;
    void propagateFileRenamed(const PathList& oldPaths, const PathList& newPaths, const Completion& done) override;
    void propagateFileRemoved(const PathList& paths, const Completion& done) override;

    [[nodiscard]] std::string metadataDirName() const override { return cfg_.metadata_dir; }
    [[nodiscard]] std::string stateFileName() const override { return cfg_.state_file; }

    // Parses `hg status -A -C` output. Paths are resolved against root; an added
    // entry followed by its copy source is reported as renamed ('N').
    static status::StatusMap parseStatusOutput(std::string_view output, const std::filesystem::path& root);

private:
    config::ToolConfig cfg_;

    std::map<std::filesystem::path, PathList> groupByRoot(const PathList& paths);

    // Runs hg in root, false on spawn failure or non-zero exit.
    bool run(const std::filesystem::path& root, const std::vector<std::string>& args, std::string* out = nullptr);

    // Status of files under root, nullopt if any invocation failed.
    std::optional<status::StatusMap> statusOf(const std::filesystem::path& root, const PathList& files);
    // Requeries files after a mutation and hands the result to done.
    void complete(const std::filesystem::path& root, const PathList& files, const Completion& done);

    bool runChunked(const std::filesystem::path& root, const std::vector<std::string>& command, const PathList& files);

    static std::string relativeTo(const std::filesystem::path& root, const std::filesystem::path& path);
};

}
