#pragma once

#include "status/Record.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace vcs::tool {

using PathList = std::vector<std::filesystem::path>;

// Receives the root (or common base) a result belongs to and the reported states.
using Completion = std::function<void(const std::filesystem::path& root, const status::StatusMap& result)>;

// Operation set of the external version control tool. Failures are never thrown
// to callers. Queries return nullopt when the tool could not answer, an empty map
// when it answered with no files.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    // Nearest enclosing repository root, or an empty path.
    [[nodiscard]] virtual std::filesystem::path findRootDirectory(const std::filesystem::path& path) = 0;

    [[nodiscard]] virtual std::optional<status::StatusMap> queryRootStatus(const std::filesystem::path& root) = 0;

    // done is only invoked when the query succeeded.
    virtual void queryRootStatusAsync(const std::filesystem::path& root, const Completion& done);

    [[nodiscard]] virtual std::optional<status::StatusMap> queryFileStatus(const PathList& paths) = 0;

    virtual void addFiles(const PathList& paths, const Completion& done) = 0;
    virtual void addFilesNotIgnored(const PathList& paths, const Completion& done) = 0;
    virtual void propagateFileRenamed(const PathList& oldPaths, const PathList& newPaths, const Completion& done) = 0;
    virtual void propagateFileRemoved(const PathList& paths, const Completion& done) = 0;

    // Name of the tool's private metadata directory (".hg") and its working state file ("dirstate").
    [[nodiscard]] virtual std::string metadataDirName() const = 0;
    [[nodiscard]] virtual std::string stateFileName() const = 0;
};

}
