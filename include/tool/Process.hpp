#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vcs::tool {

struct ProcessResult {
    int exitCode = -1;
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Runs executable with args in cwd and waits for it. Throws std::runtime_error
// when the process cannot be spawned; a failed exec reports exit code 127.
ProcessResult runProcess(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::filesystem::path& cwd = {});

}
