#include "tool/HgCommandTool.hpp"
#include "tool/Process.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <boost/algorithm/string.hpp>

using namespace vcs::tool;
using namespace vcs::status;

HgCommandTool::HgCommandTool(config::ToolConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.max_files_per_invocation == 0) cfg_.max_files_per_invocation = 1;
}

std::filesystem::path HgCommandTool::findRootDirectory(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    if (path.empty()) return {};

    std::error_code ec;
    fs::path dir = fs::absolute(path, ec).lexically_normal();
    if (ec) dir = path.lexically_normal();
    if (!dir.has_filename()) dir = dir.parent_path();
    if (!fs::is_directory(dir, ec)) dir = dir.parent_path();

    for (; !dir.empty(); dir = dir.parent_path()) {
        if (fs::is_directory(dir / cfg_.metadata_dir, ec)) return dir;
        if (dir == dir.root_path()) break;
    }
    return {};
}

std::string HgCommandTool::relativeTo(const std::filesystem::path& root, const std::filesystem::path& path) {
    return path.lexically_relative(root).string();
}

bool HgCommandTool::run(const std::filesystem::path& root, const std::vector<std::string>& args, std::string* out) {
    try {
        auto res = runProcess(cfg_.executable, args, root);
        if (!res.ok()) {
            boost::algorithm::trim(res.err);
            log::Registry::tool()->warn("[HgCommandTool] '{} {}' failed in {} (exit {}): {}",
                                        cfg_.executable, args.empty() ? "" : args.front(), root.string(),
                                        res.exitCode, res.err);
            return false;
        }
        if (out) *out = std::move(res.out);
        return true;
    } catch (const std::exception& e) {
        log::Registry::tool()->error("[HgCommandTool] Failed to run {}: {}", cfg_.executable, e.what());
        return false;
    }
}

StatusMap HgCommandTool::parseStatusOutput(const std::string_view output, const std::filesystem::path& root) {
    StatusMap result;
    std::filesystem::path lastAdded;

    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() < 3) continue;

        // copy source of the preceding added entry
        if (line[0] == ' ' && line[1] == ' ') {
            if (!lastAdded.empty()) result[lastAdded] = 'N';
            lastAdded.clear();
            continue;
        }

        if (line[1] != ' ') continue;

        char state = line[0];
        if (state == '!') state = 'M';  // tracked but missing from the working copy

        const auto path = (root / line.substr(2)).lexically_normal();
        result[path] = state;
        lastAdded = state == 'A' ? path : std::filesystem::path{};
    }
    return result;
}

std::optional<StatusMap> HgCommandTool::queryRootStatus(const std::filesystem::path& root) {
    std::string out;
    if (!run(root, {"status", "-A", "-C"}, &out)) return std::nullopt;

    auto result = parseStatusOutput(out, root);
    log::Registry::tool()->debug("[HgCommandTool] Root status for {}: {} files", root.string(), result.size());
    return result;
}

std::map<std::filesystem::path, PathList> HgCommandTool::groupByRoot(const PathList& paths) {
    std::map<std::filesystem::path, PathList> grouped;
    std::unordered_map<std::filesystem::path, std::filesystem::path> rootOfDir;

    for (const auto& p : paths) {
        const auto dir = p.parent_path();
        auto it = rootOfDir.find(dir);
        if (it == rootOfDir.end()) it = rootOfDir.emplace(dir, findRootDirectory(dir)).first;
        if (it->second.empty()) {
            log::Registry::tool()->debug("[HgCommandTool] {} is not inside a repository", p.string());
            continue;
        }
        grouped[it->second].push_back(p);
    }
    return grouped;
}

std::optional<StatusMap> HgCommandTool::statusOf(const std::filesystem::path& root, const PathList& files) {
    StatusMap result;
    const auto chunk = cfg_.max_files_per_invocation;

    for (size_t i = 0; i < files.size(); i += chunk) {
        std::vector<std::string> args = {"status", "-A", "-C", "--"};
        const auto end = std::min(files.size(), i + chunk);
        for (size_t j = i; j < end; ++j) args.push_back("path:" + relativeTo(root, files[j]));

        std::string out;
        if (!run(root, args, &out)) return std::nullopt;
        result.merge(parseStatusOutput(out, root));
    }
    return result;
}

void HgCommandTool::complete(const std::filesystem::path& root, const PathList& files, const Completion& done) {
    if (!done) return;
    if (const auto status = statusOf(root, files)) done(root, *status);
}

bool HgCommandTool::runChunked(const std::filesystem::path& root, const std::vector<std::string>& command,
                               const PathList& files) {
    bool ok = true;
    const auto chunk = cfg_.max_files_per_invocation;

    for (size_t i = 0; i < files.size(); i += chunk) {
        auto args = command;
        args.emplace_back("--");
        const auto end = std::min(files.size(), i + chunk);
        for (size_t j = i; j < end; ++j) args.push_back("path:" + relativeTo(root, files[j]));
        ok = run(root, args) && ok;
    }
    return ok;
}

std::optional<StatusMap> HgCommandTool::queryFileStatus(const PathList& paths) {
    StatusMap result;
    for (const auto& [root, files] : groupByRoot(paths)) {
        auto status = statusOf(root, files);
        if (!status) return std::nullopt;
        result.merge(*status);
    }
    return result;
}

void HgCommandTool::addFiles(const PathList& paths, const Completion& done) {
    for (const auto& [root, files] : groupByRoot(paths)) {
        runChunked(root, {"add"}, files);
        complete(root, files, done);
    }
}

void HgCommandTool::addFilesNotIgnored(const PathList& paths, const Completion& done) {
    for (const auto& [root, files] : groupByRoot(paths)) {
        const auto before = statusOf(root, files);
        if (!before) continue;

        PathList unknown;
        for (const auto& f : files)
            if (const auto it = before->find(f.lexically_normal()); it != before->end() && it->second == '?')
                unknown.push_back(f);

        if (unknown.empty()) {
            if (done) done(root, *before);
            continue;
        }

        runChunked(root, {"add"}, unknown);
        complete(root, files, done);
    }
}

void HgCommandTool::propagateFileRenamed(const PathList& oldPaths, const PathList& newPaths, const Completion& done) {
    const auto n = std::min(oldPaths.size(), newPaths.size());

    std::map<std::filesystem::path, std::vector<std::pair<std::filesystem::path, std::filesystem::path>>> byRoot;
    for (size_t i = 0; i < n; ++i) {
        const auto root = findRootDirectory(newPaths[i].parent_path());
        if (root.empty()) continue;
        byRoot[root].emplace_back(oldPaths[i], newPaths[i]);
    }

    for (const auto& [root, pairs] : byRoot) {
        PathList touched;
        for (const auto& [from, to] : pairs) {
            run(root, {"rename", "--after", "--", relativeTo(root, from), relativeTo(root, to)});
            touched.push_back(from);
            touched.push_back(to);
        }
        complete(root, touched, done);
    }
}

void HgCommandTool::propagateFileRemoved(const PathList& paths, const Completion& done) {
    for (const auto& [root, files] : groupByRoot(paths)) {
        runChunked(root, {"remove", "--after"}, files);
        complete(root, files, done);
    }
}
