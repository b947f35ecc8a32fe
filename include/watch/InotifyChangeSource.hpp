#pragma once

#include "watch/ChangeSource.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <sys/types.h>

namespace vcs::watch {

// Linux inotify source. Subdirectories are watched as they appear when recursive.
class InotifyChangeSource final : public ChangeSource {
public:
    explicit InotifyChangeSource(std::filesystem::path root, bool recursive = true,
                                 util::NowFn now = util::systemNow);
    ~InotifyChangeSource() override;

    void start() override;
    void stop() override;

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] std::size_t watchCount() const;

private:
    void watchLoop();
    void handleEvents(const char* buffer, ssize_t length);

    bool addSingleWatch(const std::filesystem::path& dir);
    void addWatchesRecursive(const std::filesystem::path& dir);

    void closeDescriptors();

    bool recursive_;

    int inotify_fd_{-1};
    int pipe_fd_[2]{-1, -1};  // wakes the loop for shutdown

    std::atomic<bool> running_{false};
    std::thread watch_thread_;

    mutable std::mutex watch_mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
    std::unordered_set<std::filesystem::path> watched_paths_;
};

}
