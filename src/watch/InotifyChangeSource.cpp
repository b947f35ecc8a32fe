#include "watch/InotifyChangeSource.hpp"
#include "log/Registry.hpp"

#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace vcs::watch;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_DELETE_SELF |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB;

constexpr size_t EVENT_BUFFER_SIZE = 64 * 1024;

}

InotifyChangeSource::InotifyChangeSource(std::filesystem::path root, const bool recursive, util::NowFn now)
    : ChangeSource(std::move(root), std::move(now)), recursive_(recursive) {}

InotifyChangeSource::~InotifyChangeSource() {
    stop();
}

void InotifyChangeSource::start() {
    if (running_) return;

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
        throw std::runtime_error("inotify_init1 failed: " + std::string(std::strerror(errno)));

    if (pipe2(pipe_fd_, O_NONBLOCK | O_CLOEXEC) != 0) {
        const auto err = std::string(std::strerror(errno));
        closeDescriptors();
        throw std::runtime_error("Failed to create shutdown pipe: " + err);
    }

    if (recursive_) addWatchesRecursive(root_);
    else addSingleWatch(root_);

    running_ = true;
    watch_thread_ = std::thread([this] { watchLoop(); });

    log::Registry::watch()->info("[InotifyChangeSource] Watching {} ({} directories)", root_.string(), watchCount());
}

void InotifyChangeSource::stop() {
    if (!running_.exchange(false)) return;

    if (pipe_fd_[1] >= 0) {
        constexpr char wake = 'x';
        if (write(pipe_fd_[1], &wake, 1) < 0)
            log::Registry::watch()->warn("[InotifyChangeSource] Failed to signal watch thread: {}", std::strerror(errno));
    }

    if (watch_thread_.joinable()) watch_thread_.join();

    closeDescriptors();

    std::scoped_lock lock(watch_mutex_);
    wd_to_path_.clear();
    watched_paths_.clear();

    log::Registry::watch()->debug("[InotifyChangeSource] Stopped watching {}", root_.string());
}

std::size_t InotifyChangeSource::watchCount() const {
    std::scoped_lock lock(watch_mutex_);
    return wd_to_path_.size();
}

void InotifyChangeSource::closeDescriptors() {
    if (inotify_fd_ >= 0) close(inotify_fd_);
    if (pipe_fd_[0] >= 0) close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) close(pipe_fd_[1]);
    inotify_fd_ = -1;
    pipe_fd_[0] = pipe_fd_[1] = -1;
}

bool InotifyChangeSource::addSingleWatch(const std::filesystem::path& dir) {
    std::scoped_lock lock(watch_mutex_);
    if (watched_paths_.contains(dir)) return true;

    const int wd = inotify_add_watch(inotify_fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        log::Registry::watch()->warn("[InotifyChangeSource] Failed to watch {}: {}", dir.string(), std::strerror(errno));
        return false;
    }

    wd_to_path_[wd] = dir;
    watched_paths_.insert(dir);
    return true;
}

void InotifyChangeSource::addWatchesRecursive(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;

    if (!addSingleWatch(dir)) return;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         it != end; it.increment(ec)) {
        if (ec) {
            log::Registry::watch()->debug("[InotifyChangeSource] Skipping entry under {}: {}", dir.string(), ec.message());
            ec.clear();
            continue;
        }
        if (it->is_directory(ec) && !it->is_symlink(ec)) addSingleWatch(it->path());
    }
}

void InotifyChangeSource::watchLoop() {
    std::vector<char> buffer(EVENT_BUFFER_SIZE);

    pollfd fds[2];
    fds[0] = {inotify_fd_, POLLIN, 0};
    fds[1] = {pipe_fd_[0], POLLIN, 0};

    while (running_) {
        const int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log::Registry::watch()->error("[InotifyChangeSource] poll failed for {}: {}", root_.string(), std::strerror(errno));
            return;
        }

        if (fds[1].revents & POLLIN) return;

        if (fds[0].revents & POLLIN) {
            while (true) {
                const ssize_t len = read(inotify_fd_, buffer.data(), buffer.size());
                if (len <= 0) break;
                handleEvents(buffer.data(), len);
            }
        }
    }
}

void InotifyChangeSource::handleEvents(const char* buffer, const ssize_t length) {
    for (const char* ptr = buffer; ptr < buffer + length;) {
        const auto* event = reinterpret_cast<const inotify_event*>(ptr);
        ptr += sizeof(inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            log::Registry::watch()->warn("[InotifyChangeSource] Event queue overflow under {}, events lost", root_.string());
            notifyOverflow();
            continue;
        }

        std::filesystem::path dir;
        {
            std::scoped_lock lock(watch_mutex_);
            const auto it = wd_to_path_.find(event->wd);
            if (it == wd_to_path_.end()) continue;
            dir = it->second;

            if (event->mask & IN_IGNORED) {
                watched_paths_.erase(it->second);
                wd_to_path_.erase(it);
                continue;
            }
        }

        const auto path = event->len > 0 ? dir / event->name : dir;

        if (recursive_ && (event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)))
            addWatchesRecursive(path);

        notify(path);
    }
}
