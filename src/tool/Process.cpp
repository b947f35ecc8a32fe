#include "tool/Process.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace vcs::tool {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

}

ProcessResult runProcess(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::filesystem::path& cwd) {
    int outPipe[2], errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create stdout pipe for " + executable);
    if (pipe2(errPipe, O_CLOEXEC) == -1) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw std::runtime_error("Failed to create stderr pipe for " + executable);
    }

    // argv must be built before fork
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        throw std::runtime_error("Failed to fork " + executable + ": " + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: wire pipes to stdout/stderr and exec
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);
        execvp(executable.c_str(), argv.data());
        _exit(127); // exec failed
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ProcessResult result;
    char buf[8192];

    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int open = 2;
    while (open > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            const ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(i == 0 ? outPipe[0] : errPipe[0]);
                fds[i].fd = -1;
                --open;
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error("waitpid failed for " + executable + ": " + std::strerror(errno));
    }

    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exitCode = 128 + WTERMSIG(status);

    return result;
}

}
