/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scriptdeck::exec {

namespace {

// Both ends are close-on-exec from creation; a fork on another thread
// between pipe() and fcntl() would otherwise keep them open in its child
bool makePipe(std::array<int, 2>& fds) {
    return pipe2(fds.data(), O_CLOEXEC) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void closePipe(std::array<int, 2>& fds) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

// Only async-signal-safe calls from here on
[[noreturn]] void failChild(int statusFd) {
    int err = errno;
    ssize_t ignored = write(statusFd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

auto errnoMessage(std::string_view what, int err) -> std::string {
    return std::string(what) + ": " + std::strerror(err);
}

}  // namespace

Result<ChildProcess> ProcessSpawner::spawn(const ShellPlan& plan,
                                           const SpawnOptions& options) {
    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> errPipe{-1, -1};
    std::array<int, 2> statusPipe{-1, -1};

    if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(statusPipe)) {
        int err = errno;
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(statusPipe);
        spdlog::error("Failed to create pipes for '{}'", plan.executable);
        return makeFailure(ExecutionError::SpawnFailure,
                           errnoMessage("pipe", err));
    }

    int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    // Everything the child needs is prepared before fork
    std::vector<std::string> args;
    args.reserve(plan.argv.size() + 1);
    args.push_back(plan.executable);
    args.insert(args.end(), plan.argv.begin(), plan.argv.end());

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::string workingDir = options.workingDirectory.string();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(statusPipe);
        closeFd(devNull);
        spdlog::error("Fork failed for '{}'", plan.executable);
        return makeFailure(ExecutionError::SpawnFailure,
                           errnoMessage("fork", err));
    }

    if (pid == 0) {
        // Child process
        if (options.newProcessGroup) {
            setpgid(0, 0);
        }

        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(SIGPIPE, &dfl, nullptr);
        sigaction(SIGINT, &dfl, nullptr);
        sigaction(SIGTERM, &dfl, nullptr);

        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        if (dup2(outPipe[1], STDOUT_FILENO) < 0 ||
            dup2(errPipe[1], STDERR_FILENO) < 0) {
            failChild(statusPipe[1]);
        }

        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            failChild(statusPipe[1]);
        }

        execvp(argv[0], argv.data());

        // If we get here, exec failed
        failChild(statusPipe[1]);
    }

    // Parent process
    if (options.newProcessGroup) {
        // Also set from the parent so a signal sent right after spawn
        // cannot miss the group
        setpgid(pid, pid);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);
    closeFd(devNull);

    int childErr = 0;
    ssize_t n;
    do {
        n = read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        spdlog::error("Failed to start '{}': {}", plan.executable,
                      std::strerror(childErr));
        return makeFailure(ExecutionError::SpawnFailure,
                           errnoMessage("spawn " + plan.executable, childErr));
    }

    spdlog::debug("Spawned '{}' with PID {}", plan.executable, pid);

    ChildProcess child;
    child.pid = static_cast<int>(pid);
    child.stdoutFd = outPipe[0];
    child.stderrFd = errPipe[0];
    return child;
}

Result<void> ProcessSpawner::drainOutput(ChildProcess& child,
                                         size_t bufferSize,
                                         const ChunkHandler& onChunk) {
    std::vector<char> buffer(bufferSize > 0 ? bufferSize : 4096);

    while (child.stdoutFd >= 0 || child.stderrFd >= 0) {
        std::array<pollfd, 2> fds{};
        fds[0].fd = child.stdoutFd;
        fds[0].events = POLLIN;
        fds[1].fd = child.stderrFd;
        fds[1].events = POLLIN;

        // Negative descriptors are ignored by poll
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            closeFd(child.stdoutFd);
            closeFd(child.stderrFd);
            return makeFailure(ExecutionError::RuntimeIOError,
                               errnoMessage("poll", err));
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            int& fd = i == 0 ? child.stdoutFd : child.stderrFd;
            ssize_t count = read(fd, buffer.data(), buffer.size());
            if (count > 0) {
                onChunk(i == 0 ? StreamKind::Stdout : StreamKind::Stderr,
                        std::string_view(buffer.data(),
                                         static_cast<size_t>(count)));
            } else if (count == 0) {
                closeFd(fd);
            } else if (errno != EINTR && errno != EAGAIN) {
                int err = errno;
                closeFd(child.stdoutFd);
                closeFd(child.stderrFd);
                return makeFailure(ExecutionError::RuntimeIOError,
                                   errnoMessage("read", err));
            }
        }
    }
    return {};
}

void ProcessSpawner::awaitExit(const ChildProcess& child) {
    if (child.pid <= 0) {
        return;
    }
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(child.pid), &info,
                  WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) {
            spdlog::warn("waitid failed for PID {}: {}", child.pid,
                         std::strerror(errno));
            return;
        }
    }
}

std::optional<int> ProcessSpawner::reap(ChildProcess& child) {
    closeFd(child.stdoutFd);
    closeFd(child.stderrFd);
    if (child.pid <= 0) {
        return std::nullopt;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(child.pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    child.pid = -1;

    if (result < 0) {
        spdlog::warn("waitpid failed: {}", std::strerror(errno));
        return std::nullopt;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return std::nullopt;
}

bool ProcessSpawner::terminate(int processId, bool wholeTree) {
    if (processId <= 0) {
        return false;
    }
    if (wholeTree && kill(-processId, SIGTERM) == 0) {
        return true;
    }
    return kill(processId, SIGTERM) == 0;
}

std::filesystem::path ProcessSpawner::homeDirectory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return std::filesystem::current_path();
}

}  // namespace scriptdeck::exec

#endif  // !_WIN32
