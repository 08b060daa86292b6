/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SCRIPTDECK_EXEC_PROCESS_SPAWNING_HPP
#define SCRIPTDECK_EXEC_PROCESS_SPAWNING_HPP

#include "types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

namespace scriptdeck::exec {

/**
 * @brief Options applied when spawning a script process
 */
struct SpawnOptions {
    std::filesystem::path workingDirectory;  ///< Empty = inherit
    bool newProcessGroup{true};  ///< POSIX: run the child in its own group
};

enum class StreamKind { Stdout, Stderr };

using ChunkHandler = std::function<void(StreamKind, std::string_view)>;

/**
 * @brief OS resources of a spawned child
 */
struct ChildProcess {
    int pid{-1};
#ifdef _WIN32
    void* processHandle{nullptr};
    void* stdoutPipe{nullptr};
    void* stderrPipe{nullptr};
#else
    int stdoutFd{-1};
    int stderrFd{-1};
#endif
};

/**
 * @brief Platform-independent process spawning interface
 */
class ProcessSpawner {
public:
    /**
     * @brief Spawn the plan's executable with piped stdout/stderr
     * @param plan Executable and arguments
     * @param options Working directory and grouping
     * @return Child resources, or SpawnFailure
     */
    [[nodiscard]] static Result<ChildProcess> spawn(const ShellPlan& plan,
                                                    const SpawnOptions& options);

    /**
     * @brief Read both output pipes until they close
     *
     * Chunks are handed over as the OS delivers them. The pipes are closed
     * before returning, on success and on failure.
     * @return Success, or RuntimeIOError on a read fault
     */
    [[nodiscard]] static Result<void> drainOutput(ChildProcess& child,
                                                  size_t bufferSize,
                                                  const ChunkHandler& onChunk);

    /**
     * @brief Block until the child has exited, without reaping it
     *
     * The pid stays reserved until reap(), so it can still be signaled
     * safely.
     */
    static void awaitExit(const ChildProcess& child);

    /**
     * @brief Collect the exit status and release the child
     * @return Exit code, or nullopt when the child was killed by a signal
     */
    [[nodiscard]] static std::optional<int> reap(ChildProcess& child);

    /**
     * @brief Ask a running child to terminate
     * @param processId Child pid
     * @param wholeTree POSIX: signal the child's process group instead of
     *        the child alone. Windows always kills the whole process tree
     *        rooted at the pid.
     * @return True if a signal was delivered
     */
    static bool terminate(int processId, bool wholeTree);

    /**
     * @brief The invoking user's home directory
     */
    [[nodiscard]] static std::filesystem::path homeDirectory();
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_PROCESS_SPAWNING_HPP
