/*
 * process_supervisor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_supervisor.hpp
 * @brief Registry and lifecycle of running script processes
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef SCRIPTDECK_EXEC_PROCESS_SUPERVISOR_HPP
#define SCRIPTDECK_EXEC_PROCESS_SUPERVISOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "output_channel.hpp"
#include "types.hpp"

namespace scriptdeck::exec {

/**
 * @brief Supervisor settings
 */
struct SupervisorOptions {
    std::filesystem::path workingDirectory;  ///< Empty = user's home
    bool killProcessGroup{true};             ///< POSIX: stop signals the group
    size_t readBufferSize{4096};             ///< Bytes per output read
};

/**
 * @brief Owns the mapping from script id to its live child process
 *
 * At most one run exists per script id. Each run gets a worker thread
 * that spawns the child, streams its output and emits the terminal
 * event. The run is deregistered before its terminal event is
 * delivered, so the id can be started again as soon as a consumer sees
 * that event.
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    /**
     * @brief Stops every run and joins all workers
     */
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief Register and launch a run
     *
     * Spawn failures are not returned here: they are reported on the
     * run's event stream as a final error event.
     * @param scriptId Script identifier
     * @param plan Resolved executable and arguments
     * @param sink Receiver of the run's events
     * @return Handle snapshot, or AlreadyRunning
     */
    [[nodiscard]] auto start(const std::string& scriptId, ShellPlan plan,
                             std::shared_ptr<IOutputSink> sink)
        -> Result<RunHandle>;

    /**
     * @brief Request termination of a run
     *
     * Does not wait for the terminal event.
     * @return true if a run was signaled, false if none was registered
     */
    bool stop(const std::string& scriptId);

    /**
     * @brief Request termination of every run
     * @return Number of runs signaled
     */
    size_t stopAll();

    [[nodiscard]] bool isRunning(const std::string& scriptId) const;

    [[nodiscard]] auto handle(const std::string& scriptId) const
        -> std::optional<RunHandle>;

    [[nodiscard]] auto runningScripts() const -> std::vector<std::string>;

    /**
     * @brief Wait until no run is registered for the id
     * @return false on timeout
     */
    bool waitForIdle(const std::string& scriptId,
                     std::chrono::milliseconds timeout) const;

    [[nodiscard]] auto options() const -> const SupervisorOptions&;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_PROCESS_SUPERVISOR_HPP
