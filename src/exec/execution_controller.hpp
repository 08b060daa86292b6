/*
 * execution_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file execution_controller.hpp
 * @brief Run and stop stored scripts by id
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef SCRIPTDECK_EXEC_EXECUTION_CONTROLLER_HPP
#define SCRIPTDECK_EXEC_EXECUTION_CONTROLLER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "output_channel.hpp"
#include "process_supervisor.hpp"
#include "shell_resolver.hpp"
#include "types.hpp"
#include "../store/repository_interface.hpp"

namespace scriptdeck::exec {

enum class RunState { Idle, Running };

[[nodiscard]] constexpr std::string_view runStateToString(
    RunState state) noexcept {
    return state == RunState::Running ? "running" : "idle";
}

/**
 * @brief Entry point used by the presentation layer
 *
 * Looks up records, resolves a shell plan and hands it to the
 * supervisor. Every event of every run goes to the sink given at
 * construction.
 */
class ExecutionController {
public:
    ExecutionController(std::shared_ptr<store::IScriptRepository> repository,
                        std::shared_ptr<IOutputSink> sink,
                        ShellResolver resolver = ShellResolver{},
                        ShellEnvironment environment =
                            ShellEnvironment::fromProcess(),
                        SupervisorOptions options = {},
                        Platform platform = currentPlatform());

    ExecutionController(const ExecutionController&) = delete;
    ExecutionController& operator=(const ExecutionController&) = delete;

    /**
     * @brief Start the script with the given id
     *
     * NotFound, UnresolvedShell and AlreadyRunning are returned here and
     * leave no trace: no events, no registry entry.
     */
    [[nodiscard]] auto run(const std::string& scriptId) -> Result<RunHandle>;

    /**
     * @return true if a running script was signaled
     */
    bool stop(const std::string& scriptId);

    size_t stopAll();

    [[nodiscard]] bool isRunning(const std::string& scriptId) const;
    [[nodiscard]] auto state(const std::string& scriptId) const -> RunState;
    [[nodiscard]] auto runningScripts() const -> std::vector<std::string>;

    bool waitForIdle(const std::string& scriptId,
                     std::chrono::milliseconds timeout) const;

    /**
     * @brief Plan a record would run with, without starting it
     */
    [[nodiscard]] auto resolvePlan(const store::ScriptRecord& record) const
        -> Result<ShellPlan>;

    [[nodiscard]] auto platform() const -> Platform { return platform_; }

private:
    std::shared_ptr<store::IScriptRepository> repository_;
    std::shared_ptr<IOutputSink> sink_;
    ShellResolver resolver_;
    ShellEnvironment environment_;
    Platform platform_;
    ProcessSupervisor supervisor_;
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_EXECUTION_CONTROLLER_HPP
