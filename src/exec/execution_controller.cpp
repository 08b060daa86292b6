/*
 * execution_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution_controller.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace scriptdeck::exec {

ExecutionController::ExecutionController(
    std::shared_ptr<store::IScriptRepository> repository,
    std::shared_ptr<IOutputSink> sink, ShellResolver resolver,
    ShellEnvironment environment, SupervisorOptions options,
    Platform platform)
    : repository_(std::move(repository)),
      sink_(std::move(sink)),
      resolver_(std::move(resolver)),
      environment_(std::move(environment)),
      platform_(platform),
      supervisor_(std::move(options)) {}

auto ExecutionController::resolvePlan(const store::ScriptRecord& record) const
    -> Result<ShellPlan> {
    return resolver_.resolve(record.shellOrDefault(platform_), platform_,
                             environment_, record.content);
}

auto ExecutionController::run(const std::string& scriptId)
    -> Result<RunHandle> {
    auto record = repository_->get(scriptId);
    if (!record) {
        spdlog::warn("ExecutionController: script '{}' not found", scriptId);
        return makeFailure(ExecutionError::NotFound,
                           "Script not found: " + scriptId);
    }

    // Checked before resolving so a duplicate request costs no probes
    if (supervisor_.isRunning(scriptId)) {
        return makeFailure(ExecutionError::AlreadyRunning, scriptId);
    }

    auto plan = resolvePlan(*record);
    if (!plan) {
        spdlog::warn("ExecutionController: cannot run '{}': {}", record->name,
                     plan.error().message);
        return std::unexpected(plan.error());
    }

    spdlog::info("ExecutionController: running '{}' ({})", record->name,
                 scriptId);
    return supervisor_.start(scriptId, std::move(*plan), sink_);
}

bool ExecutionController::stop(const std::string& scriptId) {
    return supervisor_.stop(scriptId);
}

size_t ExecutionController::stopAll() { return supervisor_.stopAll(); }

bool ExecutionController::isRunning(const std::string& scriptId) const {
    return supervisor_.isRunning(scriptId);
}

auto ExecutionController::state(const std::string& scriptId) const
    -> RunState {
    return supervisor_.isRunning(scriptId) ? RunState::Running
                                           : RunState::Idle;
}

auto ExecutionController::runningScripts() const -> std::vector<std::string> {
    return supervisor_.runningScripts();
}

bool ExecutionController::waitForIdle(const std::string& scriptId,
                                      std::chrono::milliseconds timeout) const {
    return supervisor_.waitForIdle(scriptId, timeout);
}

}  // namespace scriptdeck::exec
