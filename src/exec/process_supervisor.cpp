/*
 * process_supervisor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_supervisor.cpp
 * @brief Registry and lifecycle of running script processes
 * @date 2024-1-13
 */

#include "process_supervisor.hpp"
#include "command_line.hpp"
#include "process_spawning.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace scriptdeck::exec {

class ProcessSupervisor::Impl {
public:
    struct RunEntry {
        RunHandle handle;
        uint64_t serial{0};
        bool stopRequested{false};
    };

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    SupervisorOptions options_;

    // Registry: the only state shared between callers and workers
    mutable std::mutex mutex_;
    mutable std::condition_variable idleCv_;
    std::unordered_map<std::string, RunEntry> runs_;
    uint64_t nextSerial_{1};

    std::mutex workersMutex_;
    std::vector<Worker> workers_;

    explicit Impl(SupervisorOptions options) : options_(std::move(options)) {
        if (options_.workingDirectory.empty()) {
            options_.workingDirectory = ProcessSpawner::homeDirectory();
        }
    }

    // Removes the entry of this exact run; later calls are no-ops
    auto onExit(const std::string& scriptId, uint64_t serial)
        -> std::optional<RunEntry> {
        std::optional<RunEntry> removed;
        {
            std::lock_guard lock(mutex_);
            auto it = runs_.find(scriptId);
            if (it == runs_.end() || it->second.serial != serial) {
                return std::nullopt;
            }
            removed = std::move(it->second);
            runs_.erase(it);
        }
        idleCv_.notify_all();
        return removed;
    }

    void reapWorkers() {
        std::lock_guard lock(workersMutex_);
        std::erase_if(workers_,
                      [](const Worker& w) { return w.done->load(); });
    }

    void runWorker(const std::string& scriptId, uint64_t serial,
                   const ShellPlan& plan,
                   const std::shared_ptr<OutputStream>& stream) {
        SpawnOptions spawnOptions;
        spawnOptions.workingDirectory = options_.workingDirectory;
        spawnOptions.newProcessGroup = options_.killProcessGroup;

        auto child = ProcessSpawner::spawn(plan, spawnOptions);
        if (!child) {
            spdlog::error("ProcessSupervisor: '{}' failed to start: {}",
                          scriptId, child.error().message);
            onExit(scriptId, serial);
            stream->emitError(child.error().message, true);
            return;
        }

        bool stopNow = false;
        {
            std::lock_guard lock(mutex_);
            if (auto it = runs_.find(scriptId);
                it != runs_.end() && it->second.serial == serial) {
                it->second.handle.pid = child->pid;
                stopNow = it->second.stopRequested;
            }
        }
        if (stopNow) {
            spdlog::info("ProcessSupervisor: '{}' stopped before spawn completed",
                         scriptId);
            ProcessSpawner::terminate(child->pid, options_.killProcessGroup);
        }

        auto drained = ProcessSpawner::drainOutput(
            *child, options_.readBufferSize,
            [&stream](StreamKind kind, std::string_view chunk) {
                if (kind == StreamKind::Stdout) {
                    stream->emitStdout(chunk);
                } else {
                    stream->emitStderr(chunk);
                }
            });
        if (!drained) {
            spdlog::error("ProcessSupervisor: output of '{}' failed: {}",
                          scriptId, drained.error().message);
            stream->emitError(drained.error().message, false);
        }

        ProcessSpawner::awaitExit(*child);
        auto entry = onExit(scriptId, serial);
        auto exitCode = ProcessSpawner::reap(*child);
#ifdef _WIN32
        // TerminateProcess leaves exit code 1; report a kill as no code
        if (entry && entry->stopRequested) {
            exitCode.reset();
        }
#endif
        if (exitCode) {
            spdlog::debug("ProcessSupervisor: '{}' exited with code {}",
                          scriptId, *exitCode);
        } else {
            spdlog::debug("ProcessSupervisor: '{}' was killed", scriptId);
        }
        stream->emitEnd(exitCode);
    }

    bool signal(RunEntry& entry) {
        entry.stopRequested = true;
        if (entry.handle.pid) {
            ProcessSpawner::terminate(*entry.handle.pid,
                                      options_.killProcessGroup);
        }
        return true;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            for (auto& [id, entry] : runs_) {
                signal(entry);
            }
        }
        std::vector<Worker> workers;
        {
            std::lock_guard lock(workersMutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }
};

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : pImpl_(std::make_unique<Impl>(std::move(options))) {}

ProcessSupervisor::~ProcessSupervisor() { pImpl_->shutdown(); }

auto ProcessSupervisor::start(const std::string& scriptId, ShellPlan plan,
                              std::shared_ptr<IOutputSink> sink)
    -> Result<RunHandle> {
    pImpl_->reapWorkers();

    RunHandle handle;
    handle.scriptId = scriptId;
    handle.startedAt = std::chrono::system_clock::now();
    handle.commandLine = formatCommandLine(plan);

    uint64_t serial = 0;
    {
        std::lock_guard lock(pImpl_->mutex_);
        if (pImpl_->runs_.contains(scriptId)) {
            spdlog::debug("ProcessSupervisor: '{}' is already running",
                          scriptId);
            return makeFailure(ExecutionError::AlreadyRunning, scriptId);
        }
        serial = pImpl_->nextSerial_++;
        handle.serial = serial;
        pImpl_->runs_.emplace(scriptId,
                              Impl::RunEntry{handle, serial, false});
    }

    // Registered before any event can be observed
    auto stream = std::make_shared<OutputStream>(scriptId, std::move(sink),
                                                 serial);
    stream->emitStart("Running with " + handle.commandLine);

    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::jthread thread([impl = pImpl_.get(), scriptId, serial,
                             plan = std::move(plan), stream, done] {
            impl->runWorker(scriptId, serial, plan, stream);
            done->store(true);
        });
        std::lock_guard lock(pImpl_->workersMutex_);
        pImpl_->workers_.push_back(Impl::Worker{std::move(thread), done});
    } catch (const std::system_error& e) {
        spdlog::error("ProcessSupervisor: no worker for '{}': {}", scriptId,
                      e.what());
        pImpl_->onExit(scriptId, serial);
        stream->emitError(e.what(), true);
    }

    spdlog::debug("ProcessSupervisor: started '{}'", scriptId);
    return handle;
}

bool ProcessSupervisor::stop(const std::string& scriptId) {
    // Signaled under the lock: the worker only reaps after deregistering,
    // so a registered pid is never a recycled one
    std::lock_guard lock(pImpl_->mutex_);
    auto it = pImpl_->runs_.find(scriptId);
    if (it == pImpl_->runs_.end()) {
        return false;
    }
    spdlog::info("ProcessSupervisor: stopping '{}'", scriptId);
    return pImpl_->signal(it->second);
}

size_t ProcessSupervisor::stopAll() {
    std::lock_guard lock(pImpl_->mutex_);
    for (auto& [id, entry] : pImpl_->runs_) {
        spdlog::info("ProcessSupervisor: stopping '{}'", id);
        pImpl_->signal(entry);
    }
    return pImpl_->runs_.size();
}

bool ProcessSupervisor::isRunning(const std::string& scriptId) const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->runs_.contains(scriptId);
}

auto ProcessSupervisor::handle(const std::string& scriptId) const
    -> std::optional<RunHandle> {
    std::lock_guard lock(pImpl_->mutex_);
    auto it = pImpl_->runs_.find(scriptId);
    if (it == pImpl_->runs_.end()) {
        return std::nullopt;
    }
    return it->second.handle;
}

auto ProcessSupervisor::runningScripts() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(pImpl_->mutex_);
        ids.reserve(pImpl_->runs_.size());
        for (const auto& [id, entry] : pImpl_->runs_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool ProcessSupervisor::waitForIdle(const std::string& scriptId,
                                    std::chrono::milliseconds timeout) const {
    std::unique_lock lock(pImpl_->mutex_);
    return pImpl_->idleCv_.wait_for(lock, timeout, [&] {
        return !pImpl_->runs_.contains(scriptId);
    });
}

auto ProcessSupervisor::options() const -> const SupervisorOptions& {
    return pImpl_->options_;
}

}  // namespace scriptdeck::exec
