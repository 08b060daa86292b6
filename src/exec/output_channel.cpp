/*
 * output_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_channel.cpp
 * @brief Per-run output event streams and consumer sinks
 * @date 2024-1-13
 */

#include "output_channel.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace scriptdeck::exec {

CallbackSink::CallbackSink(Callback callback)
    : callback_(std::move(callback)) {}

void CallbackSink::onEvent(const OutputEvent& event) {
    if (callback_) {
        callback_(event);
    }
}

// =========================================================================
// EventQueue
// =========================================================================

void EventQueue::onEvent(const OutputEvent& event) {
    {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }
    cv_.notify_all();
}

auto EventQueue::next(std::chrono::milliseconds timeout)
    -> std::optional<OutputEvent> {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto EventQueue::collectRun(const std::string& scriptId,
                            std::chrono::milliseconds timeout)
    -> std::vector<OutputEvent> {
    std::vector<OutputEvent> collected;
    std::optional<uint64_t> serial;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock lock(mutex_);
    while (true) {
        auto it = std::find_if(events_.begin(), events_.end(),
                               [&](const OutputEvent& e) {
                                   return e.scriptId == scriptId &&
                                          (!serial || e.runSerial == *serial);
                               });
        if (it != events_.end()) {
            serial = it->runSerial;
            collected.push_back(std::move(*it));
            events_.erase(it);
            if (collected.back().isTerminal()) {
                break;
            }
            continue;
        }
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::debug("EventQueue: timed out collecting run '{}'",
                          scriptId);
            break;
        }
    }
    return collected;
}

auto EventQueue::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return events_.size();
}

// =========================================================================
// OutputStream
// =========================================================================

OutputStream::OutputStream(std::string scriptId,
                           std::shared_ptr<IOutputSink> sink,
                           uint64_t runSerial)
    : scriptId_(std::move(scriptId)),
      sink_(std::move(sink)),
      runSerial_(runSerial) {}

bool OutputStream::emitStart(std::string commandLine) {
    std::lock_guard lock(mutex_);
    if (phase_ != Phase::Fresh) {
        spdlog::warn("OutputStream: duplicate start for '{}' dropped",
                     scriptId_);
        return false;
    }
    phase_ = Phase::Open;
    deliver(OutputEvent{OutputEventKind::Start, scriptId_,
                        std::move(commandLine), std::nullopt, false});
    return true;
}

bool OutputStream::emitStdout(std::string_view chunk) {
    return emitData(OutputEventKind::Stdout, chunk);
}

bool OutputStream::emitStderr(std::string_view chunk) {
    return emitData(OutputEventKind::Stderr, chunk);
}

bool OutputStream::emitData(OutputEventKind kind, std::string_view chunk) {
    std::lock_guard lock(mutex_);
    if (phase_ != Phase::Open) {
        spdlog::warn("OutputStream: {} chunk for '{}' outside of run dropped",
                     outputEventKindToString(kind), scriptId_);
        return false;
    }
    deliver(OutputEvent{kind, scriptId_, std::string(chunk), std::nullopt,
                        false});
    return true;
}

bool OutputStream::emitError(std::string message, bool final) {
    std::lock_guard lock(mutex_);
    if (phase_ != Phase::Open || errorEmitted_) {
        spdlog::warn("OutputStream: error for '{}' dropped: {}", scriptId_,
                     message);
        return false;
    }
    errorEmitted_ = true;
    if (final) {
        phase_ = Phase::Closed;
    }
    deliver(OutputEvent{OutputEventKind::Error, scriptId_, std::move(message),
                        std::nullopt, final});
    return true;
}

bool OutputStream::emitEnd(std::optional<int> exitCode) {
    std::lock_guard lock(mutex_);
    if (phase_ != Phase::Open) {
        spdlog::warn("OutputStream: end for '{}' dropped", scriptId_);
        return false;
    }
    phase_ = Phase::Closed;
    deliver(OutputEvent{OutputEventKind::End, scriptId_, {}, exitCode, false});
    return true;
}

bool OutputStream::started() const {
    std::lock_guard lock(mutex_);
    return phase_ != Phase::Fresh;
}

bool OutputStream::finished() const {
    std::lock_guard lock(mutex_);
    return phase_ == Phase::Closed;
}

void OutputStream::deliver(OutputEvent event) {
    if (!sink_) {
        return;
    }
    event.runSerial = runSerial_;
    try {
        sink_->onEvent(event);
    } catch (const std::exception& e) {
        spdlog::error("OutputStream: sink failed on {} event for '{}': {}",
                      outputEventKindToString(event.kind), scriptId_,
                      e.what());
    } catch (...) {
        spdlog::error("OutputStream: sink failed on {} event for '{}'",
                      outputEventKindToString(event.kind), scriptId_);
    }
}

}  // namespace scriptdeck::exec
