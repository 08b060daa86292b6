/*
 * output_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_channel.hpp
 * @brief Per-run output event streams and consumer sinks
 * @date 2024-1-13
 * @version 2.1.0
 *
 * Every run produces one finite OutputStream: a single start event,
 * interleaved stdout/stderr chunks, at most one error and a terminal
 * event. Consumers receive the events through an IOutputSink.
 */

#ifndef SCRIPTDECK_EXEC_OUTPUT_CHANNEL_HPP
#define SCRIPTDECK_EXEC_OUTPUT_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace scriptdeck::exec {

/**
 * @brief Push interface through which run events reach their consumer
 *
 * Events of different runs may be delivered concurrently from different
 * threads; implementations must be thread-safe.
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    virtual void onEvent(const OutputEvent& event) = 0;
};

/**
 * @brief Sink forwarding every event to a callable
 */
class CallbackSink : public IOutputSink {
public:
    using Callback = std::function<void(const OutputEvent&)>;

    explicit CallbackSink(Callback callback);

    void onEvent(const OutputEvent& event) override;

private:
    Callback callback_;
};

/**
 * @brief Blocking queue of events for pull-style consumers
 */
class EventQueue : public IOutputSink {
public:
    EventQueue() = default;

    void onEvent(const OutputEvent& event) override;

    /**
     * @brief Pop the oldest event, waiting up to timeout
     * @return The event, or nullopt on timeout
     */
    [[nodiscard]] auto next(std::chrono::milliseconds timeout)
        -> std::optional<OutputEvent>;

    /**
     * @brief Collect the events of one run up to and including its
     *        terminal event
     *
     * Events of other runs are left in the queue, in order. Once the
     * first event is taken, only events carrying its run serial belong
     * to the run, so a late end of an earlier run of the same script is
     * left behind.
     * @param scriptId Run to collect
     * @param timeout Upper bound for the whole collection
     * @return Events collected so far; the last one is terminal unless
     *         the timeout expired
     */
    [[nodiscard]] auto collectRun(const std::string& scriptId,
                                  std::chrono::milliseconds timeout)
        -> std::vector<OutputEvent>;

    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutputEvent> events_;
};

/**
 * @brief Ordered, non-restartable event sequence of a single run
 *
 * Enforces the run event order: start first, output only while open,
 * at most one error, at most one end, nothing after the terminal event.
 * Out-of-order emissions are dropped. Emission is serialized, so stdout
 * and stderr readers may run on different threads.
 */
class OutputStream {
public:
    OutputStream(std::string scriptId, std::shared_ptr<IOutputSink> sink,
                 uint64_t runSerial = 0);

    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    bool emitStart(std::string commandLine);
    bool emitStdout(std::string_view chunk);
    bool emitStderr(std::string_view chunk);

    /**
     * @brief Emit an error event
     * @param message Failure description
     * @param final True when no end event will follow (spawn failures)
     */
    bool emitError(std::string message, bool final);

    bool emitEnd(std::optional<int> exitCode);

    [[nodiscard]] bool started() const;
    [[nodiscard]] bool finished() const;

    [[nodiscard]] auto scriptId() const -> const std::string& {
        return scriptId_;
    }

    [[nodiscard]] auto runSerial() const noexcept -> uint64_t {
        return runSerial_;
    }

private:
    enum class Phase { Fresh, Open, Closed };

    bool emitData(OutputEventKind kind, std::string_view chunk);
    void deliver(OutputEvent event);

    std::string scriptId_;
    std::shared_ptr<IOutputSink> sink_;
    uint64_t runSerial_{0};
    mutable std::mutex mutex_;
    Phase phase_{Phase::Fresh};
    bool errorEmitted_{false};
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_OUTPUT_CHANNEL_HPP
