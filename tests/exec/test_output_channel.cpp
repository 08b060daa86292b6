/*
 * test_output_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_output_channel.cpp
 * @brief Tests for run event ordering and event sinks
 */

#include <gtest/gtest.h>
#include "exec/output_channel.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace scriptdeck::exec;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class OutputStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<CallbackSink>(
            [this](const OutputEvent& event) { events_.push_back(event); });
        stream_ = std::make_unique<OutputStream>("script-1", sink_);
    }

    auto kinds() const -> std::vector<OutputEventKind> {
        std::vector<OutputEventKind> result;
        for (const auto& e : events_) {
            result.push_back(e.kind);
        }
        return result;
    }

    std::vector<OutputEvent> events_;
    std::shared_ptr<CallbackSink> sink_;
    std::unique_ptr<OutputStream> stream_;
};

// =============================================================================
// Ordering
// =============================================================================

TEST_F(OutputStreamTest, NormalRunSequence) {
    EXPECT_TRUE(stream_->emitStart("bash -c echo A"));
    EXPECT_TRUE(stream_->emitStdout("A\n"));
    EXPECT_TRUE(stream_->emitStderr("warn\n"));
    EXPECT_TRUE(stream_->emitEnd(0));

    EXPECT_EQ(kinds(),
              (std::vector<OutputEventKind>{
                  OutputEventKind::Start, OutputEventKind::Stdout,
                  OutputEventKind::Stderr, OutputEventKind::End}));
    EXPECT_EQ(events_.front().payload, "bash -c echo A");
    EXPECT_EQ(events_.back().exitCode, 0);
    for (const auto& e : events_) {
        EXPECT_EQ(e.scriptId, "script-1");
    }
}

TEST_F(OutputStreamTest, NothingBeforeStart) {
    EXPECT_FALSE(stream_->emitStdout("early"));
    EXPECT_FALSE(stream_->emitEnd(0));
    EXPECT_FALSE(stream_->emitError("early", false));
    EXPECT_TRUE(events_.empty());
    EXPECT_FALSE(stream_->started());
}

TEST_F(OutputStreamTest, StartOnlyOnce) {
    EXPECT_TRUE(stream_->emitStart("a"));
    EXPECT_FALSE(stream_->emitStart("b"));
    EXPECT_EQ(events_.size(), 1u);
}

TEST_F(OutputStreamTest, NothingAfterEnd) {
    stream_->emitStart("a");
    stream_->emitEnd(std::nullopt);
    EXPECT_TRUE(stream_->finished());
    EXPECT_FALSE(stream_->emitStdout("late"));
    EXPECT_FALSE(stream_->emitEnd(1));
    EXPECT_FALSE(stream_->emitError("late", false));
    EXPECT_EQ(events_.size(), 2u);
    EXPECT_FALSE(events_.back().exitCode.has_value());
}

TEST_F(OutputStreamTest, FinalErrorClosesStream) {
    stream_->emitStart("missing-binary");
    EXPECT_TRUE(stream_->emitError("spawn failed", true));
    EXPECT_TRUE(stream_->finished());
    EXPECT_FALSE(stream_->emitEnd(1));

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_TRUE(events_.back().isTerminal());
}

TEST_F(OutputStreamTest, RuntimeErrorThenEnd) {
    stream_->emitStart("a");
    EXPECT_TRUE(stream_->emitError("read failed", false));
    EXPECT_FALSE(stream_->emitError("second", false));
    EXPECT_FALSE(stream_->finished());
    EXPECT_TRUE(stream_->emitEnd(1));

    EXPECT_EQ(kinds(),
              (std::vector<OutputEventKind>{OutputEventKind::Start,
                                            OutputEventKind::Error,
                                            OutputEventKind::End}));
}

TEST_F(OutputStreamTest, ThrowingSinkDoesNotBreakStream) {
    auto throwing = std::make_shared<CallbackSink>(
        [](const OutputEvent&) { throw std::runtime_error("consumer gone"); });
    OutputStream stream("s", throwing);
    EXPECT_TRUE(stream.emitStart("a"));
    EXPECT_TRUE(stream.emitEnd(0));
    EXPECT_TRUE(stream.finished());
}

TEST_F(OutputStreamTest, SinkThrowingNonStandardTypeIsContained) {
    auto throwing = std::make_shared<CallbackSink>(
        [](const OutputEvent&) { throw 42; });
    OutputStream stream("s", throwing);
    EXPECT_NO_THROW(stream.emitStart("a"));
    EXPECT_NO_THROW(stream.emitStdout("x"));
    EXPECT_TRUE(stream.emitEnd(0));
    EXPECT_TRUE(stream.finished());
}

TEST_F(OutputStreamTest, EventsCarryRunSerial) {
    OutputStream stream("script-1", sink_, 7);
    stream.emitStart("a");
    stream.emitStdout("x");
    stream.emitEnd(0);
    ASSERT_EQ(events_.size(), 3u);
    for (const auto& e : events_) {
        EXPECT_EQ(e.runSerial, 7u);
    }
    EXPECT_EQ(stream.runSerial(), 7u);
}

TEST_F(OutputStreamTest, ConcurrentWritersKeepPerStreamOrder) {
    stream_->emitStart("a");
    std::thread out([this] {
        for (int i = 0; i < 100; ++i) {
            stream_->emitStdout(std::to_string(i));
        }
    });
    std::thread err([this] {
        for (int i = 0; i < 100; ++i) {
            stream_->emitStderr(std::to_string(i));
        }
    });
    out.join();
    err.join();
    stream_->emitEnd(0);

    int nextOut = 0;
    int nextErr = 0;
    for (const auto& e : events_) {
        if (e.kind == OutputEventKind::Stdout) {
            EXPECT_EQ(e.payload, std::to_string(nextOut++));
        } else if (e.kind == OutputEventKind::Stderr) {
            EXPECT_EQ(e.payload, std::to_string(nextErr++));
        }
    }
    EXPECT_EQ(nextOut, 100);
    EXPECT_EQ(nextErr, 100);
    EXPECT_EQ(events_.back().kind, OutputEventKind::End);
}

// =============================================================================
// EventQueue
// =============================================================================

TEST(EventQueueTest, NextTimesOutWhenEmpty) {
    EventQueue queue;
    EXPECT_FALSE(queue.next(10ms).has_value());
}

TEST(EventQueueTest, CollectRunLeavesOtherRunsQueued) {
    auto queue = std::make_shared<EventQueue>();
    OutputStream a("a", queue);
    OutputStream b("b", queue);

    a.emitStart("x");
    b.emitStart("y");
    a.emitStdout("1");
    b.emitEnd(0);
    a.emitEnd(2);

    auto runA = queue->collectRun("a", 1s);
    ASSERT_EQ(runA.size(), 3u);
    EXPECT_EQ(runA.front().kind, OutputEventKind::Start);
    EXPECT_EQ(runA.back().exitCode, 2);

    EXPECT_EQ(queue->size(), 2u);
    auto first = queue->next(10ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->scriptId, "b");
    EXPECT_EQ(first->kind, OutputEventKind::Start);
}

TEST(EventQueueTest, CollectRunWaitsForProducer) {
    auto queue = std::make_shared<EventQueue>();
    std::thread producer([queue] {
        OutputStream stream("late", queue);
        stream.emitStart("x");
        std::this_thread::sleep_for(20ms);
        stream.emitEnd(0);
    });
    auto events = queue->collectRun("late", 5s);
    producer.join();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events.back().isTerminal());
}

TEST(EventQueueTest, CollectRunIgnoresLateEndOfEarlierRun) {
    auto queue = std::make_shared<EventQueue>();
    OutputStream first("same", queue, 1);
    OutputStream second("same", queue, 2);

    first.emitStart("old");
    auto earlier = queue->next(10ms);
    ASSERT_TRUE(earlier.has_value());

    // The earlier run ends only after the next run has started
    second.emitStart("new");
    first.emitEnd(std::nullopt);
    second.emitStdout("out");
    second.emitEnd(0);

    auto run = queue->collectRun("same", 1s);
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run.front().payload, "new");
    EXPECT_EQ(run.back().kind, OutputEventKind::End);
    EXPECT_EQ(run.back().exitCode, 0);
    for (const auto& e : run) {
        EXPECT_EQ(e.runSerial, 2u);
    }

    auto stale = queue->next(10ms);
    ASSERT_TRUE(stale.has_value());
    EXPECT_EQ(stale->runSerial, 1u);
    EXPECT_FALSE(stale->exitCode.has_value());
}
