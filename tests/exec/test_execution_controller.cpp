/*
 * test_execution_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_execution_controller.cpp
 * @brief Tests for running stored scripts by id
 */

#include <gtest/gtest.h>
#include "exec/execution_controller.hpp"
#include "store/memory_repository.hpp"

#include <filesystem>

using namespace scriptdeck;
using namespace scriptdeck::exec;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class ExecutionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<store::MemoryScriptRepository>();
        queue_ = std::make_shared<EventQueue>();
    }

    auto makeController(Platform platform,
                        ShellResolver resolver = ShellResolver{})
        -> std::unique_ptr<ExecutionController> {
        SupervisorOptions options;
        options.workingDirectory = std::filesystem::temp_directory_path();
        return std::make_unique<ExecutionController>(
            repository_, queue_, std::move(resolver), ShellEnvironment{},
            options, platform);
    }

    void addScript(const std::string& id, std::optional<ShellKind> shell,
                   const std::string& content) {
        store::ScriptRecord record;
        record.id = id;
        record.name = id;
        record.shell = shell;
        record.content = content;
        repository_->put(record);
    }

    std::shared_ptr<store::MemoryScriptRepository> repository_;
    std::shared_ptr<EventQueue> queue_;
};

// =============================================================================
// Synchronous failures
// =============================================================================

TEST_F(ExecutionControllerTest, UnknownScriptIsNotFound) {
    auto controller = makeController(Platform::Posix);
    auto result = controller->run("missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExecutionError::NotFound);
    EXPECT_FALSE(queue_->next(20ms).has_value());
    EXPECT_EQ(controller->state("missing"), RunState::Idle);
}

TEST_F(ExecutionControllerTest, WindowsBashWithoutInstallIsUnresolved) {
    addScript("b", ShellKind::Bash, "echo A");
    auto controller = makeController(
        Platform::Windows,
        ShellResolver([](const std::string&) { return false; }));

    auto result = controller->run("b");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExecutionError::UnresolvedShell);
    EXPECT_EQ(result.error().message, std::string(kNoBashGuidance));
    EXPECT_FALSE(controller->isRunning("b"));
    EXPECT_FALSE(queue_->next(20ms).has_value());
}

TEST_F(ExecutionControllerTest, PosixPowerShellIsUnresolved) {
    addScript("ps", ShellKind::PowerShell, "Get-Date");
    auto controller = makeController(Platform::Posix);
    auto result = controller->run("ps");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ExecutionError::UnresolvedShell);
}

// =============================================================================
// Plans
// =============================================================================

TEST_F(ExecutionControllerTest, MissingShellUsesPlatformDefault) {
    store::ScriptRecord record;
    record.id = "d";
    record.content = "echo A";

    auto posix = makeController(Platform::Posix);
    auto plan = posix->resolvePlan(record);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->executable, "bash");

    auto windows = makeController(Platform::Windows);
    auto winPlan = windows->resolvePlan(record);
    ASSERT_TRUE(winPlan.has_value());
    EXPECT_EQ(winPlan->executable, "powershell.exe");
}

#ifndef _WIN32

// =============================================================================
// Runs
// =============================================================================

TEST_F(ExecutionControllerTest, RunStreamsEvents) {
    addScript("hello", ShellKind::Sh, "echo A");
    auto controller = makeController(Platform::Posix);

    auto handle = controller->run("hello");
    ASSERT_TRUE(handle.has_value());

    auto events = queue_->collectRun("hello", 10s);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().kind, OutputEventKind::Start);
    EXPECT_EQ(events[1].kind, OutputEventKind::Stdout);
    EXPECT_EQ(events[1].payload, "A\n");
    EXPECT_EQ(events.back().exitCode, 0);
}

TEST_F(ExecutionControllerTest, DuplicateRunIsRejected) {
    addScript("long", ShellKind::Bash, "sleep 30");
    auto controller = makeController(Platform::Posix);

    ASSERT_TRUE(controller->run("long").has_value());
    EXPECT_EQ(controller->state("long"), RunState::Running);

    auto second = controller->run("long");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ExecutionError::AlreadyRunning);

    EXPECT_TRUE(controller->stop("long"));
    EXPECT_TRUE(controller->waitForIdle("long", 10s));
}

TEST_F(ExecutionControllerTest, StopThenRunAgain) {
    addScript("s", ShellKind::Bash, "sleep 30");
    auto controller = makeController(Platform::Posix);

    ASSERT_TRUE(controller->run("s").has_value());
    EXPECT_TRUE(controller->stop("s"));

    auto events = queue_->collectRun("s", 10s);
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(events.back().isTerminal());
    EXPECT_EQ(controller->state("s"), RunState::Idle);

    EXPECT_TRUE(controller->run("s").has_value());
    EXPECT_EQ(controller->stopAll(), 1u);
    EXPECT_TRUE(controller->waitForIdle("s", 10s));
    EXPECT_TRUE(controller->runningScripts().empty());
}

TEST_F(ExecutionControllerTest, StopWhenIdleReturnsFalse) {
    addScript("idle", ShellKind::Bash, "true");
    auto controller = makeController(Platform::Posix);
    EXPECT_FALSE(controller->stop("idle"));
    EXPECT_FALSE(queue_->next(20ms).has_value());
}

#endif  // _WIN32
