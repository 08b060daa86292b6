/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "exec/types.hpp"

using namespace scriptdeck::exec;

TEST(ExecTypesTest, ShellKindNamesRoundTrip) {
    for (auto kind : {ShellKind::PowerShell, ShellKind::Cmd, ShellKind::Bash,
                      ShellKind::Sh}) {
        auto parsed = shellKindFromString(shellKindToString(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
}

TEST(ExecTypesTest, ShellKindParsingIsCaseInsensitive) {
    EXPECT_EQ(shellKindFromString("PowerShell"), ShellKind::PowerShell);
    EXPECT_EQ(shellKindFromString("BASH"), ShellKind::Bash);
    EXPECT_FALSE(shellKindFromString("zsh").has_value());
    EXPECT_FALSE(shellKindFromString("").has_value());
}

TEST(ExecTypesTest, DefaultShellFollowsPlatform) {
    EXPECT_EQ(defaultShellKind(Platform::Windows), ShellKind::PowerShell);
    EXPECT_EQ(defaultShellKind(Platform::Posix), ShellKind::Bash);
}

TEST(ExecTypesTest, FailureDescriptionIncludesLabel) {
    ExecutionFailure failure{ExecutionError::NotFound, "abc"};
    auto text = failure.describe();
    EXPECT_NE(text.find(executionErrorToString(ExecutionError::NotFound)),
              std::string::npos);
    EXPECT_NE(text.find("abc"), std::string::npos);
}

TEST(ExecTypesTest, OnlyEndAndFinalErrorAreTerminal) {
    OutputEvent start{OutputEventKind::Start, "s", "cmd", std::nullopt, false};
    OutputEvent error{OutputEventKind::Error, "s", "boom", std::nullopt, false};
    OutputEvent finalError{OutputEventKind::Error, "s", "boom", std::nullopt,
                           true};
    OutputEvent end{OutputEventKind::End, "s", {}, 0, false};

    EXPECT_FALSE(start.isTerminal());
    EXPECT_FALSE(error.isTerminal());
    EXPECT_TRUE(finalError.isTerminal());
    EXPECT_TRUE(end.isTerminal());
}

TEST(ExecTypesTest, EventJsonShape) {
    OutputEvent out{OutputEventKind::Stdout, "s1", "hi\n", std::nullopt,
                    false};
    auto j = out.toJson();
    EXPECT_EQ(j["id"], "s1");
    EXPECT_EQ(j["type"], "stdout");
    EXPECT_EQ(j["message"], "hi\n");

    OutputEvent killed{OutputEventKind::End, "s1", {}, std::nullopt, false};
    auto k = killed.toJson();
    EXPECT_EQ(k["type"], "end");
    EXPECT_TRUE(k["code"].is_null());
    EXPECT_FALSE(k.contains("message"));

    OutputEvent exited{OutputEventKind::End, "s1", {}, 3, false};
    EXPECT_EQ(exited.toJson()["code"], 3);
}
