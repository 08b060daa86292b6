/*
 * test_command_line.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "exec/command_line.hpp"

using namespace scriptdeck::exec;

// =============================================================================
// POSIX single quoting
// =============================================================================

TEST(CommandLineTest, PosixQuoteWrapsContent) {
    EXPECT_EQ(quoteForPosixShell("echo A"), "'echo A'");
    EXPECT_EQ(quoteForPosixShell(""), "''");
}

TEST(CommandLineTest, PosixQuoteEscapesSingleQuotes) {
    EXPECT_EQ(quoteForPosixShell("echo 'hi'"), "'echo '\\''hi'\\'''");
}

TEST(CommandLineTest, PosixQuoteKeepsOtherMetacharacters) {
    EXPECT_EQ(quoteForPosixShell("a && $HOME | \"x\""),
              "'a && $HOME | \"x\"'");
}

// =============================================================================
// Windows argument quoting
// =============================================================================

TEST(CommandLineTest, WindowsPlainArgumentUnchanged) {
    EXPECT_EQ(quoteWindowsArgument("/d"), "/d");
    EXPECT_EQ(quoteWindowsArgument("C:\\tools\\bash.exe"),
              "C:\\tools\\bash.exe");
}

TEST(CommandLineTest, WindowsEmptyArgumentIsQuoted) {
    EXPECT_EQ(quoteWindowsArgument(""), "\"\"");
}

TEST(CommandLineTest, WindowsArgumentWithSpacesIsQuoted) {
    EXPECT_EQ(quoteWindowsArgument("echo A"), "\"echo A\"");
}

TEST(CommandLineTest, WindowsEmbeddedQuoteIsEscaped) {
    EXPECT_EQ(quoteWindowsArgument("say \"hi\""), "\"say \\\"hi\\\"\"");
}

TEST(CommandLineTest, WindowsTrailingBackslashesAreDoubled) {
    EXPECT_EQ(quoteWindowsArgument("C:\\Program Files\\"),
              "\"C:\\Program Files\\\\\"");
}

TEST(CommandLineTest, WindowsCommandLineJoinsArguments) {
    auto line = buildWindowsCommandLine(
        "C:\\Program Files\\Git\\bin\\bash.exe", {"-lc", "'echo A'"});
    EXPECT_EQ(line,
              "\"C:\\Program Files\\Git\\bin\\bash.exe\" -lc \"'echo A'\"");
}

// =============================================================================
// Display form
// =============================================================================

TEST(CommandLineTest, FormatJoinsWithSpaces) {
    ShellPlan plan{"bash", {"-c", "echo A"}, std::nullopt};
    EXPECT_EQ(formatCommandLine(plan), "bash -c echo A");
}
