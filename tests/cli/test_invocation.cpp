/*
 * test_invocation.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_invocation.cpp
 * @brief Tests for scriptdeck command line parsing
 */

#include <gtest/gtest.h>
#include "cli/invocation.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace scriptdeck::cli;

// =============================================================================
// Test Fixture
// =============================================================================

class InvocationTest : public ::testing::Test {
protected:
    static auto parse(std::vector<std::string> words)
        -> std::expected<Invocation, std::string> {
        words.insert(words.begin(), "scriptdeck");
        return Invocation::parse(words);
    }
};

// =============================================================================
// Commands and operands
// =============================================================================

TEST_F(InvocationTest, RunWithOperandAndFlag) {
    auto invocation = parse({"run", "abc123", "--json"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->command(), "run");
    EXPECT_EQ(invocation->operand(), "abc123");
    EXPECT_TRUE(invocation->flag("json"));
    EXPECT_FALSE(invocation->flag("verbose"));
}

TEST_F(InvocationTest, ListTakesNoOperand) {
    auto invocation = parse({"list"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->command(), "list");
    EXPECT_FALSE(invocation->operand().has_value());
    EXPECT_FALSE(invocation->option("config").has_value());
}

TEST_F(InvocationTest, OptionsWithoutOperand) {
    auto invocation =
        parse({"save", "--name", "Backup", "--content", "echo A"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->command(), "save");
    EXPECT_FALSE(invocation->operand().has_value());
    EXPECT_EQ(invocation->option("name"), "Backup");
    EXPECT_EQ(invocation->option("content"), "echo A");
    EXPECT_FALSE(invocation->option("id").has_value());
    EXPECT_FALSE(invocation->option("file").has_value());
}

TEST_F(InvocationTest, OperandFollowedByOptions) {
    auto invocation = parse({"resolve", "bash", "--content", "ls -la"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->operand(), "bash");
    EXPECT_EQ(invocation->option("content"), "ls -la");
}

// =============================================================================
// Global options
// =============================================================================

TEST_F(InvocationTest, ConfigAndVerbose) {
    auto invocation =
        parse({"list", "--config", "/tmp/runner.json", "--verbose"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->option("config"), "/tmp/runner.json");
    EXPECT_TRUE(invocation->flag("verbose"));
}

TEST_F(InvocationTest, ShortAliases) {
    auto invocation = parse({"show", "abc", "-c", "runner.json", "-v"});
    ASSERT_TRUE(invocation.has_value()) << invocation.error();
    EXPECT_EQ(invocation->operand(), "abc");
    EXPECT_EQ(invocation->option("config"), "runner.json");
    EXPECT_TRUE(invocation->flag("verbose"));
}

// =============================================================================
// Help and errors
// =============================================================================

TEST_F(InvocationTest, MissingCommandIsAnError) {
    auto invocation = Invocation::parse({"scriptdeck"});
    ASSERT_FALSE(invocation.has_value());
    EXPECT_FALSE(invocation.error().empty());
}

TEST_F(InvocationTest, HelpSpellings) {
    for (const char* word : {"help", "--help", "-h"}) {
        auto invocation = parse({word});
        ASSERT_TRUE(invocation.has_value()) << word;
        EXPECT_EQ(invocation->command(), "help") << word;
    }
}

TEST_F(InvocationTest, UsageListsEveryCommand) {
    std::ostringstream out;
    printUsage(out);
    for (const char* command :
         {"list", "show", "save", "delete", "run", "resolve"}) {
        EXPECT_NE(out.str().find(command), std::string::npos) << command;
    }
}
