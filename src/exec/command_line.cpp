/*
 * command_line.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_line.hpp"

namespace scriptdeck::exec {

auto formatCommandLine(const ShellPlan& plan) -> std::string {
    std::string line = plan.executable;
    for (const auto& arg : plan.argv) {
        line += ' ';
        line += arg;
    }
    return line;
}

auto quoteForPosixShell(std::string_view content) -> std::string {
    std::string quoted;
    quoted.reserve(content.size() + 2);
    quoted += '\'';
    for (char c : content) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

auto quoteWindowsArgument(std::string_view arg) -> std::string {
    if (!arg.empty() &&
        arg.find_first_of(" \t\n\v\"") == std::string_view::npos) {
        return std::string(arg);
    }

    std::string quoted;
    quoted += '"';
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            // Backslashes before a quote are doubled, plus one to escape it
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted += c;
    }
    // Trailing backslashes precede the closing quote
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

auto buildWindowsCommandLine(std::string_view executable,
                             const std::vector<std::string>& argv)
    -> std::string {
    std::string line = quoteWindowsArgument(executable);
    for (const auto& arg : argv) {
        line += ' ';
        line += quoteWindowsArgument(arg);
    }
    return line;
}

}  // namespace scriptdeck::exec
