/*
 * command_line.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file command_line.hpp
 * @brief Command line formatting and argument quoting helpers
 * @date 2024-1-13
 */

#ifndef SCRIPTDECK_EXEC_COMMAND_LINE_HPP
#define SCRIPTDECK_EXEC_COMMAND_LINE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace scriptdeck::exec {

/**
 * @brief Human-readable command line: executable and arguments joined
 *        by single spaces, without quoting
 */
[[nodiscard]] auto formatCommandLine(const ShellPlan& plan) -> std::string;

/**
 * @brief Wrap content in single quotes for `bash -lc`
 *
 * Embedded single quotes become '\''. Anything beyond that (NUL bytes,
 * nested quoting through wsl.exe) is not guaranteed to survive.
 */
[[nodiscard]] auto quoteForPosixShell(std::string_view content)
    -> std::string;

/**
 * @brief Quote one argument following the MSVCRT parsing rules
 */
[[nodiscard]] auto quoteWindowsArgument(std::string_view arg) -> std::string;

/**
 * @brief Build the CreateProcess command line for an executable and its
 *        arguments
 */
[[nodiscard]] auto buildWindowsCommandLine(
    std::string_view executable, const std::vector<std::string>& argv)
    -> std::string;

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_COMMAND_LINE_HPP
