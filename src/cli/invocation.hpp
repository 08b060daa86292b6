/*
 * invocation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Command line of the scriptdeck host

**************************************************/

#ifndef SCRIPTDECK_CLI_INVOCATION_HPP
#define SCRIPTDECK_CLI_INVOCATION_HPP

#include <expected>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace atom::utils {
class ArgumentParser;
}

namespace scriptdeck::cli {

/**
 * @brief A parsed `scriptdeck <command> [operand] [options]` line
 *
 * The command word and its single operand are positional. Everything
 * after them is handed to atom's ArgumentParser.
 */
class Invocation {
public:
    /**
     * @brief Parse a full argv, program name included
     * @return The invocation, or a message describing the bad input.
     *         `help`, `--help` and `-h` parse to the `help` command.
     */
    [[nodiscard]] static auto parse(const std::vector<std::string>& args)
        -> std::expected<Invocation, std::string>;

    [[nodiscard]] auto command() const -> const std::string& {
        return command_;
    }

    [[nodiscard]] auto operand() const -> const std::optional<std::string>& {
        return operand_;
    }

    /// Value of a `--name <value>` option, empty when not given
    [[nodiscard]] auto option(const std::string& name) const
        -> std::optional<std::string>;

    [[nodiscard]] bool flag(const std::string& name) const;

private:
    Invocation() = default;

    std::string command_;
    std::optional<std::string> operand_;
    std::shared_ptr<atom::utils::ArgumentParser> options_;
};

void printUsage(std::ostream& out);

}  // namespace scriptdeck::cli

#endif  // SCRIPTDECK_CLI_INVOCATION_HPP
