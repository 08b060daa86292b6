/*
 * invocation.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "invocation.hpp"

#include <any>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

namespace scriptdeck::cli {

using namespace std::string_literals;

namespace {

auto makeParser() -> std::shared_ptr<atom::utils::ArgumentParser> {
    using ArgType = atom::utils::ArgumentParser::ArgType;

    auto program =
        std::make_shared<atom::utils::ArgumentParser>("scriptdeck"s);
    program->addArgument("config", ArgType::STRING, false, {},
                         "Path to the config file", {"c"});
    program->addFlag("verbose", "Enable debug logging", {"v"});
    program->addArgument("id", ArgType::STRING, false, {},
                         "Script id to create or update");
    program->addArgument("name", ArgType::STRING, false, {}, "Script name");
    program->addArgument("shell", ArgType::STRING, false, {},
                         "Shell kind (bash/sh/powershell/cmd)");
    program->addArgument("file", ArgType::STRING, false, {},
                         "Read the script content from a file");
    program->addArgument("content", ArgType::STRING, false, {},
                         "Script content");
    program->addFlag("json", "Print run events as JSON lines");

    program->addDescription("scriptdeck: run stored shell scripts");
    return program;
}

}  // namespace

auto Invocation::parse(const std::vector<std::string>& args)
    -> std::expected<Invocation, std::string> {
    if (args.size() < 2) {
        return std::unexpected("missing command"s);
    }

    Invocation invocation;
    invocation.command_ = args[1];
    if (invocation.command_ == "--help" || invocation.command_ == "-h") {
        invocation.command_ = "help";
    }
    size_t optionsBegin = 2;
    if (args.size() > 2 && !args[2].starts_with("-")) {
        invocation.operand_ = args[2];
        optionsBegin = 3;
    }

    std::vector<std::string> optionArgs{args.front()};
    optionArgs.insert(optionArgs.end(), args.begin() + optionsBegin,
                      args.end());

    invocation.options_ = makeParser();
    try {
        invocation.options_->parse(static_cast<int>(optionArgs.size()),
                                   optionArgs);
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return invocation;
}

auto Invocation::option(const std::string& name) const
    -> std::optional<std::string> {
    try {
        return options_->get<std::string>(name);
    } catch (const std::bad_any_cast& e) {
        spdlog::warn("Option --{} has an unexpected type: {}", name,
                     e.what());
        return std::nullopt;
    }
}

bool Invocation::flag(const std::string& name) const {
    return options_->getFlag(name);
}

void printUsage(std::ostream& out) {
    out << "Usage: scriptdeck <command> [operand] [options]\n"
           "\n"
           "Commands:\n"
           "  list                          List saved scripts\n"
           "  show <id>                     Print a script record\n"
           "  save --name <n> [--shell <k>] (--file <f> | --content <c>) "
           "[--id <id>]\n"
           "                                Create or update a script\n"
           "  delete <id>                   Delete a script\n"
           "  run <id> [--json]             Run a script, Ctrl-C stops it\n"
           "  resolve <shell> [--content <c>]\n"
           "                                Print the command a shell kind "
           "resolves to\n"
           "\n"
           "Options:\n"
           "  -c, --config <file>           Configuration file\n"
           "  -v, --verbose                 Debug logging\n";
}

}  // namespace scriptdeck::cli
