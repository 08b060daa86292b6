/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: scriptdeck command line host

**************************************************/

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>


#include "cli/invocation.hpp"
#include "config/runner_config.hpp"
#include "exec/command_line.hpp"
#include "exec/execution_controller.hpp"
#include "logging/log_setup.hpp"
#include "store/json_file_store.hpp"

namespace fs = std::filesystem;
using namespace scriptdeck;

namespace {

std::atomic<bool> gInterrupted{false};

void onInterrupt(int) { gInterrupted.store(true); }

auto shellLabel(const std::optional<exec::ShellKind>& shell) -> std::string {
    return shell ? std::string(exec::shellKindToString(*shell))
                 : std::string("default");
}

int listScripts(const store::JsonFileScriptStore& store) {
    auto scripts = store.list();
    if (scripts.empty()) {
        std::cout << "No scripts in " << store.directory().string() << '\n';
        return 0;
    }
    for (const auto& script : scripts) {
        std::cout << script.id << "  [" << shellLabel(script.shell) << "]  "
                  << script.name << '\n';
    }
    return 0;
}

int showScript(store::JsonFileScriptStore& store,
               const cli::Invocation& args) {
    if (!args.operand()) {
        std::cerr << "show: missing script id\n";
        return 2;
    }
    auto record = store.get(*args.operand());
    if (!record) {
        std::cerr << "Script not found: " << *args.operand() << '\n';
        return 1;
    }
    std::cout << record->toJson().dump(2) << '\n';
    return 0;
}

int saveScript(store::JsonFileScriptStore& store,
               const cli::Invocation& args) {
    store::ScriptDraft draft;
    draft.id = args.option("id");
    draft.name = args.option("name").value_or("");

    if (auto shell = args.option("shell")) {
        draft.shell = exec::shellKindFromString(*shell);
        if (!draft.shell) {
            std::cerr << "Unknown shell: " << *shell << '\n';
            return 2;
        }
    }

    if (auto file = args.option("file")) {
        std::ifstream in(*file, std::ios::binary);
        if (!in) {
            std::cerr << "Cannot read " << *file << '\n';
            return 1;
        }
        std::ostringstream content;
        content << in.rdbuf();
        draft.content = content.str();
    } else if (auto content = args.option("content")) {
        draft.content = *content;
    } else {
        std::cerr << "save: one of --file or --content is required\n";
        return 2;
    }

    auto saved = store.save(draft);
    if (!saved) {
        std::cerr << store::storeErrorToString(saved.error().code) << ": "
                  << saved.error().message << '\n';
        return 1;
    }
    std::cout << saved->id << '\n';
    return 0;
}

int deleteScript(store::JsonFileScriptStore& store,
                 const cli::Invocation& args) {
    if (!args.operand()) {
        std::cerr << "delete: missing script id\n";
        return 2;
    }
    if (!store.remove(*args.operand())) {
        std::cerr << "Script not found: " << *args.operand() << '\n';
        return 1;
    }
    return 0;
}

int resolveShell(const exec::ShellResolver& resolver,
                 const cli::Invocation& args) {
    if (!args.operand()) {
        std::cerr << "resolve: missing shell kind\n";
        return 2;
    }
    auto kind = exec::shellKindFromString(*args.operand());
    if (!kind) {
        std::cerr << "Unknown shell: " << *args.operand() << '\n';
        return 2;
    }
    auto plan = resolver.resolve(*kind, exec::currentPlatform(),
                                 exec::ShellEnvironment::fromProcess(),
                                 args.option("content").value_or("echo A"));
    if (!plan) {
        std::cerr << plan.error().describe() << '\n';
        return 1;
    }
    nlohmann::json j = {{"executable", plan->executable},
                        {"argv", plan->argv},
                        {"commandLine", exec::formatCommandLine(*plan)}};
    j["platformNote"] = plan->platformNote ? nlohmann::json(*plan->platformNote)
                                           : nlohmann::json(nullptr);
    std::cout << j.dump(2) << '\n';
    return 0;
}

// Exit status mirrors the script; a killed run reports 130 like a shell
int runScript(const std::shared_ptr<store::JsonFileScriptStore>& store,
              const config::RunnerConfig& config,
              const cli::Invocation& args) {
    if (!args.operand()) {
        std::cerr << "run: missing script id\n";
        return 2;
    }
    const auto& scriptId = *args.operand();
    bool asJson = args.flag("json");

    exec::SupervisorOptions options;
    options.workingDirectory = config.workingDirectory;
    options.killProcessGroup = config.killProcessGroup;
    options.readBufferSize = config.readBufferSize;

    auto queue = std::make_shared<exec::EventQueue>();
    exec::ExecutionController controller(
        store, queue,
        exec::ShellResolver({}, config.gitBashCandidates),
        exec::ShellEnvironment::fromProcess(), options);

    auto handle = controller.run(scriptId);
    if (!handle) {
        std::cerr << handle.error().describe() << '\n';
        return 1;
    }

    std::signal(SIGINT, onInterrupt);
    bool stopSent = false;
    int status = 1;
    while (true) {
        if (gInterrupted.load() && !stopSent) {
            stopSent = controller.stop(scriptId);
        }
        auto event = queue->next(std::chrono::milliseconds(100));
        if (!event) {
            continue;
        }

        if (asJson) {
            std::cout << event->toJson().dump() << std::endl;
        } else {
            switch (event->kind) {
                case exec::OutputEventKind::Stdout:
                    std::cout << event->payload << std::flush;
                    break;
                case exec::OutputEventKind::Stderr:
                    std::cerr << event->payload << std::flush;
                    break;
                case exec::OutputEventKind::Start:
                case exec::OutputEventKind::Error:
                    std::cerr << event->payload << std::endl;
                    break;
                case exec::OutputEventKind::End:
                    break;
            }
        }

        if (event->isTerminal()) {
            if (event->kind == exec::OutputEventKind::End) {
                status = event->exitCode.value_or(130);
            }
            break;
        }
    }
    std::signal(SIGINT, SIG_DFL);
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    auto parsed = cli::Invocation::parse(args);
    if (!parsed) {
        std::cerr << "Invalid arguments: " << parsed.error() << "\n\n";
        cli::printUsage(std::cerr);
        return 2;
    }
    const auto& invocation = *parsed;
    const auto& command = invocation.command();
    if (command == "help") {
        cli::printUsage(std::cout);
        return 0;
    }

    auto configPath = invocation.option("config");
    auto loaded = config::loadRunnerConfig(
        configPath ? fs::path(*configPath) : config::defaultConfigPath());
    if (!loaded) {
        std::cerr << "Failed to load configuration: " << loaded.error()
                  << '\n';
        return 1;
    }
    auto config = std::move(*loaded);
    if (invocation.flag("verbose")) {
        config.logging.level = "debug";
    }
    logging::setupLogging(config.logging);

    auto scripts = std::make_shared<store::JsonFileScriptStore>(
        config.effectiveStoreDirectory());
    spdlog::debug("Script store: {}", scripts->directory().string());

    int status = 2;
    if (command == "list") {
        status = listScripts(*scripts);
    } else if (command == "show") {
        status = showScript(*scripts, invocation);
    } else if (command == "save") {
        status = saveScript(*scripts, invocation);
    } else if (command == "delete") {
        status = deleteScript(*scripts, invocation);
    } else if (command == "run") {
        status = runScript(scripts, config, invocation);
    } else if (command == "resolve") {
        status = resolveShell(
            exec::ShellResolver({}, config.gitBashCandidates), invocation);
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        cli::printUsage(std::cerr);
    }

    spdlog::shutdown();
    return status;
}
