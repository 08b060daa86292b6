/*
 * shell_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_resolver.cpp
 * @brief Shell kind to executable resolution
 * @date 2024-1-13
 */

#include "shell_resolver.hpp"
#include "command_line.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace scriptdeck::exec {

namespace {

auto joinWindowsPath(std::string_view dir, std::string_view name)
    -> std::string {
    std::string joined(dir);
    if (!joined.empty() && joined.back() != '\\' && joined.back() != '/') {
        joined += '\\';
    }
    joined += name;
    return joined;
}

bool fileExistsOnDisk(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

auto ShellEnvironment::fromProcess() -> ShellEnvironment {
    ShellEnvironment env;
    if (const char* root = std::getenv("SYSTEMROOT"); root && *root) {
        env.systemRoot = root;
    }
    if (const char* path = std::getenv("PATH"); path) {
        env.pathVariable = path;
    }
    return env;
}

ShellResolver::ShellResolver(FileExists exists,
                             std::vector<std::string> gitBashCandidates)
    : exists_(exists ? std::move(exists) : FileExists(fileExistsOnDisk)),
      gitBashCandidates_(gitBashCandidates.empty()
                             ? defaultGitBashCandidates()
                             : std::move(gitBashCandidates)) {}

auto ShellResolver::defaultGitBashCandidates() -> std::vector<std::string> {
    return {"C:\\Program Files\\Git\\bin\\bash.exe",
            "C:\\Program Files (x86)\\Git\\bin\\bash.exe"};
}

auto ShellResolver::resolve(ShellKind kind, Platform platform,
                            const ShellEnvironment& env,
                            std::string_view content) const
    -> Result<ShellPlan> {
    ShellPlan plan;

    if (platform == Platform::Posix) {
        switch (kind) {
            case ShellKind::Bash:
                plan.executable = "bash";
                break;
            case ShellKind::Sh:
                plan.executable = "sh";
                break;
            case ShellKind::PowerShell:
            case ShellKind::Cmd:
                spdlog::debug("ShellResolver: '{}' is not available on {}",
                              shellKindToString(kind),
                              platformToString(platform));
                return makeFailure(
                    ExecutionError::UnresolvedShell,
                    std::string(shellKindToString(kind)) +
                        " scripts can only run on Windows");
        }
        plan.argv = {"-c", std::string(content)};
        spdlog::debug("ShellResolver: {} -> {}", shellKindToString(kind),
                      plan.executable);
        return plan;
    }

    switch (kind) {
        case ShellKind::Cmd:
            plan.executable = "cmd.exe";
            plan.argv = {"/d", "/c", std::string(content)};
            break;
        case ShellKind::PowerShell:
            plan.executable = "powershell.exe";
            plan.argv = {"-NoLogo",  "-NoProfile", "-ExecutionPolicy",
                         "Bypass",   "-Command",   std::string(content)};
            break;
        case ShellKind::Bash:
        case ShellKind::Sh: {
            auto found = discover(bashProbes(env));
            if (!found) {
                spdlog::warn("ShellResolver: no bash environment found");
                return makeFailure(ExecutionError::UnresolvedShell,
                                   std::string(kNoBashGuidance));
            }
            plan.executable = found->executable;
            plan.argv = found->argsPrefix;
            plan.argv.push_back(quoteForPosixShell(content));
            plan.platformNote = found->label;
            break;
        }
    }

    spdlog::debug("ShellResolver: {} -> {}{}", shellKindToString(kind),
                  plan.executable,
                  plan.platformNote ? " (" + *plan.platformNote + ")" : "");
    return plan;
}

auto ShellResolver::bashProbes(const ShellEnvironment& env) const
    -> std::vector<ShellProbe> {
    std::vector<ShellProbe> probes;

    probes.emplace_back(WellKnownPathProbe{
        "wsl", joinWindowsPath(joinWindowsPath(env.systemRoot, "System32"),
                               "wsl.exe"),
        "wsl.exe", {"bash", "-lc"}});

    for (const auto& candidate : gitBashCandidates_) {
        probes.emplace_back(
            WellKnownPathProbe{"git-bash", candidate, candidate, {"-lc"}});
    }

    probes.emplace_back(
        PathScanProbe{"path-bash", env.pathVariable, ';', "bash.exe", {"-lc"}});
    return probes;
}

auto ShellResolver::discover(const std::vector<ShellProbe>& probes) const
    -> std::optional<DiscoveredShell> {
    for (const auto& candidate : probes) {
        auto hit = std::visit([this](const auto& p) { return probe(p); },
                              candidate);
        if (hit) {
            return hit;
        }
    }
    return std::nullopt;
}

auto ShellResolver::probe(const WellKnownPathProbe& known) const
    -> std::optional<DiscoveredShell> {
    if (!exists_(known.path)) {
        spdlog::trace("ShellResolver: {} not found at {}", known.label,
                      known.path);
        return std::nullopt;
    }
    spdlog::trace("ShellResolver: {} found at {}", known.label, known.path);
    return DiscoveredShell{known.label, known.executable, known.argsPrefix};
}

auto ShellResolver::probe(const PathScanProbe& scan) const
    -> std::optional<DiscoveredShell> {
    std::string_view rest = scan.pathList;
    while (!rest.empty()) {
        auto pos = rest.find(scan.separator);
        auto dir = rest.substr(0, pos);
        rest = pos == std::string_view::npos ? std::string_view{}
                                             : rest.substr(pos + 1);
        if (dir.empty()) {
            continue;
        }

        auto candidate = joinWindowsPath(dir, scan.fileName);
        if (exists_(candidate)) {
            spdlog::trace("ShellResolver: {} found at {}", scan.label,
                          candidate);
            return DiscoveredShell{scan.label, candidate, scan.argsPrefix};
        }
    }
    spdlog::trace("ShellResolver: {} not found on PATH", scan.fileName);
    return std::nullopt;
}

}  // namespace scriptdeck::exec
