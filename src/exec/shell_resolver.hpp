/*
 * shell_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_resolver.hpp
 * @brief Shell kind to executable resolution
 * @date 2024-1-13
 * @version 2.1.0
 *
 * Maps a requested shell kind to a concrete executable and argument
 * list for the host platform. On Windows, bash/sh requests go through
 * an ordered chain of discovery probes (WSL, Git Bash, PATH scan).
 */

#ifndef SCRIPTDECK_EXEC_SHELL_RESOLVER_HPP
#define SCRIPTDECK_EXEC_SHELL_RESOLVER_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "types.hpp"

namespace scriptdeck::exec {

/**
 * @brief Environment values consulted during resolution
 */
struct ShellEnvironment {
    std::string systemRoot{"C:\\Windows"};  ///< SYSTEMROOT
    std::string pathVariable;               ///< PATH

    /**
     * @brief Capture SYSTEMROOT and PATH from the current process
     */
    [[nodiscard]] static auto fromProcess() -> ShellEnvironment;
};

/**
 * @brief Probe a single file at a fixed location
 */
struct WellKnownPathProbe {
    std::string label;       ///< Diagnostic name, becomes ShellPlan::platformNote
    std::string path;        ///< File whose existence signals a hit
    std::string executable;  ///< Command to launch on a hit
    std::vector<std::string> argsPrefix;
};

/**
 * @brief Probe every directory of a PATH-style list for a file name
 */
struct PathScanProbe {
    std::string label;
    std::string pathList;
    char separator{';'};
    std::string fileName;
    std::vector<std::string> argsPrefix;
};

using ShellProbe = std::variant<WellKnownPathProbe, PathScanProbe>;

/**
 * @brief First successful probe of a discovery chain
 */
struct DiscoveredShell {
    std::string label;
    std::string executable;
    std::vector<std::string> argsPrefix;
};

/// Guidance returned when no bash environment exists on Windows
inline constexpr std::string_view kNoBashGuidance =
    "No Bash environment detected. Install WSL "
    "(https://learn.microsoft.com/windows/wsl/install) or Git for Windows "
    "to enable bash scripts.";

/**
 * @brief Resolves shell kinds into executable plans
 *
 * Resolution never spawns anything; its only side effects are file
 * existence checks, which go through an injectable predicate.
 */
class ShellResolver {
public:
    using FileExists = std::function<bool(const std::string&)>;

    /**
     * @brief Construct a resolver
     * @param exists File existence predicate (defaults to the real filesystem)
     * @param gitBashCandidates Git Bash install paths, highest priority first
     */
    explicit ShellResolver(FileExists exists = {},
                           std::vector<std::string> gitBashCandidates = {});

    /**
     * @brief Resolve the plan for running content with a shell kind
     * @param kind Requested shell
     * @param platform Host platform family
     * @param env Environment values used by discovery
     * @param content Script content passed to the shell
     * @return Shell plan, or UnresolvedShell
     */
    [[nodiscard]] auto resolve(ShellKind kind, Platform platform,
                               const ShellEnvironment& env,
                               std::string_view content) const
        -> Result<ShellPlan>;

    /**
     * @brief Build the ordered bash discovery chain for Windows
     */
    [[nodiscard]] auto bashProbes(const ShellEnvironment& env) const
        -> std::vector<ShellProbe>;

    /**
     * @brief Evaluate probes in order, returning the first hit
     */
    [[nodiscard]] auto discover(const std::vector<ShellProbe>& probes) const
        -> std::optional<DiscoveredShell>;

    [[nodiscard]] auto gitBashCandidates() const
        -> const std::vector<std::string>& {
        return gitBashCandidates_;
    }

    [[nodiscard]] static auto defaultGitBashCandidates()
        -> std::vector<std::string>;

private:
    [[nodiscard]] auto probe(const WellKnownPathProbe& known) const
        -> std::optional<DiscoveredShell>;
    [[nodiscard]] auto probe(const PathScanProbe& scan) const
        -> std::optional<DiscoveredShell>;

    FileExists exists_;
    std::vector<std::string> gitBashCandidates_;
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_SHELL_RESOLVER_HPP
