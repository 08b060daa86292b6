/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Common type definitions for script execution
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef SCRIPTDECK_EXEC_TYPES_HPP
#define SCRIPTDECK_EXEC_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scriptdeck::exec {

/**
 * @brief Logical interpreter family requested by a script
 */
enum class ShellKind {
    PowerShell,  ///< Windows PowerShell
    Cmd,         ///< Windows command processor
    Bash,        ///< GNU Bash
    Sh           ///< POSIX sh
};

/**
 * @brief Host platform family used for shell resolution
 */
enum class Platform {
    Posix,   ///< Linux, macOS and other POSIX hosts
    Windows  ///< Windows (no native POSIX shell)
};

[[nodiscard]] constexpr std::string_view shellKindToString(
    ShellKind kind) noexcept {
    switch (kind) {
        case ShellKind::PowerShell: return "powershell";
        case ShellKind::Cmd: return "cmd";
        case ShellKind::Bash: return "bash";
        case ShellKind::Sh: return "sh";
    }
    return "bash";
}

/**
 * @brief Parse a shell kind name (case-insensitive)
 */
[[nodiscard]] auto shellKindFromString(std::string_view name)
    -> std::optional<ShellKind>;

[[nodiscard]] constexpr std::string_view platformToString(
    Platform platform) noexcept {
    switch (platform) {
        case Platform::Posix: return "posix";
        case Platform::Windows: return "windows";
    }
    return "posix";
}

/**
 * @brief Platform this binary was built for
 */
[[nodiscard]] constexpr Platform currentPlatform() noexcept {
#ifdef _WIN32
    return Platform::Windows;
#else
    return Platform::Posix;
#endif
}

/**
 * @brief Shell used when a record does not name one
 */
[[nodiscard]] constexpr ShellKind defaultShellKind(
    Platform platform = currentPlatform()) noexcept {
    return platform == Platform::Windows ? ShellKind::PowerShell
                                         : ShellKind::Bash;
}

/**
 * @brief Error codes for script execution
 */
enum class ExecutionError {
    NotFound,         ///< Unknown script id
    AlreadyRunning,   ///< Script already has a live run
    UnresolvedShell,  ///< No usable interpreter for the requested shell
    SpawnFailure,     ///< OS refused to create the process
    RuntimeIOError    ///< Stream fault after the process was spawned
};

[[nodiscard]] constexpr std::string_view executionErrorToString(
    ExecutionError error) noexcept {
    switch (error) {
        case ExecutionError::NotFound: return "Script not found";
        case ExecutionError::AlreadyRunning: return "Script already running";
        case ExecutionError::UnresolvedShell: return "Shell could not be resolved";
        case ExecutionError::SpawnFailure: return "Process spawn failed";
        case ExecutionError::RuntimeIOError: return "Runtime I/O error";
    }
    return "Unknown error";
}

/**
 * @brief Error value carried by failed operations
 */
struct ExecutionFailure {
    ExecutionError code;
    std::string message;  ///< Human-readable detail, may be empty

    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @brief Result type for execution operations
 */
template <typename T>
using Result = std::expected<T, ExecutionFailure>;

[[nodiscard]] inline auto makeFailure(ExecutionError code,
                                      std::string message = {})
    -> std::unexpected<ExecutionFailure> {
    return std::unexpected(ExecutionFailure{code, std::move(message)});
}

/**
 * @brief Concrete executable and arguments resolved for one run
 */
struct ShellPlan {
    std::string executable;                  ///< Command name or absolute path
    std::vector<std::string> argv;           ///< Arguments, script content included
    std::optional<std::string> platformNote; ///< e.g. "wsl", "git-bash"
};

/**
 * @brief Snapshot of a live run
 */
struct RunHandle {
    std::string scriptId;
    std::optional<int> pid;  ///< Empty until the child has been spawned
    std::chrono::system_clock::time_point startedAt;
    std::string commandLine;
    uint64_t serial{0};  ///< Distinguishes successive runs of one script
};

enum class OutputEventKind { Start, Stdout, Stderr, Error, End };

[[nodiscard]] constexpr std::string_view outputEventKindToString(
    OutputEventKind kind) noexcept {
    switch (kind) {
        case OutputEventKind::Start: return "start";
        case OutputEventKind::Stdout: return "stdout";
        case OutputEventKind::Stderr: return "stderr";
        case OutputEventKind::Error: return "error";
        case OutputEventKind::End: return "end";
    }
    return "error";
}

/**
 * @brief One event of a run's output stream
 *
 * `payload` holds the command line for Start, a raw chunk for
 * Stdout/Stderr and a message for Error. `exitCode` is only meaningful
 * for End and is empty when the process was killed.
 */
struct OutputEvent {
    OutputEventKind kind{OutputEventKind::Start};
    std::string scriptId;
    std::string payload;
    std::optional<int> exitCode;
    bool final{false};  ///< Set on an Error that no End will follow
    uint64_t runSerial{0};  ///< RunHandle::serial of the emitting run

    [[nodiscard]] bool isTerminal() const noexcept {
        return kind == OutputEventKind::End ||
               (kind == OutputEventKind::Error && final);
    }

    /**
     * @brief Render in the host transport shape
     *
     * {"id", "type", "message"} for everything but End, which is
     * {"id", "type": "end", "code"} with a null code when killed.
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace scriptdeck::exec

#endif  // SCRIPTDECK_EXEC_TYPES_HPP
